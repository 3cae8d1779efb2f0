/**
 * @file test_connections.cpp
 * @brief Key derivation, codecs, the connection store and ConnectionManager.
 *
 * Validates:
 *  - SHA-256 / base58 / base64url / hex against known vectors
 *  - Static connection DIDs are fixed functions of their seeds
 *  - Target resolution: active record, DID-document fallback, error cases
 *  - Invitations: pairwise record + "?c_i=" URL, public needs a public DID
 *  - Message-to-connection lookup by receipt keys
 */

#include <gtest/gtest.h>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "didagent/config/injection_context.hpp"
#include "didagent/config/wallet.hpp"
#include "didagent/connections/connection_manager.hpp"
#include "didagent/connections/connection_store.hpp"
#include "didagent/crypto/keys.hpp"
#include "didagent/stats/collector.hpp"

using namespace didagent;
using connections::ConnectionManager;
using connections::ConnectionManagerError;
using connections::ConnectionRecord;
using connections::ConnectionState;
using connections::ConnectionStore;

namespace {

std::span<const std::uint8_t> bytes_of(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

/// Context with a fresh store; extra settings as given.
std::unique_ptr<config::InjectionContext> make_context(config::Settings s = {}) {
  auto ctx = std::make_unique<config::InjectionContext>(std::move(s));
  ctx->injector().bind_instance<ConnectionStore>(std::make_shared<ConnectionStore>());
  return ctx;
}

} // namespace

// -------------------------------- Crypto -----------------------------------

/**
 * @test Crypto_Known_Vectors
 */
TEST(Crypto, Crypto_Known_Vectors) {
  EXPECT_EQ(crypto::hex_encode(crypto::sha256("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(crypto::base58_encode(bytes_of("hello world")), "StV1DL6CwTryKyV");

  const std::vector<std::uint8_t> zeros{0, 0, 1};
  EXPECT_EQ(crypto::base58_encode(zeros), "112");

  const std::vector<std::uint8_t> fb{0xfb, 0xff};
  EXPECT_EQ(crypto::base64url_encode(fb), "-_8=");
  EXPECT_EQ(crypto::base64url_encode(fb, /*pad=*/false), "-_8");
  EXPECT_EQ(crypto::base64url_decode("-_8="), fb);
  EXPECT_THROW((void)crypto::base64url_decode("a+b"), std::invalid_argument);
}

/**
 * @test Crypto_Test_Suite_Seed_Digests
 * @brief The fixed digest inputs hash to the published values.
 */
TEST(Crypto, Crypto_Test_Suite_Seed_Digests) {
  EXPECT_EQ(crypto::hex_encode(crypto::sha256("aries-protocol-test-subject")),
            "c3f550268feca1a2a957a4cc100a512fac3f8f55cf5ca8db4fe0dbf2f99bc5d5");
  EXPECT_EQ(crypto::hex_encode(crypto::sha256("aries-protocol-test-suite")),
            "6eb1eb3c0366de832dae6a62fd89d33e8120ff2ada80596ace2225c0a63626cd");
}

/**
 * @test Crypto_Derive_Did
 * @brief Derivation is deterministic, seed-sensitive and size-checked.
 */
TEST(Crypto, Crypto_Derive_Did) {
  const auto seed = crypto::sha256("aries-protocol-test-subject");
  const auto a = crypto::derive_did(seed);
  const auto b = crypto::derive_did(seed);
  EXPECT_EQ(a.did, b.did);
  EXPECT_EQ(a.verkey, b.verkey);
  EXPECT_EQ(a.did, "BNpq65S2APy5DFs2wUZTtd");
  EXPECT_EQ(a.verkey, "6f1s56SkzsyLFzXRNKf3XVRQD6pckH1NmRCF1sJtWPtu");

  const auto other = crypto::derive_did(crypto::sha256("aries-protocol-test-suite"));
  EXPECT_NE(other.did, a.did);

  const std::vector<std::uint8_t> short_seed(16, 1);
  EXPECT_THROW((void)crypto::derive_did(short_seed), std::invalid_argument);
}

/**
 * @test Crypto_Uuid4_Format
 */
TEST(Crypto, Crypto_Uuid4_Format) {
  const auto u = crypto::uuid4();
  ASSERT_EQ(u.size(), 36u);
  EXPECT_EQ(u[8], '-');
  EXPECT_EQ(u[14], '4');
  EXPECT_NE(u, crypto::uuid4());
}

// ------------------------------ Static connection ----------------------------

/**
 * @test Static_Connection_Deterministic
 * @brief Same seeds give the same DIDs; the record is active and resolvable.
 */
TEST(ConnectionManager, Static_Connection_Deterministic) {
  auto ctx = make_context();
  ConnectionManager mgr(*ctx);

  const auto my_seed = crypto::sha256("aries-protocol-test-subject");
  const auto their_seed = crypto::sha256("aries-protocol-test-suite");
  const auto conn = mgr.create_static_connection(my_seed, their_seed, "http://peer/endpoint", "tester", "test-suite");

  EXPECT_EQ(conn.my_did, "BNpq65S2APy5DFs2wUZTtd");
  EXPECT_EQ(conn.their_did, "65d5e2uNQqE3TB5y5URAkR");
  EXPECT_EQ(conn.their_verkey, "3maatvRmCDyjd1Vm9R7ZNy1qTEcvkfNdGovaUeJBepjK");
  EXPECT_TRUE(conn.is_active());
  EXPECT_EQ(conn.their_role, "tester");
  EXPECT_EQ(conn.alias, "test-suite");

  const auto targets = mgr.get_connection_targets(conn.connection_id);
  ASSERT_EQ(targets.size(), 1u);
  EXPECT_EQ(targets[0].endpoint, "http://peer/endpoint");
  EXPECT_EQ(targets[0].did, conn.their_did);
  EXPECT_EQ(targets[0].recipient_keys, std::vector<std::string>{conn.their_verkey});
  EXPECT_EQ(targets[0].sender_key, conn.my_verkey);

  const auto doc = mgr.fetch_did_document(conn.their_did);
  EXPECT_EQ(doc.endpoint, "http://peer/endpoint");
}

/**
 * @test Static_Connection_Bad_Seed
 */
TEST(ConnectionManager, Static_Connection_Bad_Seed) {
  auto ctx = make_context();
  ConnectionManager mgr(*ctx);
  const std::vector<std::uint8_t> bad(3, 0);
  const auto good = crypto::sha256("x");

  EXPECT_THROW((void)mgr.create_static_connection(bad, good, "http://p", "r", "a"), ConnectionManagerError);
}

// ------------------------------ Target resolution ----------------------------

/**
 * @test Targets_Errors
 * @brief Unknown, inactive and endpoint-less connections cannot be resolved.
 */
TEST(ConnectionManager, Targets_Errors) {
  auto ctx = make_context();
  auto store = ctx->inject<ConnectionStore>();
  ConnectionManager mgr(*ctx);

  EXPECT_THROW((void)mgr.get_connection_targets("missing"), ConnectionManagerError);

  ConnectionRecord pending;
  pending.connection_id = "c-pending";
  pending.state = ConnectionState::Request;
  pending.their_endpoint = "http://peer";
  store->save(pending);
  EXPECT_THROW((void)mgr.get_connection_targets("c-pending"), ConnectionManagerError);

  ConnectionRecord nowhere;
  nowhere.connection_id = "c-nowhere";
  nowhere.state = ConnectionState::Active;
  nowhere.their_did = "did-unknown";
  store->save(nowhere);
  EXPECT_THROW((void)mgr.get_connection_targets("c-nowhere"), ConnectionManagerError);
}

/**
 * @test Targets_Did_Document_Fallback
 * @brief Without a recorded endpoint, the peer's DID document supplies routing.
 */
TEST(ConnectionManager, Targets_Did_Document_Fallback) {
  auto ctx = make_context();
  auto store = ctx->inject<ConnectionStore>();
  store->save_did_document({"did-peer", "vk-peer", "ws://relay/peer", {"rk1"}});

  ConnectionRecord r;
  r.connection_id = "c1";
  r.state = ConnectionState::Active;
  r.their_did = "did-peer";
  r.their_verkey = "vk-peer";
  store->save(r);

  ConnectionManager mgr(*ctx);
  const auto targets = mgr.get_connection_targets("c1");
  ASSERT_EQ(targets.size(), 1u);
  EXPECT_EQ(targets[0].endpoint, "ws://relay/peer");
  EXPECT_EQ(targets[0].routing_keys, std::vector<std::string>{"rk1"});
}

/**
 * @test Targets_Instrumented_Class_Wide
 * @brief One class-level slot observes every manager instance.
 */
TEST(ConnectionManager, Targets_Instrumented_Class_Wide) {
  auto collector = std::make_shared<stats::Collector>();
  collector->wrap(ConnectionManager::instrumentation(), {"get_connection_targets"});

  auto ctx = make_context();
  ConnectionManager a(*ctx);
  ConnectionManager b(*ctx);
  EXPECT_THROW((void)a.get_connection_targets("x"), ConnectionManagerError);
  EXPECT_THROW((void)b.get_connection_targets("y"), ConnectionManagerError);

  EXPECT_EQ(collector->stats_for("ConnectionManager.get_connection_targets").count, 2u);
  ConnectionManager::instrumentation().detach();
}

// -------------------------------- Invitations --------------------------------

/**
 * @test Invitation_Pairwise
 * @brief A fresh key is issued, the record is stored and the URL decodes.
 */
TEST(ConnectionManager, Invitation_Pairwise) {
  auto ctx = make_context(config::Settings{{"default_endpoint", std::string("http://agent:8020")},
                                           {"default_label", std::string("Alice")}});
  auto store = ctx->inject<ConnectionStore>();
  ConnectionManager mgr(*ctx);

  const auto result = mgr.create_invitation("holder", "", /*multi_use=*/true, /*public=*/false);
  ASSERT_TRUE(result.connection.has_value());
  EXPECT_EQ(result.connection->state, ConnectionState::Invitation);
  EXPECT_TRUE(result.connection->multi_use);
  EXPECT_EQ(result.invitation.label, "Alice");
  EXPECT_EQ(result.invitation.endpoint, "http://agent:8020");
  ASSERT_EQ(result.invitation.recipient_keys.size(), 1u);
  EXPECT_EQ(store->size(), 1u);

  const auto url = result.invitation.to_url("https://example.org/invite");
  const std::string prefix = "https://example.org/invite?c_i=";
  ASSERT_EQ(url.rfind(prefix, 0), 0u);
  const auto json_bytes = crypto::base64url_decode(url.substr(prefix.size()));
  const std::string json(json_bytes.begin(), json_bytes.end());
  EXPECT_NE(json.find("\"label\": \"Alice\""), std::string::npos);
  EXPECT_NE(json.find("connections/1.0/invitation"), std::string::npos);
  EXPECT_NE(json.find(result.invitation.recipient_keys[0]), std::string::npos);

  // Invitee answering to the invitation key finds the record.
  messaging::InboundMessage m;
  m.receipt.recipient_verkey = result.invitation.recipient_keys[0];
  m.receipt.sender_verkey = "someone";
  const auto found = mgr.find_message_connection(m);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->connection_id, result.connection->connection_id);
}

/**
 * @test Invitation_Url_Defaults_To_Endpoint
 */
TEST(ConnectionManager, Invitation_Url_Defaults_To_Endpoint) {
  auto ctx = make_context(config::Settings{{"default_endpoint", std::string("http://agent:8020")}});
  ConnectionManager mgr(*ctx);
  const auto result = mgr.create_invitation("", "Bob", false, false);

  EXPECT_EQ(result.invitation.to_url().rfind("http://agent:8020?c_i=", 0), 0u);
}

/**
 * @test Invitation_Needs_Endpoint
 */
TEST(ConnectionManager, Invitation_Needs_Endpoint) {
  auto ctx = make_context();
  ConnectionManager mgr(*ctx);
  EXPECT_THROW((void)mgr.create_invitation("", "", false, false), ConnectionManagerError);
}

/**
 * @test Invitation_Public
 * @brief Public invitations carry the public DID and keep no record.
 */
TEST(ConnectionManager, Invitation_Public) {
  auto ctx = make_context();
  ConnectionManager mgr(*ctx);
  EXPECT_THROW((void)mgr.create_invitation("", "", false, true), ConnectionManagerError);

  ctx->injector().bind_instance<config::PublicDid>(std::make_shared<config::PublicDid>(config::PublicDid{"did:pub", "vk"}));
  const auto result = mgr.create_invitation("", "Alice", false, true);
  EXPECT_FALSE(result.connection.has_value());
  EXPECT_EQ(result.invitation.did, "did:pub");
  EXPECT_EQ(ctx->inject<ConnectionStore>()->size(), 0u);
}

/**
 * @test Find_Message_Connection_By_Keys
 */
TEST(ConnectionManager, Find_Message_Connection_By_Keys) {
  auto ctx = make_context();
  ConnectionManager mgr(*ctx);
  const auto conn = mgr.create_static_connection(crypto::sha256("me"), crypto::sha256("them"),
                                                 "http://peer", "peer", "p");

  messaging::InboundMessage m;
  m.receipt.sender_verkey = conn.their_verkey;
  m.receipt.recipient_verkey = conn.my_verkey;
  const auto found = mgr.find_message_connection(m);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->connection_id, conn.connection_id);

  messaging::InboundMessage anon;
  EXPECT_FALSE(mgr.find_message_connection(anon).has_value());
  EXPECT_THROW((void)mgr.fetch_did_document("did-none"), ConnectionManagerError);
}
