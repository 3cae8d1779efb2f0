/**
 * @file connection_manager.cpp
 * @brief ConnectionManager over the in-memory store.
 */
#include "didagent/connections/connection_manager.hpp"

#include <spdlog/spdlog.h>

#include "didagent/config/constants.hpp"
#include "didagent/config/wallet.hpp"
#include "didagent/crypto/keys.hpp"

namespace didagent::connections {

    using namespace didagent::config::constants;

    stats::Instrumentation& ConnectionManager::instrumentation() {
        static stats::Instrumentation slot{"ConnectionManager"};
        return slot;
    }

    ConnectionManager::ConnectionManager(config::InjectionContext& context)
        : context_(context), store_(context.inject<ConnectionStore>()) {}

    messaging::ConnectionTargetList ConnectionManager::get_connection_targets(const std::string& connection_id) {
        auto timer = instrumentation().time("get_connection_targets");

        const auto record = store_->get(connection_id);
        if (!record) {
            throw ConnectionManagerError("Connection not found: " + connection_id);
        }
        if (!record->is_active()) {
            throw ConnectionManagerError("Connection " + connection_id + " is not active (state: " +
                                         std::string(to_string(record->state)) + ")");
        }

        std::string endpoint = record->their_endpoint;
        std::vector<std::string> routing_keys = record->their_routing_keys;
        if (endpoint.empty() && !record->their_did.empty()) {
            if (auto doc = store_->get_did_document(record->their_did)) {
                endpoint = doc->endpoint;
                routing_keys = doc->routing_keys;
            }
        }
        if (endpoint.empty()) {
            throw ConnectionManagerError("No routing available for connection " + connection_id);
        }

        messaging::ConnectionTarget target;
        target.did = record->their_did;
        target.endpoint = std::move(endpoint);
        target.label = record->their_label.empty() ? record->alias : record->their_label;
        target.recipient_keys = {record->their_verkey};
        target.routing_keys = std::move(routing_keys);
        target.sender_key = record->my_verkey;
        return {std::move(target)};
    }

    ConnectionRecord ConnectionManager::create_static_connection(std::span<const std::uint8_t> my_seed,
                                                                 std::span<const std::uint8_t> their_seed,
                                                                 const std::string& their_endpoint,
                                                                 const std::string& their_role,
                                                                 const std::string& alias) {
        crypto::DidKeyPair mine;
        crypto::DidKeyPair theirs;
        try {
            mine = crypto::derive_did(my_seed);
            theirs = crypto::derive_did(their_seed);
        } catch (const std::invalid_argument& e) {
            throw ConnectionManagerError(std::string("Invalid static connection seed: ") + e.what());
        }

        ConnectionRecord record;
        record.connection_id = crypto::uuid4();
        record.state = ConnectionState::Active;
        record.my_did = mine.did;
        record.my_verkey = mine.verkey;
        record.their_did = theirs.did;
        record.their_verkey = theirs.verkey;
        record.their_endpoint = their_endpoint;
        record.their_role = their_role;
        record.their_label = alias;
        record.alias = alias;

        store_->save(record);
        store_->save_did_document(DidDocument{theirs.did, theirs.verkey, their_endpoint, {}});
        spdlog::debug("Created static connection {} to {}", record.connection_id, their_endpoint);
        return record;
    }

    InvitationResult ConnectionManager::create_invitation(const std::string& their_role,
                                                          const std::string& my_label,
                                                          bool multi_use,
                                                          bool public_invitation) {
        const auto& settings = context_.settings();

        Invitation invitation;
        invitation.id = crypto::uuid4();
        invitation.label = my_label.empty() ? settings.get_string_or(KEY_DEFAULT_LABEL, "") : my_label;

        if (public_invitation) {
            auto public_did = context_.inject<config::PublicDid>(/*required=*/false);
            if (!public_did) {
                throw ConnectionManagerError("Cannot create public invitation with no public DID");
            }
            if (multi_use) {
                spdlog::warn("Public invitations are always multi-use");
            }
            invitation.did = public_did->did;
            return InvitationResult{std::nullopt, std::move(invitation)};
        }

        const auto endpoint = settings.get_string(KEY_DEFAULT_ENDPOINT);
        if (!endpoint || endpoint->empty()) {
            throw ConnectionManagerError("Cannot create invitation: default_endpoint is not configured");
        }

        const auto invitation_keys = crypto::generate_did();
        ConnectionRecord record;
        record.connection_id = crypto::uuid4();
        record.state = ConnectionState::Invitation;
        record.my_verkey = invitation_keys.verkey;
        record.invitation_key = invitation_keys.verkey;
        record.their_role = their_role;
        record.multi_use = multi_use;
        store_->save(record);

        invitation.recipient_keys = {invitation_keys.verkey};
        invitation.endpoint = *endpoint;
        return InvitationResult{std::move(record), std::move(invitation)};
    }

    std::optional<ConnectionRecord>
    ConnectionManager::find_message_connection(const messaging::InboundMessage& message) {
        auto timer = instrumentation().time("find_message_connection");

        const auto& receipt = message.receipt;
        if (receipt.sender_verkey.empty() && receipt.recipient_verkey.empty()) return std::nullopt;

        if (auto r = store_->find_by_verkeys(receipt.sender_verkey, receipt.recipient_verkey)) return r;
        // A request answering one of our invitations is addressed to the invitation key.
        return store_->find_by_invitation_key(receipt.recipient_verkey);
    }

    DidDocument ConnectionManager::fetch_did_document(const std::string& did) {
        auto timer = instrumentation().time("fetch_did_document");

        auto doc = store_->get_did_document(did);
        if (!doc) throw ConnectionManagerError("DID document not found: " + did);
        return *doc;
    }

} // namespace didagent::connections
