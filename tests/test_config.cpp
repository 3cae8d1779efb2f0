/**
 * @file test_config.cpp
 * @brief Settings coercions, the settings loader, the service locator and
 *        the default context builder.
 *
 * Validates:
 *  - Typed getters coerce hand-written values (bool words, numeric strings)
 *  - Loader grammar: comments, lists, quotes, ints, bools, error lines
 *  - Overrides win over file values when merged
 *  - Required injection throws, optional injection returns null
 *  - DefaultContextBuilder binds the connection store and the collector
 *  - wallet_config derives and binds a public DID from a 32-byte seed
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "didagent/config/config_loader.hpp"
#include "didagent/config/constants.hpp"
#include "didagent/config/context_builder.hpp"
#include "didagent/config/injection_context.hpp"
#include "didagent/config/logging.hpp"
#include "didagent/config/settings.hpp"
#include "didagent/config/wallet.hpp"
#include "didagent/connections/connection_store.hpp"
#include "didagent/stats/collector.hpp"

using namespace didagent::config;
using didagent::connections::ConnectionStore;
using didagent::stats::Collector;

// ------------------------------- Settings ----------------------------------

/**
 * @test Settings_Bool_Coercion
 * @brief Booleans written as words or numbers read back as bool.
 */
TEST(Settings, Settings_Bool_Coercion) {
  Settings s{{"a", std::string("yes")}, {"b", std::string("off")}, {"c", std::int64_t{1}}, {"d", true}};

  EXPECT_EQ(s.get_bool("a"), true);
  EXPECT_EQ(s.get_bool("b"), false);
  EXPECT_EQ(s.get_bool("c"), true);
  EXPECT_EQ(s.get_bool("d"), true);
  EXPECT_FALSE(s.get_bool("missing").has_value());
  EXPECT_TRUE(s.get_bool_or("missing", true));
}

/**
 * @test Settings_Int_From_String
 * @brief A port written as a string reads back as an integer; junk does not.
 */
TEST(Settings, Settings_Int_From_String) {
  Settings s{{"admin.port", std::string("8031")}, {"bad", std::string("80x")}};

  EXPECT_EQ(s.get_int("admin.port"), 8031);
  EXPECT_FALSE(s.get_int("bad").has_value());
  EXPECT_EQ(s.get_int_or("bad", 7), 7);
}

/**
 * @test Settings_Truthy
 * @brief Presence-with-value semantics used for feature flags.
 */
TEST(Settings, Settings_Truthy) {
  Settings s{
    {"t", true},
    {"f", false},
    {"s", std::string("http://peer/endpoint")},
    {"empty_list", std::vector<std::string>{}},
    {"zero", std::int64_t{0}},
  };

  EXPECT_TRUE(s.truthy("t"));
  EXPECT_FALSE(s.truthy("f"));
  EXPECT_TRUE(s.truthy("s"));
  EXPECT_FALSE(s.truthy("empty_list"));
  EXPECT_FALSE(s.truthy("zero"));
  EXPECT_FALSE(s.truthy("absent"));
}

/**
 * @test Settings_List_From_Single_String
 * @brief A lone string is read as a one-element list.
 */
TEST(Settings, Settings_List_From_Single_String) {
  Settings s{{"admin.webhook_urls", std::string("http://x/hook")}};

  auto urls = s.get_list("admin.webhook_urls");
  ASSERT_TRUE(urls.has_value());
  ASSERT_EQ(urls->size(), 1u);
  EXPECT_EQ((*urls)[0], "http://x/hook");
}

/**
 * @test Settings_Merge_Overrides
 * @brief merge() replaces existing keys and adds new ones.
 */
TEST(Settings, Settings_Merge_Overrides) {
  Settings base{{"a", std::int64_t{1}}, {"b", std::string("keep")}};
  Settings over{{"a", std::int64_t{2}}, {"c", true}};

  base.merge(over);
  EXPECT_EQ(base.size(), 3u);
  EXPECT_EQ(base.get_int("a"), 2);
  EXPECT_EQ(base.get_string("b"), "keep");
  EXPECT_EQ(base.get_bool("c"), true);
}

// -------------------------------- Loader -----------------------------------

/**
 * @test Loader_Parse_Grammar
 * @brief Comments, quotes, lists, ints and bools.
 */
TEST(Loader, Loader_Parse_Grammar) {
  const char* text =
    "# agent settings\n"
    "\n"
    "admin.enabled = true\n"
    "admin.port = 8031\n"
    "admin.webhook_urls = [http://a/hook, \"http://b/hook\"]\n"
    "default_label = \"Alice Agent\"\n"
    "stop_timeout = 2.5\n";

  auto s = Loader::parse(text, "agent.conf");
  ASSERT_TRUE(s.has_value()) << s.error().describe();

  EXPECT_EQ(s->get_bool("admin.enabled"), true);
  EXPECT_EQ(s->get_int("admin.port"), 8031);
  EXPECT_EQ(s->get_string("default_label"), "Alice Agent");
  EXPECT_DOUBLE_EQ(s->get_double_or("stop_timeout", 0.0), 2.5);

  auto urls = s->get_list("admin.webhook_urls");
  ASSERT_TRUE(urls.has_value());
  ASSERT_EQ(urls->size(), 2u);
  EXPECT_EQ((*urls)[0], "http://a/hook");
  EXPECT_EQ((*urls)[1], "http://b/hook");
}

/**
 * @test Loader_Reports_Line
 * @brief A malformed line is reported with source and 1-based line number.
 */
TEST(Loader, Loader_Reports_Line) {
  auto s = Loader::parse("a = 1\nnot a setting\n", "agent.conf");
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().line, 2u);
  EXPECT_EQ(s.error().source, "agent.conf");
  EXPECT_NE(s.error().describe().find("agent.conf:2"), std::string::npos);
}

/**
 * @test Loader_Unterminated_List
 */
TEST(Loader, Loader_Unterminated_List) {
  auto s = Loader::parse("admin.webhook_urls = [http://a/hook\n");
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().reason, "unterminated list");
}

/**
 * @test Loader_Overrides
 * @brief key=value tokens parse with the file grammar; tokens without '=' fail.
 */
TEST(Loader, Loader_Overrides) {
  auto ok = Loader::from_overrides({"admin.enabled=false", "debug.test_suite_endpoint=http://peer/endpoint"});
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->get_bool("admin.enabled"), false);
  EXPECT_EQ(ok->get_string("debug.test_suite_endpoint"), "http://peer/endpoint");

  auto bad = Loader::from_overrides({"--verbose"});
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().source, "<args>");
}

/**
 * @test Loader_File_Missing
 */
TEST(Loader, Loader_File_Missing) {
  auto s = Loader::load_from_file("/nonexistent/didagent-test.conf");
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().reason, "cannot open file");
}

/**
 * @test Loader_File_Roundtrip
 * @brief Reading a real file gives the same result as parse().
 */
TEST(Loader, Loader_File_Roundtrip) {
  const std::string path = ::testing::TempDir() + "didagent_loader_test.conf";
  {
    std::ofstream f(path);
    f << "default_label = Bob\nadmin.port = \"9000\"\n";
  }
  auto s = Loader::load_from_file(path);
  std::remove(path.c_str());

  ASSERT_TRUE(s.has_value()) << s.error().describe();
  EXPECT_EQ(s->get_string("default_label"), "Bob");
  EXPECT_EQ(s->get_int("admin.port"), 9000);
}

// ---------------------------- Service locator ------------------------------

namespace {
struct Greeter {
  virtual ~Greeter() = default;
  virtual std::string hello() const { return "hello"; }
};
struct LoudGreeter : Greeter {
  std::string hello() const override { return "HELLO"; }
};
} // namespace

/**
 * @test Locator_Required_And_Optional
 * @brief Missing required capability throws; optional returns null.
 */
TEST(ServiceLocator, Locator_Required_And_Optional) {
  InjectionContext ctx{Settings{}};

  EXPECT_THROW((void)ctx.inject<Greeter>(), InjectionError);
  EXPECT_EQ(ctx.inject<Greeter>(/*required=*/false), nullptr);

  ctx.injector().bind_instance<Greeter>(std::make_shared<LoudGreeter>());
  auto g = ctx.inject<Greeter>();
  ASSERT_TRUE(g);
  EXPECT_EQ(g->hello(), "HELLO");
}

/**
 * @test Locator_Rebind_And_Clear
 * @brief Rebinding replaces the instance; clearing removes it.
 */
TEST(ServiceLocator, Locator_Rebind_And_Clear) {
  InjectionContext ctx{Settings{}};
  ctx.injector().bind_instance<Greeter>(std::make_shared<Greeter>());
  ctx.injector().bind_instance<Greeter>(std::make_shared<LoudGreeter>());

  EXPECT_EQ(ctx.inject<Greeter>()->hello(), "HELLO");
  EXPECT_TRUE(ctx.injector().clear_binding<Greeter>());
  EXPECT_FALSE(ctx.injector().clear_binding<Greeter>());
  EXPECT_EQ(ctx.inject<Greeter>(false), nullptr);
}

/**
 * @test Locator_Concurrent_Binds
 * @brief Binds from several threads are all visible afterwards.
 */
TEST(ServiceLocator, Locator_Concurrent_Binds) {
  InjectionContext ctx{Settings{}};

  std::thread a([&] { ctx.injector().bind_instance<Greeter>(std::make_shared<Greeter>()); });
  std::thread b([&] { ctx.injector().bind_instance<ConnectionStore>(std::make_shared<ConnectionStore>()); });
  std::thread c([&] { ctx.injector().bind_instance<Collector>(std::make_shared<Collector>()); });
  a.join();
  b.join();
  c.join();

  EXPECT_TRUE(ctx.inject<Greeter>(false));
  EXPECT_TRUE(ctx.inject<ConnectionStore>(false));
  EXPECT_TRUE(ctx.inject<Collector>(false));
}

// ---------------------------- Context builder ------------------------------

/**
 * @test ContextBuilder_Defaults
 * @brief Store always bound; collector only with collect_stats.
 */
TEST(ContextBuilder, ContextBuilder_Defaults) {
  DefaultContextBuilder plain(Settings{{"default_label", std::string("Alice")}});
  auto ctx = plain.build();
  ASSERT_TRUE(ctx);
  EXPECT_EQ(ctx->settings().get_string("default_label"), "Alice");
  EXPECT_TRUE(ctx->inject<ConnectionStore>(false));
  EXPECT_FALSE(ctx->inject<Collector>(false));

  DefaultContextBuilder stats(Settings{{"collect_stats", true}});
  EXPECT_TRUE(stats.build()->inject<Collector>(false));
}

/**
 * @test ContextBuilder_Customizer_Runs_Last
 * @brief The customizer can replace a default binding.
 */
TEST(ContextBuilder, ContextBuilder_Customizer_Runs_Last) {
  auto mine = std::make_shared<ConnectionStore>();
  DefaultContextBuilder b(Settings{}, [mine](InjectionContext& ctx) {
    ctx.injector().bind_instance<ConnectionStore>(mine);
  });

  EXPECT_EQ(b.build()->inject<ConnectionStore>(), mine);
}

// -------------------------------- Logging ----------------------------------

/**
 * @test Logging_Level_Names
 */
TEST(Logging, Logging_Level_Names) {
  EXPECT_TRUE(configure_logging(Settings{{"log.level", std::string("debug")}}));
  EXPECT_TRUE(configure_logging(Settings{{"log.level", std::string("off")}}));
  EXPECT_FALSE(configure_logging(Settings{{"log.level", std::string("chatty")}}));
  EXPECT_TRUE(configure_logging(Settings{}));
}

// -------------------------------- Wallet -----------------------------------

/**
 * @test Wallet_Seed_Derives_Public_Did
 * @brief A 32-byte seed yields a stable public DID bound in the context.
 */
TEST(Wallet, Wallet_Seed_Derives_Public_Did) {
  const std::string seed(32, 'A');
  InjectionContext a{Settings{{"wallet.seed", seed}}};
  InjectionContext b{Settings{{"wallet.seed", seed}}};

  auto da = wallet_config(a);
  auto db = wallet_config(b);
  ASSERT_TRUE(da.has_value());
  ASSERT_TRUE(db.has_value());
  EXPECT_EQ(*da, *db);
  EXPECT_FALSE(da->did.empty());

  auto bound = a.inject<PublicDid>(false);
  ASSERT_TRUE(bound);
  EXPECT_EQ(*bound, *da);
}

/**
 * @test Wallet_No_Seed_No_Did
 */
TEST(Wallet, Wallet_No_Seed_No_Did) {
  InjectionContext ctx{Settings{}};
  EXPECT_FALSE(wallet_config(ctx).has_value());
  EXPECT_FALSE(ctx.inject<PublicDid>(false));
}

/**
 * @test Wallet_Bad_Seed_Throws
 */
TEST(Wallet, Wallet_Bad_Seed_Throws) {
  InjectionContext ctx{Settings{{"wallet.seed", std::string("short")}}};
  EXPECT_THROW((void)wallet_config(ctx), std::invalid_argument);
}

namespace {
struct RecordingLedger : LedgerProvisioner {
  std::optional<PublicDid> seen;
  int calls{0};
  void configure(InjectionContext&, const std::optional<PublicDid>& did) override {
    ++calls;
    seen = did;
  }
};
} // namespace

/**
 * @test Ledger_Receives_Public_Did
 */
TEST(Wallet, Ledger_Receives_Public_Did) {
  InjectionContext ctx{Settings{}};
  auto ledger = std::make_shared<RecordingLedger>();
  ctx.injector().bind_instance<LedgerProvisioner>(ledger);

  const PublicDid did{"did123", "verkey123"};
  ledger_config(ctx, did);
  EXPECT_EQ(ledger->calls, 1);
  EXPECT_EQ(ledger->seen, did);
}
