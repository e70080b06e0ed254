#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "server/config.hpp"

namespace {

EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& key) -> std::optional<std::string> {
        auto it = vars.find(key);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

AppConfig parse_ok(const std::vector<std::string>& args, std::map<std::string, std::string> vars = {}) {
    auto r = parse_config(args, env_of(std::move(vars)));
    if (auto* e = std::get_if<ConfigError>(&r)) {
        ADD_FAILURE() << e->message;
        return {};
    }
    return std::get<AppConfig>(std::move(r));
}

std::string parse_error(const std::vector<std::string>& args, std::map<std::string, std::string> vars = {}) {
    auto r = parse_config(args, env_of(std::move(vars)));
    if (auto* e = std::get_if<ConfigError>(&r)) return e->message;
    return {};
}

} // namespace

TEST(Config, Defaults) {
    auto cfg = parse_ok({"binance:btcusdt"});
    ASSERT_EQ(cfg.feeds.size(), 1u);
    EXPECT_EQ(cfg.feeds[0].venue, Venue::Binance);
    EXPECT_EQ(cfg.feeds[0].venue_symbols, (std::vector<std::string>{"btcusdt"}));
    EXPECT_FALSE(cfg.feeds[0].all);

    EXPECT_TRUE(cfg.features.enabled(EventKind::Trade));
    EXPECT_FALSE(cfg.features.enabled(EventKind::L2Diff));
    EXPECT_FALSE(cfg.features.enabled(EventKind::OptionsChain));

    EXPECT_EQ(cfg.analytics.threshold, DecimalValue("0.005"));
    EXPECT_EQ(cfg.analytics.staleness_window, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.analytics.debounce_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.supervisor.max_consecutive_failures, 10u);
    EXPECT_TRUE(cfg.stdout_sink);
    EXPECT_FALSE(cfg.output_path.has_value());
    EXPECT_FALSE(cfg.binance_quotes.has_value());
    EXPECT_TRUE(cfg.ws_urls.empty());
}

TEST(Config, FeedsAndDefaultUniverse) {
    auto cfg = parse_ok({"binance:all", "coinbase:BTC-USD, ETH-USD", "deribit:all"});
    ASSERT_EQ(cfg.feeds.size(), 3u);
    EXPECT_TRUE(cfg.feeds[0].all);
    EXPECT_EQ(cfg.feeds[0].venue_symbols, (std::vector<std::string>{"btcusdt", "ethusdt", "solusdt"}));
    EXPECT_EQ(cfg.feeds[1].venue, Venue::Coinbase);
    EXPECT_EQ(cfg.feeds[1].venue_symbols, (std::vector<std::string>{"BTC-USD", "ETH-USD"}));
    EXPECT_EQ(cfg.feeds[2].venue_symbols,
              (std::vector<std::string>{"BTC-PERPETUAL", "ETH-PERPETUAL", "SOL_USDC-PERPETUAL"}));
    EXPECT_EQ(cfg.feeds[2].text, "deribit:all");
}

TEST(Config, BadFeeds) {
    EXPECT_NE(parse_error({"kraken:btcusd"}).find("unknown venue"), std::string::npos);
    EXPECT_NE(parse_error({"onchain:all"}).find("no streaming agent"), std::string::npos);
    EXPECT_NE(parse_error({"binance"}).find("must look like"), std::string::npos);
    EXPECT_NE(parse_error({"binance:"}).find("must look like"), std::string::npos);
    EXPECT_NE(parse_error({"binance:,,"}).find("names no symbols"), std::string::npos);
    EXPECT_NE(parse_error({}).find("no feeds"), std::string::npos);
}

TEST(Config, KindFlags) {
    auto cfg = parse_ok({"--no-trades", "--l2-diffs", "--mark-price", "--telemetry", "binance:btcusdt"});
    EXPECT_FALSE(cfg.features.enabled(EventKind::Trade));
    EXPECT_TRUE(cfg.features.enabled(EventKind::L2Diff));
    EXPECT_TRUE(cfg.features.enabled(EventKind::MarkPrice));
    EXPECT_TRUE(cfg.features.enabled(EventKind::Telemetry));
    EXPECT_FALSE(cfg.features.enabled(EventKind::FundingRate));

    EXPECT_NE(parse_error({"--no-trades", "binance:btcusdt"}).find("every event kind is disabled"), std::string::npos);
}

TEST(Config, GatedKindsNeedEnvironment) {
    // no command-line flag turns a gated kind on
    EXPECT_NE(parse_error({"--mempool", "binance:btcusdt"}).find("unknown option"), std::string::npos);

    auto cfg = parse_ok({"deribit:all"}, {{"XFEED_ENABLE_OPTIONS_CHAIN", "true"},
                                          {"XFEED_ENABLE_MEMPOOL", "0"},
                                          {"XFEED_ENABLE_MEV_SIGNALS", "ON"}});
    EXPECT_TRUE(cfg.features.enabled(EventKind::OptionsChain));
    EXPECT_FALSE(cfg.features.enabled(EventKind::Mempool));
    EXPECT_FALSE(cfg.features.enabled(EventKind::BridgeFlow));
    EXPECT_TRUE(cfg.features.enabled(EventKind::MevSignal));
}

TEST(Config, SpreadThreshold) {
    EXPECT_EQ(parse_ok({"--spread-threshold", "0.01", "binance:btcusdt"}).analytics.threshold, DecimalValue("0.01"));
    EXPECT_EQ(parse_ok({"--spread-threshold=5%", "binance:btcusdt"}).analytics.threshold, DecimalValue("0.05"));
    EXPECT_NE(parse_error({"--spread-threshold", "0", "binance:btcusdt"}).find("positive"), std::string::npos);
    EXPECT_NE(parse_error({"--spread-threshold", "-1%", "binance:btcusdt"}).find("positive"), std::string::npos);
    EXPECT_NE(parse_error({"--spread-threshold", "abc", "binance:btcusdt"}).find("positive"), std::string::npos);
    EXPECT_NE(parse_error({"binance:btcusdt", "--spread-threshold"}).find("needs a value"), std::string::npos);
}

TEST(Config, Timings) {
    auto cfg = parse_ok({"--staleness-ms=2000", "--debounce-ms", "0", "--max-failures", "0",
                         "--connect-timeout-ms", "1500", "--stale-after-ms=45000",
                         "--queue-capacity", "128", "--block-timeout-ms", "0", "coinbase:all"});
    EXPECT_EQ(cfg.analytics.staleness_window, std::chrono::milliseconds(2000));
    EXPECT_EQ(cfg.analytics.debounce_interval, std::chrono::milliseconds(0));
    EXPECT_EQ(cfg.supervisor.max_consecutive_failures, 0u);
    EXPECT_EQ(cfg.connect_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(cfg.stale_after, std::chrono::milliseconds(45000));
    EXPECT_EQ(cfg.sink_options.capacity, 128u);
    EXPECT_EQ(cfg.sink_options.block_timeout, std::chrono::milliseconds(0));

    EXPECT_NE(parse_error({"--staleness-ms", "0", "coinbase:all"}).find("must be positive"), std::string::npos);
    EXPECT_NE(parse_error({"--queue-capacity=0", "coinbase:all"}).find("must be positive"), std::string::npos);
    EXPECT_NE(parse_error({"--debounce-ms", "-5", "coinbase:all"}).find("non-negative integer"), std::string::npos);
    EXPECT_NE(parse_error({"--max-failures", "lots", "coinbase:all"}).find("non-negative integer"), std::string::npos);
}

TEST(Config, OutOfRangeNumbersAreRejected) {
    EXPECT_NE(parse_error({"--staleness-ms", "18446744073709551615", "binance:btcusdt"}).find("exceeds"),
              std::string::npos);
    EXPECT_NE(parse_error({"--debounce-ms", "9223372036854775808", "binance:btcusdt"}).find("exceeds"),
              std::string::npos);
    EXPECT_NE(parse_error({"--block-timeout-ms=86400001", "binance:btcusdt"}).find("exceeds 86400000"),
              std::string::npos);
    EXPECT_NE(parse_error({"--max-failures", "4294967296", "binance:btcusdt"}).find("exceeds"), std::string::npos);
    EXPECT_NE(parse_error({"--queue-capacity", "1048577", "binance:btcusdt"}).find("exceeds"), std::string::npos);
    EXPECT_NE(parse_error({"--connect-timeout-ms", "99999999999999999999", "binance:btcusdt"})
                  .find("non-negative integer"),
              std::string::npos);

    auto cfg = parse_ok({"--staleness-ms", "86400000", "--max-failures", "4294967295", "binance:btcusdt"});
    EXPECT_EQ(cfg.analytics.staleness_window, std::chrono::hours(24));
    EXPECT_EQ(cfg.supervisor.max_consecutive_failures, 4294967295u);
}

TEST(Config, Output) {
    auto cfg = parse_ok({"--output", "/tmp/xfeed.jsonl", "--quiet", "coinbase:all"});
    ASSERT_TRUE(cfg.output_path.has_value());
    EXPECT_EQ(*cfg.output_path, "/tmp/xfeed.jsonl");
    EXPECT_FALSE(cfg.stdout_sink);

    EXPECT_NE(parse_error({"--quiet", "coinbase:all"}).find("leaves no sink"), std::string::npos);
    EXPECT_NE(parse_error({"coinbase:all", "--output"}).find("needs a file path"), std::string::npos);
}

TEST(Config, Help) {
    auto cfg = parse_ok({"--help"});
    EXPECT_TRUE(cfg.show_help);
    EXPECT_TRUE(parse_ok({"-h", "not-a-feed"}).show_help);
    EXPECT_NE(usage().find("--spread-threshold"), std::string::npos);
}

TEST(Config, UnknownOption) {
    EXPECT_EQ(parse_error({"--verbose", "binance:btcusdt"}), "unknown option '--verbose'");
}

TEST(Config, BinanceQuotes) {
    auto cfg = parse_ok({"binance:btcusdt"}, {{"XFEED_BINANCE_QUOTES", "USDT, FDUSD,,BTC"}});
    ASSERT_TRUE(cfg.binance_quotes.has_value());
    EXPECT_EQ(*cfg.binance_quotes, (std::vector<std::string>{"USDT", "FDUSD", "BTC"}));

    EXPECT_NE(parse_error({"binance:btcusdt"}, {{"XFEED_BINANCE_QUOTES", " , "}}).find("lists no quote assets"),
              std::string::npos);
}

TEST(Config, EndpointOverrides) {
    auto cfg = parse_ok({"coinbase:all"}, {{"XFEED_COINBASE_WS_URL", "wss://ws-feed-public.sandbox.exchange.coinbase.com"}});
    ASSERT_EQ(cfg.ws_urls.count(Venue::Coinbase), 1u);
    EXPECT_EQ(cfg.ws_urls[Venue::Coinbase], "wss://ws-feed-public.sandbox.exchange.coinbase.com");

    EXPECT_NE(parse_error({"coinbase:all"}, {{"XFEED_DERIBIT_WS_URL", "http://example.com"}}).find("XFEED_DERIBIT_WS_URL"),
              std::string::npos);
}

TEST(Config, Truthy) {
    for (const char* v : {"1", "true", "TRUE", "yes", "On", " on "}) EXPECT_TRUE(is_truthy(v)) << v;
    for (const char* v : {"", "0", "false", "no", "off", "2"}) EXPECT_FALSE(is_truthy(v)) << v;
}

TEST(Config, EnvFileDoesNotOverride) {
    const std::string path = ::testing::TempDir() + "xfeed_test.env";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "XFEED_TEST_FROM_FILE=\"quoted value\"\n"
            << "export XFEED_TEST_EXPORTED=yes\n"
            << "XFEED_TEST_ALREADY_SET=file\n"
            << "not a pair\n";
    }
    ::setenv("XFEED_TEST_ALREADY_SET", "process", 1);
    load_env_file(path);

    EXPECT_EQ(process_env("XFEED_TEST_FROM_FILE"), std::optional<std::string>("quoted value"));
    EXPECT_EQ(process_env("XFEED_TEST_EXPORTED"), std::optional<std::string>("yes"));
    EXPECT_EQ(process_env("XFEED_TEST_ALREADY_SET"), std::optional<std::string>("process"));
    EXPECT_FALSE(process_env("XFEED_TEST_NEVER_SET").has_value());

    // missing file is fine
    load_env_file(::testing::TempDir() + "does-not-exist.env");
}
