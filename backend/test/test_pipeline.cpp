#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>

#include "fake_agent.hpp"
#include "pipeline/pipeline.hpp"

using namespace std::chrono_literals;

namespace {

class CapturingSink : public ISink {
public:
    const std::string& name() const override { return name_; }
    bool send(const CanonicalEvent& ev) override { return push(to_json_line(ev), false); }
    bool send(const SpreadEvent& ev) override { return push(to_json_line(ev), true); }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lk(m_);
        return lines_;
    }
    int spreads() const {
        std::lock_guard<std::mutex> lk(m_);
        return spreads_;
    }

private:
    bool push(std::string line, bool spread) {
        std::lock_guard<std::mutex> lk(m_);
        lines_.push_back(std::move(line));
        if (spread) ++spreads_;
        return true;
    }

    std::string name_{"capture"};
    mutable std::mutex m_;
    std::vector<std::string> lines_;
    int spreads_{0};
};

PipelineOptions test_options() {
    PipelineOptions o;
    o.supervisor.initial_backoff = 1ms;
    o.supervisor.max_backoff = 4ms;
    o.analytics.threshold = DecimalValue("0.05");
    o.ingress_capacity = 16;
    return o;
}

nlohmann::json binance_trade(const char* sym, const char* p, const char* q, const char* t) {
    return {{"e", "trade"}, {"s", sym}, {"p", p}, {"q", q}, {"T", t}};
}

bool contains(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

std::uint64_t errors(const PipelineStats& s, NormalizationErrorCode code) {
    return s.errors[static_cast<std::size_t>(code)];
}

} // namespace

TEST(Pipeline, AgentsToSinksWithSpreads) {
    ScriptedAgent::Script binance;
    binance.venue = Venue::Binance;
    binance.batches = {
        {raw(Venue::Binance, EventKind::Trade, binance_trade("BTCUSDT", "100", "1", "10"), 10)},
        {raw(Venue::Binance, EventKind::Trade, {{"s", "BTCUSDT"}, {"q", "1"}, {"T", "12"}}, 12),
         raw(Venue::Binance, EventKind::Trade, binance_trade("XYZ", "1", "1", "13"), 13)},
        {raw(Venue::Binance, EventKind::Trade, binance_trade("ETHUSDT", "2000.10", "0.00000001", "14"), 14),
         raw(Venue::Binance, EventKind::L2Diff, {{"s", "ETHUSDT"}, {"b", nlohmann::json::array()}}, 15)},
    };

    ScriptedAgent::Script coinbase;
    coinbase.venue = Venue::Coinbase;
    coinbase.batches = {
        {raw(Venue::Coinbase, EventKind::Trade,
             {{"type", "match"}, {"product_id", "BTC-USDT"}, {"price", "106"}, {"size", "2"},
              {"side", "buy"}, {"time", "1970-01-01T00:00:00.011Z"}},
             11)},
    };

    auto sink = std::make_shared<CapturingSink>();
    Pipeline p(Canonicalizer(FeatureSet::defaults(), SymbolCodec{}),
               {{"binance", scripted("binance", binance)}, {"coinbase", scripted("coinbase", coinbase)}},
               {sink}, test_options());
    auto spreads = p.subscribe_spreads();
    p.start();

    ASSERT_TRUE(eventually([&] { return sink->spreads() == 1; }));
    p.stop();

    const auto lines = sink->lines();
    EXPECT_EQ(lines.size(), 4u);
    EXPECT_TRUE(contains(lines, R"({"agent":"binance","type":"trade","s":"BTC-USDT","p":"100","q":"1","ts":10})"));
    EXPECT_TRUE(contains(lines, R"({"agent":"coinbase","type":"trade","s":"BTC-USDT","p":"106","q":"2","side":"buy","ts":11})"));
    EXPECT_TRUE(contains(lines, R"({"agent":"binance","type":"trade","s":"ETH-USDT","p":"2000.1","q":"0.00000001","ts":14})"));

    const auto spread_line = std::find_if(lines.begin(), lines.end(), [](const std::string& l) {
        return l.rfind(R"({"type":"spread")", 0) == 0;
    });
    ASSERT_NE(spread_line, lines.end());
    EXPECT_NE(spread_line->find(R"("s":"BTC-USDT","venues":["binance","coinbase"],"buy":"binance","sell":"coinbase","min":"100","max":"106","spread":"0.06")"),
              std::string::npos);

    SpreadEvent got;
    ASSERT_TRUE(spreads->next(got, 100ms));
    EXPECT_EQ(got.spread.str(), "0.06");

    const auto s = p.stats();
    EXPECT_EQ(s.raw_events, 6u);
    EXPECT_EQ(s.published, 3u);
    EXPECT_EQ(s.spreads, 1u);
    EXPECT_EQ(errors(s, NormalizationErrorCode::MissingField), 1u);
    EXPECT_EQ(errors(s, NormalizationErrorCode::UnknownSymbolFormat), 1u);
    EXPECT_EQ(errors(s, NormalizationErrorCode::FeatureDisabled), 1u);

    for (const auto& c : p.consumer_stats()) {
        EXPECT_EQ(c.failed, 0u) << c.name;
        EXPECT_EQ(c.timed_out, 0u) << c.name;
    }
}

TEST(Pipeline, ValidatorRejectsBeforeDispatch) {
    ScriptedAgent::Script binance;
    binance.batches = {{
        raw(Venue::Binance, EventKind::Trade, binance_trade("BTCUSDT", "5000000", "1", "1"), 1),
        raw(Venue::Binance, EventKind::Trade, binance_trade("BTCUSDT", "100", "1", "2"), 2),
    }};

    auto sink = std::make_shared<CapturingSink>();
    Pipeline p(Canonicalizer(FeatureSet::defaults(), SymbolCodec{}),
               {{"binance", scripted("binance", binance)}}, {sink}, test_options());

    std::mutex m;
    std::vector<std::string> rejected;
    p.set_validator([](const CanonicalEvent& ev) -> std::optional<std::string> {
        const auto* t = std::get_if<Trade>(&ev.body);
        if (t && t->price > *Decimal::parse("1000000")) return std::string("price out of band");
        return std::nullopt;
    });
    p.set_rejected_handler([&](const CanonicalEvent& ev, const std::string& reason) {
        std::lock_guard<std::mutex> lk(m);
        rejected.push_back(ev.symbol + " " + reason);
    });
    p.start();

    ASSERT_TRUE(eventually([&] { return p.stats().published + p.stats().rejected == 2; }));
    p.stop();

    EXPECT_EQ(p.stats().rejected, 1u);
    EXPECT_EQ(p.stats().published, 1u);
    EXPECT_EQ(rejected, (std::vector<std::string>{"BTC-USDT price out of band"}));
    EXPECT_EQ(sink->lines(),
              (std::vector<std::string>{R"({"agent":"binance","type":"trade","s":"BTC-USDT","p":"100","q":"1","ts":2})"}));
}

TEST(Pipeline, ChattyAgentIsThrottledNotDropped) {
    ScriptedAgent::Script binance;
    std::vector<RawEvent> burst;
    for (int i = 1; i <= 200; ++i) {
        const auto ts = std::to_string(i);
        burst.push_back(raw(Venue::Binance, EventKind::Trade, binance_trade("BTCUSDT", "100", "1", ts.c_str()), i));
    }
    binance.batches = {burst};

    auto sink = std::make_shared<CapturingSink>();
    Pipeline p(Canonicalizer(FeatureSet::defaults(), SymbolCodec{}),
               {{"binance", scripted("binance", binance)}}, {sink}, test_options());
    p.start();
    ASSERT_TRUE(eventually([&] { return sink->lines().size() == 200; }));
    p.stop();
    EXPECT_EQ(p.stats().published, 200u);
    // trades from one agent keep their order
    EXPECT_EQ(sink->lines().front(), R"({"agent":"binance","type":"trade","s":"BTC-USDT","p":"100","q":"1","ts":1})");
    EXPECT_EQ(sink->lines().back(), R"({"agent":"binance","type":"trade","s":"BTC-USDT","p":"100","q":"1","ts":200})");
}

TEST(Pipeline, StatusLines) {
    ScriptedAgent::Script idle;
    Pipeline p(Canonicalizer(FeatureSet::defaults(), SymbolCodec{}),
               {{"binance", scripted("binance", idle)}}, {std::make_shared<CapturingSink>()}, test_options());
    p.start();
    ASSERT_TRUE(eventually([&] { return p.agent_status().at(0).state == AgentState::Streaming; }));
    p.stop();
    p.stop();

    const auto lines = p.status_lines();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "agent binance stopped events=0 restarts=0 failures=0");
    EXPECT_EQ(lines[1].rfind("stage raw=0 published=0", 0), 0u);
    EXPECT_EQ(lines[2].rfind("consumer capture ", 0), 0u);
    EXPECT_EQ(lines[3].rfind("consumer analytics ", 0), 0u);
}
