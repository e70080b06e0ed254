#include <gtest/gtest.h>

#include "fake_agent.hpp"
#include "pipeline/supervisor.hpp"

using namespace std::chrono_literals;

namespace {

SupervisorOptions fast_retry(unsigned max_failures) {
    SupervisorOptions o;
    o.initial_backoff = 1ms;
    o.max_backoff = 4ms;
    o.stability_window = std::chrono::hours(1);
    o.max_consecutive_failures = max_failures;
    return o;
}

AgentStatus status_of(const Supervisor& s, std::size_t i) { return s.status().at(i); }

nlohmann::json trade_payload() {
    return {{"s", "BTCUSDT"}, {"p", "100"}, {"q", "1"}, {"T", "1"}};
}

} // namespace

TEST(Supervisor, BackoffDoublesUpToCap) {
    SupervisorOptions o;
    o.initial_backoff = 1000ms;
    o.max_backoff = 60000ms;
    EXPECT_EQ(Supervisor::backoff_delay(o, 1), 1000ms);
    EXPECT_EQ(Supervisor::backoff_delay(o, 2), 2000ms);
    EXPECT_EQ(Supervisor::backoff_delay(o, 3), 4000ms);
    EXPECT_EQ(Supervisor::backoff_delay(o, 6), 32000ms);
    EXPECT_EQ(Supervisor::backoff_delay(o, 7), 60000ms);
    EXPECT_EQ(Supervisor::backoff_delay(o, 1000), 60000ms);
}

TEST(Supervisor, RequiresHandlerAndFactories) {
    EXPECT_THROW(Supervisor({}, SupervisorOptions{}, nullptr), std::invalid_argument);
    std::vector<AgentSpec> specs;
    specs.push_back(AgentSpec{"empty", nullptr});
    EXPECT_THROW(Supervisor(std::move(specs), SupervisorOptions{}, [](std::size_t, RawEvent&&) {}),
                 std::invalid_argument);
}

TEST(Supervisor, FailingAgentDoesNotAffectOthers) {
    ScriptedAgent::Script bad;
    bad.refuse_connect = true;

    ScriptedAgent::Script good;
    good.batches = {{raw(Venue::Binance, EventKind::Trade, trade_payload(), 1)}};

    std::atomic<int> from_good{0}, from_bad{0};
    Supervisor sup({{"bad", scripted("bad", bad)}, {"good", scripted("good", good)}}, fast_retry(3),
                   [&](std::size_t i, RawEvent&&) { ++(i == 0 ? from_bad : from_good); });
    sup.start();

    ASSERT_TRUE(eventually([&] { return status_of(sup, 0).state == AgentState::Failed; }));
    ASSERT_TRUE(eventually([&] { return from_good.load() == 1; }));

    auto bad_status = status_of(sup, 0);
    EXPECT_EQ(bad_status.consecutive_failures, 4u);
    EXPECT_EQ(bad_status.restarts, 3u);
    EXPECT_EQ(bad_status.last_error, "connection error: connection refused");

    auto good_status = status_of(sup, 1);
    EXPECT_EQ(good_status.state, AgentState::Streaming);
    EXPECT_EQ(good_status.events, 1u);
    EXPECT_EQ(good_status.restarts, 0u);

    sup.stop();
    EXPECT_EQ(status_of(sup, 0).state, AgentState::Failed);
    EXPECT_EQ(status_of(sup, 1).state, AgentState::Stopped);
    EXPECT_EQ(from_bad, 0);
}

TEST(Supervisor, StopInterruptsBackoff) {
    ScriptedAgent::Script bad;
    bad.refuse_connect = true;

    SupervisorOptions o;
    o.initial_backoff = std::chrono::minutes(10);
    o.max_backoff = std::chrono::minutes(10);

    Supervisor sup({{"bad", scripted("bad", bad)}}, o, [](std::size_t, RawEvent&&) {});
    sup.start();
    ASSERT_TRUE(eventually([&] { return status_of(sup, 0).state == AgentState::Disconnected; }));

    const auto t0 = std::chrono::steady_clock::now();
    sup.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    EXPECT_EQ(status_of(sup, 0).state, AgentState::Stopped);
    EXPECT_EQ(status_of(sup, 0).restarts, 1u);

    // idempotent
    sup.stop();
    EXPECT_TRUE(sup.stop_signal().stop_requested());
}

TEST(Supervisor, EverySessionIsClosed) {
    std::atomic<int> closes{0};
    ScriptedAgent::Script flaky;
    flaky.batches = {{raw(Venue::Coinbase, EventKind::Trade, trade_payload(), 1)}};
    flaky.end = ScriptedAgent::End::ConnectionLost;
    flaky.closes = &closes;

    std::atomic<int> events{0};
    Supervisor sup({{"flaky", scripted("flaky", flaky)}}, fast_retry(2),
                   [&](std::size_t, RawEvent&&) { ++events; });
    sup.start();
    ASSERT_TRUE(eventually([&] { return status_of(sup, 0).state == AgentState::Failed; }));
    sup.stop();

    EXPECT_EQ(closes, 3);
    EXPECT_EQ(events, 3);
    EXPECT_EQ(status_of(sup, 0).events, 3u);
    EXPECT_EQ(status_of(sup, 0).last_error, "connection error: connection reset by peer");
}

TEST(Supervisor, ProtocolErrorsAreReported) {
    ScriptedAgent::Script garbled;
    garbled.end = ScriptedAgent::End::BadFrame;

    Supervisor sup({{"garbled", scripted("garbled", garbled)}}, fast_retry(1), [](std::size_t, RawEvent&&) {});
    sup.start();
    ASSERT_TRUE(eventually([&] { return status_of(sup, 0).state == AgentState::Failed; }));
    sup.stop();
    EXPECT_EQ(status_of(sup, 0).last_error, "protocol error: bad frame");
}

TEST(Supervisor, FactoryFailuresAreRetried) {
    std::atomic<int> calls{0};
    AgentFactory broken = [&]() -> std::unique_ptr<IAgent> {
        if (++calls == 1) throw std::runtime_error("no route to host");
        return nullptr;
    };

    Supervisor sup({{"broken", broken}}, fast_retry(1), [](std::size_t, RawEvent&&) {});
    sup.start();
    ASSERT_TRUE(eventually([&] { return status_of(sup, 0).state == AgentState::Failed; }));
    sup.stop();
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(status_of(sup, 0).last_error, "connection error: factory returned no agent");
}

TEST(Supervisor, StableSessionResetsFailures) {
    ScriptedAgent::Script flaky;
    flaky.end = ScriptedAgent::End::ConnectionLost;

    SupervisorOptions o = fast_retry(1);
    o.stability_window = 0ms;

    Supervisor sup({{"flaky", scripted("flaky", flaky)}}, o, [](std::size_t, RawEvent&&) {});
    sup.start();
    ASSERT_TRUE(eventually([&] { return status_of(sup, 0).restarts >= 5; }));
    auto st = status_of(sup, 0);
    EXPECT_NE(st.state, AgentState::Failed);
    EXPECT_EQ(st.consecutive_failures, 1u);
    sup.stop();
    EXPECT_EQ(status_of(sup, 0).state, AgentState::Stopped);
}

TEST(Supervisor, ZeroMaxFailuresRetriesForever) {
    ScriptedAgent::Script bad;
    bad.refuse_connect = true;

    Supervisor sup({{"bad", scripted("bad", bad)}}, fast_retry(0), [](std::size_t, RawEvent&&) {});
    sup.start();
    ASSERT_TRUE(eventually([&] { return status_of(sup, 0).consecutive_failures >= 20; }));
    EXPECT_NE(status_of(sup, 0).state, AgentState::Failed);
    sup.stop();
}

TEST(AgentState, Names) {
    EXPECT_STREQ(to_string(AgentState::Connecting), "connecting");
    EXPECT_STREQ(to_string(AgentState::Streaming), "streaming");
    EXPECT_STREQ(to_string(AgentState::Disconnected), "disconnected");
    EXPECT_STREQ(to_string(AgentState::Failed), "failed");
    EXPECT_STREQ(to_string(AgentState::Stopped), "stopped");
}
