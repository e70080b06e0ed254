#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "analytics/spread_detector.hpp"
#include "md/canonicalizer.hpp"
#include "pipeline/dispatcher.hpp"
#include "pipeline/supervisor.hpp"
#include "sinks/sink.hpp"
#include "util/spsc_ring.hpp"

struct PipelineOptions {
    SupervisorOptions supervisor;
    SpreadDetectorOptions analytics;
    ConsumerOptions sinks;                 // applied to every sink
    ConsumerOptions analytics_consumer;    // the spread detector's queue
    std::size_t ingress_capacity{8192};    // per-agent raw event ring
};

struct PipelineStats {
    std::uint64_t raw_events{0};
    std::uint64_t published{0};
    std::uint64_t rejected{0};                                          // by the validator
    std::array<std::uint64_t, kNormalizationErrorCodeCount> errors{};   // by NormalizationErrorCode
    std::uint64_t ingress_waits{0};                                     // agent found its ring full
    std::uint64_t spreads{0};
};

// Wires agents -> canonicalizer -> dispatcher -> {sinks, analytics}.
// Each agent feeds its own SPSC ring; one stage thread drains the rings
// round-robin, canonicalizes, validates and publishes. Spread events from the
// analytics consumer go back to the sinks through the dispatcher.
class Pipeline {
public:
    Pipeline(Canonicalizer canonicalizer,
             std::vector<AgentSpec> agents,
             std::vector<std::shared_ptr<ISink>> sinks,
             PipelineOptions opts);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Set before start().
    void set_validator(Canonicalizer::Validator fn) { canonicalizer_.set_validator(std::move(fn)); }
    void set_rejected_handler(Dispatcher::RejectedHandler fn) { dispatcher_.set_rejected_handler(std::move(fn)); }

    void start();
    // Stops agents, drains what they produced, then stops the dispatcher. Idempotent.
    void stop();

    // Agent-side entry point (agent thread `agent_index` only).
    void ingest(std::size_t agent_index, RawEvent&& ev);

    PipelineStats stats() const;
    std::vector<AgentStatus> agent_status() const { return supervisor_.status(); }
    std::vector<ConsumerStats> consumer_stats() const { return dispatcher_.stats(); }

    // Call before start(); events emitted later are delivered to it.
    std::shared_ptr<SpreadSubscription> subscribe_spreads(std::size_t capacity = 1024) {
        return detector_.subscribe(capacity);
    }

    // One-line summaries of agents, stage counters and consumers.
    std::vector<std::string> status_lines() const;

private:
    void stage_loop();
    // Returns the number of events processed.
    std::size_t drain_once();
    void process(RawEvent& raw);

    Canonicalizer canonicalizer_;
    SpreadDetector detector_;
    Dispatcher dispatcher_;
    std::vector<std::unique_ptr<SpscRing<RawEvent>>> rings_;
    Supervisor supervisor_;

    std::thread stage_;
    std::atomic<bool> running_{false};
    bool started_{false};
    bool stopped_{false};

    std::atomic<std::uint64_t> raw_events_{0};
    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::array<std::atomic<std::uint64_t>, kNormalizationErrorCodeCount> errors_{};
    std::atomic<std::uint64_t> ingress_waits_{0};
    std::atomic<std::uint64_t> spreads_{0};
};
