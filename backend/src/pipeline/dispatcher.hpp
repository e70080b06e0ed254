#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "analytics/spread_event.hpp"
#include "md/canonical_event.hpp"
#include "pipeline/bounded_queue.hpp"
#include "sinks/sink.hpp"

// Backpressure policy when a consumer queue is full
enum class Backpressure {
    BoundedBlock, // wait up to block_timeout, then fail this delivery
    DropOldest    // evict the oldest droppable queued item, then push
};

struct ConsumerOptions {
    std::size_t capacity{4096};
    std::chrono::milliseconds block_timeout{250};
    Backpressure primary{Backpressure::BoundedBlock};   // trades, books, tickers, ...
    Backpressure auxiliary{Backpressure::DropOldest};   // telemetry, news, dex pools, mempool, mev
};

struct ConsumerStats {
    std::string name;
    std::uint64_t delivered{0};
    std::uint64_t failed{0};    // handler returned false or threw
    std::uint64_t timed_out{0}; // bounded-block gave up
    std::uint64_t dropped{0};   // drop-oldest evictions
    std::size_t queued{0};
};

// Fan-out bus from the pipeline stage to sinks and analytics.
// Every consumer owns a bounded FIFO and a worker thread, so a slow or stuck
// consumer only fills its own queue. Consumers are registered before start().
class Dispatcher {
public:
    using EventHandler = std::function<bool(const CanonicalEvent&)>;
    using SpreadHandler = std::function<bool(const SpreadEvent&)>;
    using RejectedHandler = std::function<void(const CanonicalEvent&, const std::string& reason)>;

    Dispatcher() = default;
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Sinks receive canonical events and spread events.
    void add_sink(std::shared_ptr<ISink> sink, ConsumerOptions opts = {});

    // Generic consumer; `on_spread` may be empty to skip spread events.
    void add_consumer(std::string name, EventHandler on_event, SpreadHandler on_spread,
                      ConsumerOptions opts = {});

    // Error-path hook for events a validator rejected. Called on the publishing thread.
    void set_rejected_handler(RejectedHandler fn) { on_rejected_ = std::move(fn); }

    void start();
    // Closes every queue, lets workers drain, joins them. Idempotent.
    void stop();

    void publish(CanonicalEventPtr ev);
    void publish_spread(const SpreadEvent& ev);
    void publish_rejected(const CanonicalEvent& ev, const std::string& reason);

    std::vector<ConsumerStats> stats() const;
    std::uint64_t rejected() const noexcept { return rejected_.load(std::memory_order_relaxed); }

private:
    using Item = std::variant<CanonicalEventPtr, std::shared_ptr<const SpreadEvent>>;

    struct Consumer {
        Consumer(std::string n, EventHandler e, SpreadHandler s, ConsumerOptions o)
            : name(std::move(n)), on_event(std::move(e)), on_spread(std::move(s)), opts(o), queue(o.capacity) {}

        std::string name;
        EventHandler on_event;
        SpreadHandler on_spread;
        ConsumerOptions opts;
        BoundedQueue<Item> queue;
        std::thread worker;

        // Set after a timed-out delivery; cleared once the worker drains to half capacity.
        std::atomic<bool> stalled{false};

        std::atomic<std::uint64_t> delivered{0};
        std::atomic<std::uint64_t> failed{0};
        std::atomic<std::uint64_t> timed_out{0};
        std::atomic<std::uint64_t> dropped{0};
    };

    static bool is_auxiliary_item(const Item& item);

    void deliver(Consumer& c, Item item);
    void consume_loop(Consumer& c);

    std::vector<std::unique_ptr<Consumer>> consumers_;
    RejectedHandler on_rejected_;
    std::atomic<std::uint64_t> rejected_{0};
    std::mutex lifecycle_m_;
    bool started_{false};
    bool stopped_{false};
};
