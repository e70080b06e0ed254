#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "analytics/spread_event.hpp"
#include "md/canonical_event.hpp"
#include "md/decimal.hpp"
#include "pipeline/bounded_queue.hpp"

struct SpreadDetectorOptions {
    DecimalValue threshold{"0.005"};                     // relative, strict >
    std::chrono::milliseconds staleness_window{5000};    // receipt-time freshness
    std::chrono::milliseconds debounce_interval{1000};   // receipt-time, per symbol
};

struct VenueQuote {
    Decimal price;
    std::int64_t ts_ms{0};
    std::int64_t received_ms{0};
};

// venue -> latest accepted trade, for one canonical symbol
using VenuePriceState = std::map<std::string, VenueQuote>;

// Receives spread events emitted after subscribe(). Bounded; oldest events
// are discarded when the reader falls behind.
class SpreadSubscription {
public:
    explicit SpreadSubscription(std::size_t capacity) : queue_(capacity) {}

    // Waits up to `timeout`; false when nothing arrived or the detector went away.
    bool next(SpreadEvent& out, std::chrono::milliseconds timeout) { return queue_.pop_for(out, timeout); }

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    friend class SpreadDetector;
    void offer(SpreadEvent ev) {
        dropped_ += queue_.push_evicting(ev, [](const SpreadEvent&) { return true; });
    }
    void close() { queue_.close(); }

    BoundedQueue<SpreadEvent> queue_;
    std::atomic<std::uint64_t> dropped_{0};
};

// Tracks the last trade price per (symbol, venue) and reports spreads.
// on_trade/on_event are called from one thread (the analytics consumer).
class SpreadDetector {
public:
    explicit SpreadDetector(SpreadDetectorOptions opts = {}) : opts_(std::move(opts)) {}
    ~SpreadDetector();

    SpreadDetector(const SpreadDetector&) = delete;
    SpreadDetector& operator=(const SpreadDetector&) = delete;

    // Trades only; every other kind is ignored.
    std::optional<SpreadEvent> on_event(const CanonicalEvent& ev);

    std::optional<SpreadEvent> on_trade(const std::string& venue,
                                        const std::string& symbol,
                                        const Decimal& price,
                                        std::int64_t ts_ms,
                                        std::int64_t received_ms);

    std::shared_ptr<SpreadSubscription> subscribe(std::size_t capacity = 1024);

    // nullptr before the first trade for `symbol`.
    const VenuePriceState* state(const std::string& symbol) const;

    std::uint64_t stale_rejections() const noexcept { return stale_rejections_; }
    std::uint64_t emitted() const noexcept { return emitted_; }
    std::uint64_t debounced() const noexcept { return debounced_; }

    const SpreadDetectorOptions& options() const noexcept { return opts_; }

private:
    void notify(const SpreadEvent& ev);

    SpreadDetectorOptions opts_;
    std::unordered_map<std::string, VenuePriceState> state_;
    std::unordered_map<std::string, std::int64_t> last_emit_ms_; // receipt time

    std::mutex subs_m_;
    std::vector<std::weak_ptr<SpreadSubscription>> subs_;

    std::uint64_t stale_rejections_{0};
    std::uint64_t emitted_{0};
    std::uint64_t debounced_{0};
};
