/*
Venue and event-kind tags shared by agents, the canonicalizer and sinks
*/

#pragma once
#include <bitset>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

enum class Venue
{
    Binance,
    Coinbase,
    Deribit,
    Onchain,
};

constexpr std::size_t kVenueCount = 4;

// Declaration order is the wire/body order; do not reorder.
enum class EventKind
{
    Trade,
    L2Diff,
    L2Snapshot,
    BookTicker,
    Ticker24h,
    Ohlcv,
    IndexPrice,
    MarkPrice,
    FundingRate,
    OpenInterest,
    OnchainTransfer,
    OnchainBalance,
    TopDexPool,
    NewsHeadline,
    Telemetry,
    OptionsChain,
    Mempool,
    BridgeFlow,
    MevSignal,
};

constexpr std::size_t kEventKindCount = 19;

const char *venue_name(Venue v) noexcept;
std::optional<Venue> venue_from_name(std::string_view name);

// Wire "type" value, e.g. "l2_diff".
const char *kind_name(EventKind k) noexcept;
std::optional<EventKind> kind_from_name(std::string_view name);

// Best-effort kinds that are shed first under backpressure.
bool is_auxiliary(EventKind k) noexcept;

// Kinds that stay off unless explicitly enabled through the environment.
bool is_gated(EventKind k) noexcept;

// Set of event kinds the pipeline produces.
class FeatureSet
{
public:
    FeatureSet() = default;

    // Trades only.
    static FeatureSet defaults();

    bool enabled(EventKind k) const noexcept { return bits_.test(static_cast<std::size_t>(k)); }
    void enable(EventKind k, bool on = true) { bits_.set(static_cast<std::size_t>(k), on); }
    bool any() const noexcept { return bits_.any(); }

private:
    std::bitset<kEventKindCount> bits_;
};

// Venue-native message: untyped payload plus the tags the agent assigned.
struct RawEvent
{
    Venue venue{Venue::Binance};
    EventKind kind{EventKind::Trade};
    nlohmann::json payload;
    std::int64_t received_ms{0}; // local wall clock at receipt
};

inline std::int64_t wall_clock_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
