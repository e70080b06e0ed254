/*
Canonical event schema: one header plus a closed set of kind-specific bodies
*/

#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "decimal.hpp"
#include "md_types.hpp"

struct PriceLevel
{
    Decimal price;
    Decimal qty;
};

struct Trade
{
    Decimal price;
    Decimal qty;
    std::optional<std::int64_t> trade_id;
    std::string side; // "buy" / "sell" when the venue reports it
};

struct L2Diff
{
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    std::optional<std::int64_t> update_id;
};

struct L2Snapshot
{
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    std::optional<std::int64_t> update_id;
};

struct BookTicker
{
    Decimal bid_price, bid_qty;
    Decimal ask_price, ask_qty;
};

struct Ticker24h
{
    Decimal open, high, low, close, volume;
};

struct Ohlcv
{
    std::string interval; // "1m"
    Decimal open, high, low, close, volume;
    std::optional<bool> closed;
};

struct IndexPrice
{
    Decimal price;
};

struct MarkPrice
{
    Decimal price;
};

struct FundingRate
{
    Decimal rate;
    std::optional<std::int64_t> next_funding_ms;
};

struct OpenInterest
{
    Decimal open_interest;
};

struct OnchainTransfer
{
    std::string hash, from, to;
    Decimal amount;
    std::string chain;
};

struct OnchainBalance
{
    std::string address;
    Decimal balance;
    std::string chain;
};

struct TopDexPool
{
    std::string pool;
    Decimal liquidity, volume;
    std::string dex;
};

struct NewsHeadline
{
    std::string headline, source, url;
};

struct Telemetry
{
    std::string name;
    Decimal value;
};

struct OptionsChain
{
    Decimal strike;
    std::string expiry;
    std::string option_type; // "call" / "put" as sent by the source
    Decimal price, qty;
};

struct Mempool
{
    std::string hash;
    Decimal value;
};

struct BridgeFlow
{
    Decimal amount;
    std::string from_chain, to_chain;
};

struct MevSignal
{
    std::string strategy;
    Decimal profit;
};

// Alternative index == static_cast<std::size_t>(EventKind).
using CanonicalBody = std::variant<Trade, L2Diff, L2Snapshot, BookTicker, Ticker24h, Ohlcv,
                                   IndexPrice, MarkPrice, FundingRate, OpenInterest,
                                   OnchainTransfer, OnchainBalance, TopDexPool, NewsHeadline,
                                   Telemetry, OptionsChain, Mempool, BridgeFlow, MevSignal>;

static_assert(std::variant_size_v<CanonicalBody> == kEventKindCount,
              "CanonicalBody must have one alternative per EventKind");

struct CanonicalEvent
{
    Venue venue{Venue::Binance};
    std::string symbol;        // canonical "BASE-QUOTE"
    std::int64_t ts_ms{0};       // venue event time, receipt time when the venue sends none
    std::int64_t received_ms{0}; // local wall clock at receipt
    CanonicalBody body;

    EventKind kind() const noexcept { return static_cast<EventKind>(body.index()); }
};

using CanonicalEventPtr = std::shared_ptr<const CanonicalEvent>;

// One JSON object, no trailing newline:
// {"agent":"binance","type":"trade","s":"BTC-USDT","t":1,"p":"100","q":"0.5","ts":1700000000000}
std::string to_json_line(const CanonicalEvent &ev);
