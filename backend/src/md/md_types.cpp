#include "md_types.hpp"

#include <array>
#include <cctype>

namespace
{
constexpr std::array<const char *, kVenueCount> kVenueNames = {
    "binance", "coinbase", "deribit", "onchain"};

constexpr std::array<const char *, kEventKindCount> kKindNames = {
    "trade",
    "l2_diff",
    "l2_snapshot",
    "book_ticker",
    "ticker_24h",
    "ohlcv",
    "index_price",
    "mark_price",
    "funding",
    "open_interest",
    "onchain_transfer",
    "onchain_balance",
    "top_dex_pool",
    "news_headline",
    "telemetry",
    "options_chain",
    "mempool",
    "bridge_flow",
    "mev_signal",
};
} // namespace

const char *venue_name(Venue v) noexcept
{
    return kVenueNames[static_cast<std::size_t>(v)];
}

std::optional<Venue> venue_from_name(std::string_view name)
{
    std::string lc(name);
    for (auto &ch : lc) ch = static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    for (std::size_t i = 0; i < kVenueNames.size(); ++i)
        if (lc == kVenueNames[i])
            return static_cast<Venue>(i);
    return std::nullopt;
}

const char *kind_name(EventKind k) noexcept
{
    return kKindNames[static_cast<std::size_t>(k)];
}

std::optional<EventKind> kind_from_name(std::string_view name)
{
    for (std::size_t i = 0; i < kKindNames.size(); ++i)
        if (name == kKindNames[i])
            return static_cast<EventKind>(i);
    return std::nullopt;
}

bool is_auxiliary(EventKind k) noexcept
{
    switch (k)
    {
    case EventKind::Telemetry:
    case EventKind::NewsHeadline:
    case EventKind::TopDexPool:
    case EventKind::Mempool:
    case EventKind::MevSignal:
        return true;
    default:
        return false;
    }
}

bool is_gated(EventKind k) noexcept
{
    switch (k)
    {
    case EventKind::OptionsChain:
    case EventKind::Mempool:
    case EventKind::BridgeFlow:
    case EventKind::MevSignal:
        return true;
    default:
        return false;
    }
}

FeatureSet FeatureSet::defaults()
{
    FeatureSet f;
    f.enable(EventKind::Trade);
    return f;
}
