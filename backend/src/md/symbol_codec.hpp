#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "md_types.hpp"

// Maps venue symbols to canonical "BASE-QUOTE" and back.
// Instances carry the per-venue quote-suffix tables used when a venue symbol
// has no separator ("BTCUSDT"). Tables are fixed after startup.
class SymbolCodec
{
public:
    SymbolCodec();

    // Replace the quote-suffix table for one venue. Matching is longest first.
    void set_quotes(Venue venue, std::vector<std::string> quotes);
    const std::vector<std::string> &quotes(Venue venue) const;

    // Convert venue format ("btcusdt", "BTC-PERPETUAL") to canonical ("BTC-USDT", "BTC-USD").
    // Returns nullopt when the symbol cannot be split into a valid pair, and
    // for deribit dated futures and options.
    std::optional<std::string> to_canonical(Venue venue, std::string_view venue_sym) const;

    // Underlying pair of a derivative instrument ("ETH-27DEC24-3000-C" -> "ETH-USD").
    // Same as to_canonical for venues without dated instruments.
    std::optional<std::string> underlying(Venue venue, std::string_view venue_sym) const;

    // Convert canonical ("BTC-USDT") to venue format ("btcusdt").
    static std::string to_venue(Venue venue, const std::string &canonical);

    // ^[A-Z0-9]+-[A-Z0-9]+$
    static bool is_canonical(std::string_view s) noexcept;

private:
    std::optional<std::string> split_by_suffix(Venue venue, const std::string &upper) const;
    static std::optional<std::string> deribit_head(const std::string &head);

    std::array<std::vector<std::string>, kVenueCount> quotes_;
};
