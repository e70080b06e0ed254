#include "symbol_codec.hpp"

#include <algorithm>
#include <cctype>

namespace
{
std::string upper_alnum_and_separators(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s)
    {
        const auto uc = static_cast<unsigned char>(ch);
        if (std::isalnum(uc))
            out.push_back(static_cast<char>(std::toupper(uc)));
        else if (ch == '-' || ch == '_' || ch == '/')
            out.push_back(ch);
        // everything else is venue punctuation (spaces, ':', '.') and is dropped
    }
    return out;
}

std::string lower(std::string s)
{
    for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

std::optional<std::string> join_pair(std::string_view base, std::string_view quote)
{
    std::string c;
    c.reserve(base.size() + quote.size() + 1);
    c.append(base);
    c.push_back('-');
    c.append(quote);
    if (!SymbolCodec::is_canonical(c)) return std::nullopt;
    return c;
}

// Splits at the first separator; both halves must be separator-free.
std::optional<std::string> split_at_separator(const std::string &s)
{
    const auto pos = s.find_first_of("-_/");
    if (pos == std::string::npos) return std::nullopt;
    return join_pair(std::string_view(s).substr(0, pos), std::string_view(s).substr(pos + 1));
}

void sort_longest_first(std::vector<std::string> &quotes)
{
    std::stable_sort(quotes.begin(), quotes.end(),
                     [](const std::string &a, const std::string &b) { return a.size() > b.size(); });
}
} // namespace

SymbolCodec::SymbolCodec()
{
    set_quotes(Venue::Binance, {"USDT", "USDC", "BUSD", "FDUSD", "TUSD", "USD", "BTC", "ETH", "BNB", "EUR", "TRY"});
    set_quotes(Venue::Coinbase, {"USDT", "USDC", "USD", "EUR", "GBP", "BTC", "ETH"});
    set_quotes(Venue::Deribit, {"USDC", "USD"});
    set_quotes(Venue::Onchain, {"USDT", "USDC", "USD", "WETH", "ETH", "BTC"});
}

void SymbolCodec::set_quotes(Venue venue, std::vector<std::string> quotes)
{
    for (auto &q : quotes)
        for (auto &ch : q) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    quotes.erase(std::remove(quotes.begin(), quotes.end(), std::string()), quotes.end());
    sort_longest_first(quotes);
    quotes_[static_cast<std::size_t>(venue)] = std::move(quotes);
}

const std::vector<std::string> &SymbolCodec::quotes(Venue venue) const
{
    return quotes_[static_cast<std::size_t>(venue)];
}

std::optional<std::string> SymbolCodec::split_by_suffix(Venue venue, const std::string &upper) const
{
    for (const auto &q : quotes(venue))
    {
        if (upper.size() > q.size() && upper.compare(upper.size() - q.size(), q.size(), q) == 0)
            return join_pair(std::string_view(upper).substr(0, upper.size() - q.size()), q);
    }
    return std::nullopt;
}

std::optional<std::string> SymbolCodec::to_canonical(Venue venue, std::string_view v) const
{
    const std::string s = upper_alnum_and_separators(v);
    if (s.empty()) return std::nullopt;

    if (venue == Venue::Deribit)
    {
        // "BTC-PERPETUAL", "SOL_USDC-PERPETUAL" and index names ("btc_usd").
        // Dated futures and options price a different instrument.
        const auto dash = s.find('-');
        if (dash == std::string::npos)
            return s.find('_') != std::string::npos ? split_at_separator(s) : split_by_suffix(venue, s);
        if (s.compare(dash + 1, std::string::npos, "PERPETUAL") != 0) return std::nullopt;
        return deribit_head(s.substr(0, dash));
    }

    if (s.find_first_of("-_/") != std::string::npos) return split_at_separator(s);
    return split_by_suffix(venue, s);
}

std::optional<std::string> SymbolCodec::underlying(Venue venue, std::string_view v) const
{
    if (venue != Venue::Deribit) return to_canonical(venue, v);

    // "ETH-27DEC24-3000-C", "SOL_USDC-27DEC24-200-P", "BTC-27DEC24"
    const std::string s = upper_alnum_and_separators(v);
    const auto dash = s.find('-');
    if (dash == std::string::npos) return to_canonical(venue, s);
    return deribit_head(s.substr(0, dash));
}

// Instrument prefix: "SOL_USDC" is linear, a bare coin is inverse against USD.
std::optional<std::string> SymbolCodec::deribit_head(const std::string &head)
{
    if (head.find('_') != std::string::npos) return split_at_separator(head);
    return join_pair(head, "USD");
}

std::string SymbolCodec::to_venue(Venue venue, const std::string &c)
{
    const auto dash = c.find('-');
    const std::string base = c.substr(0, dash);
    const std::string quote = dash == std::string::npos ? std::string() : c.substr(dash + 1);

    switch (venue)
    {
    case Venue::Binance:
        return lower(base + quote);
    case Venue::Deribit:
        if (quote == "USD" || quote.empty()) return base + "-PERPETUAL";
        return base + "_" + quote + "-PERPETUAL";
    case Venue::Coinbase:
    case Venue::Onchain:
        break;
    }
    return c;
}

bool SymbolCodec::is_canonical(std::string_view s) noexcept
{
    const auto dash = s.find('-');
    if (dash == std::string_view::npos || dash == 0 || dash + 1 == s.size()) return false;
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (i == dash) continue;
        const char ch = s[i];
        if (!((ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9'))) return false;
    }
    return true;
}
