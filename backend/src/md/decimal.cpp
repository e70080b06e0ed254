#include "decimal.hpp"

#include <cctype>
#include <cstdlib>
#include <ios>

namespace
{
// Exponents beyond this are not market data.
constexpr long kMaxExponent = 64;

bool is_digit(char c) { return c >= '0' && c <= '9'; }
} // namespace

Decimal::Decimal(std::string text) : text_(std::move(text)), value_(text_) {}

std::optional<Decimal> Decimal::parse(std::string_view s)
{
    std::size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
    {
        negative = s[i] == '-';
        ++i;
    }

    std::string digits; // integer digits followed by fraction digits
    long scale = 0;     // number of fraction digits in `digits`
    bool any_digit = false;

    while (i < s.size() && is_digit(s[i]))
    {
        digits.push_back(s[i++]);
        any_digit = true;
    }
    if (i < s.size() && s[i] == '.')
    {
        ++i;
        while (i < s.size() && is_digit(s[i]))
        {
            digits.push_back(s[i++]);
            ++scale;
            any_digit = true;
        }
    }
    if (!any_digit) return std::nullopt;

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E'))
    {
        ++i;
        bool exp_negative = false;
        if (i < s.size() && (s[i] == '+' || s[i] == '-'))
        {
            exp_negative = s[i] == '-';
            ++i;
        }
        if (i == s.size()) return std::nullopt;
        long exp = 0;
        while (i < s.size() && is_digit(s[i]))
        {
            exp = exp * 10 + (s[i++] - '0');
            if (exp > kMaxExponent) return std::nullopt;
        }
        scale += exp_negative ? exp : -exp;
    }
    if (i != s.size()) return std::nullopt;

    // Negative scale means trailing zeros on the integer part.
    if (scale < 0)
    {
        digits.append(static_cast<std::size_t>(-scale), '0');
        scale = 0;
    }
    // Drop redundant fraction zeros, then redundant leading zeros.
    while (scale > 0 && !digits.empty() && digits.back() == '0')
    {
        digits.pop_back();
        --scale;
    }
    std::size_t lead = 0;
    while (lead < digits.size() && digits[lead] == '0') ++lead;
    digits.erase(0, lead);

    if (digits.empty()) return Decimal(std::string("0"));

    std::string out;
    if (negative) out.push_back('-');
    const auto n = static_cast<long>(digits.size());
    if (scale == 0)
    {
        out += digits;
    }
    else if (n > scale)
    {
        out.append(digits, 0, static_cast<std::size_t>(n - scale));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(n - scale), std::string::npos);
    }
    else
    {
        out += "0.";
        out.append(static_cast<std::size_t>(scale - n), '0');
        out += digits;
    }
    return Decimal(std::move(out));
}

Decimal Decimal::from_value(const DecimalValue &v, unsigned max_fraction_digits)
{
    const std::string text = v.str(static_cast<std::streamsize>(max_fraction_digits), std::ios_base::fixed);
    auto d = parse(text);
    if (!d) return Decimal();
    return *d;
}
