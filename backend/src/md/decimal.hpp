#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_dec_float.hpp>

using DecimalValue = boost::multiprecision::cpp_dec_float_50;

// Exact decimal number taken from venue text.
// Holds the normalized plain-decimal text ("100.00" -> "100", "1e-8" -> "0.00000001")
// alongside a base-10 value for comparison and arithmetic. Never goes through double.
class Decimal
{
public:
    Decimal() = default; // zero

    // Accepts [+-]digits[.digits][(e|E)[+-]digits]. Returns nullopt on anything else.
    static std::optional<Decimal> parse(std::string_view text);

    // Renders `v` with at most `max_fraction_digits` decimals, then normalizes.
    static Decimal from_value(const DecimalValue &v, unsigned max_fraction_digits = 12);

    const std::string &str() const noexcept { return text_; }
    const DecimalValue &value() const noexcept { return value_; }

    bool is_zero() const noexcept { return text_ == "0"; }
    bool is_negative() const noexcept { return !text_.empty() && text_[0] == '-'; }

    friend bool operator==(const Decimal &a, const Decimal &b) { return a.text_ == b.text_; }
    friend bool operator!=(const Decimal &a, const Decimal &b) { return !(a == b); }
    friend bool operator<(const Decimal &a, const Decimal &b) { return a.value_ < b.value_; }
    friend bool operator>(const Decimal &a, const Decimal &b) { return b < a; }

private:
    explicit Decimal(std::string text);

    std::string text_{"0"};
    DecimalValue value_{0};
};
