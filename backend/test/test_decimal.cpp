#include <gtest/gtest.h>

#include "md/decimal.hpp"

static std::string norm(const char* s) {
    auto d = Decimal::parse(s);
    return d ? d->str() : std::string("<invalid>");
}

TEST(Decimal, DropsRedundantZeros) {
    EXPECT_EQ(norm("100.00"), "100");
    EXPECT_EQ(norm("50.00"), "50");
    EXPECT_EQ(norm("0.50"), "0.5");
    EXPECT_EQ(norm("007.10"), "7.1");
    EXPECT_EQ(norm("0"), "0");
    EXPECT_EQ(norm("-0.000"), "0");
    EXPECT_EQ(norm("+12"), "12");
    EXPECT_EQ(norm(".5"), "0.5");
    EXPECT_EQ(norm("5."), "5");
}

TEST(Decimal, ExpandsExponents) {
    EXPECT_EQ(norm("1e-8"), "0.00000001");
    EXPECT_EQ(norm("1.5E3"), "1500");
    EXPECT_EQ(norm("2.5e+2"), "250");
    EXPECT_EQ(norm("12345e-2"), "123.45");
    EXPECT_EQ(norm("-4.2e-1"), "-0.42");
}

TEST(Decimal, KeepsEveryDigit) {
    EXPECT_EQ(norm("0.00000001"), "0.00000001");
    EXPECT_EQ(norm("43123.123456789012345678"), "43123.123456789012345678");
}

TEST(Decimal, RejectsNonNumbers) {
    for (const char* bad : {"", "abc", "1.2.3", "--1", ".", "1e", "1e999", " 1", "1 ", "0x10", "NaN", "inf"}) {
        EXPECT_FALSE(Decimal::parse(bad).has_value()) << bad;
    }
}

TEST(Decimal, ComparesByValue) {
    auto a = *Decimal::parse("99.5");
    auto b = *Decimal::parse("100");
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b > a);
    EXPECT_EQ(*Decimal::parse("100.0"), b);
    EXPECT_TRUE(Decimal::parse("-1")->is_negative());
    EXPECT_TRUE(Decimal().is_zero());
}

TEST(Decimal, FromValueRendersPlainText) {
    const DecimalValue six_pct = (DecimalValue("106") - DecimalValue("100")) / DecimalValue("100");
    EXPECT_EQ(Decimal::from_value(six_pct).str(), "0.06");
    EXPECT_EQ(Decimal::from_value(DecimalValue("2")).str(), "2");
}
