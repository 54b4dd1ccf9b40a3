#include <gtest/gtest.h>
#include "demurrage/fixed_point.hpp"

#include <cstdint>
#include <limits>

using namespace demurrage;
using namespace demurrage::fixed_point;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static const Amount SCALE_25{"10000000000000000000000000"};   // 10^25
static const Amount RATE_9985{"9985000000000000000000000"};   // 0.9985

/// V · (r/S)^n with a floor after every step (the naive per-period loop).
static Amount iterate_decay(Amount value, const Amount& rate, const Amount& scale, int n) {
    for (int i = 0; i < n; ++i) {
        value = value * rate / scale;
    }
    return value;
}

static Amount abs_diff(const Amount& a, const Amount& b) {
    return a > b ? Amount{a - b} : Amount{b - a};
}

// ─── rpow: reference values ──────────────────────────────────────────────────

TEST(FixedPoint_Rpow, NinetyNinePercentCubed) {
    // 0.99³ = 0.970299 → rounded per step: 98010 then 97030
    auto result = FixedPoint::rpow(99000, 3, 100000);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Amount{97030});
}

TEST(FixedPoint_Rpow, ZeroToTheZero_IsOne) {
    auto result = FixedPoint::rpow(0, 0, SCALE_25);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, SCALE_25);
}

TEST(FixedPoint_Rpow, ZeroToPositivePower_IsZero) {
    for (std::uint64_t n : {1u, 2u, 7u, 1000u}) {
        auto result = FixedPoint::rpow(0, n, SCALE_25);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, Amount{0}) << "n = " << n;
    }
}

TEST(FixedPoint_Rpow, ExponentZero_IsScale) {
    auto result = FixedPoint::rpow(RATE_9985, 0, SCALE_25);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, SCALE_25);
}

TEST(FixedPoint_Rpow, ExponentOne_IsBase) {
    auto result = FixedPoint::rpow(RATE_9985, 1, SCALE_25);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, RATE_9985);
}

TEST(FixedPoint_Rpow, UnitBase_StaysUnit) {
    auto result = FixedPoint::rpow(SCALE_25, 123456789, SCALE_25);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, SCALE_25);
}

TEST(FixedPoint_Rpow, ExactSquare) {
    // 0.5² = 0.25 exactly
    auto result = FixedPoint::rpow(50, 2, 100);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Amount{25});
}

TEST(FixedPoint_Rpow, RoundsHalfUp) {
    // scale 10:  5·5 = 25  → (25 + 5) / 10   = 3  (2.5 rounds up)
    // scale 100: 15·15 = 225 → (225 + 50) / 100 = 2 (2.25 rounds down)
    auto tie = FixedPoint::rpow(5, 2, 10);
    ASSERT_TRUE(tie.has_value());
    EXPECT_EQ(*tie, Amount{3});

    auto below = FixedPoint::rpow(15, 2, 100);
    ASSERT_TRUE(below.has_value());
    EXPECT_EQ(*below, Amount{2});
}

TEST(FixedPoint_Rpow, ZeroScale_Nullopt) {
    EXPECT_FALSE(FixedPoint::rpow(5, 2, 0).has_value());
}

TEST(FixedPoint_Rpow, Overflow_Nullopt) {
    // (2.0)^200 · 10^25 is far beyond 2^256.
    const Amount two = SCALE_25 * 2;
    EXPECT_FALSE(FixedPoint::rpow(two, 200, SCALE_25).has_value());
}

TEST(FixedPoint_Rpow, LargeExponent_StaysLogarithmic) {
    // 0.9985^(10^12) underflows to zero; must finish quickly and not overflow.
    auto result = FixedPoint::rpow(RATE_9985, 1'000'000'000'000ULL, SCALE_25);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Amount{0});
}

// ─── rpow vs per-period iteration ────────────────────────────────────────────

TEST(FixedPoint_Rpow, MatchesIteratedDecay_TwelvePeriods) {
    const Amount balance = Amount{"10000000000000000000000"};  // 10000 · 10^18
    auto factor = FixedPoint::rpow(RATE_9985, 12, SCALE_25);
    ASSERT_TRUE(factor.has_value());
    auto decayed = FixedPoint::mul_div(balance, *factor, SCALE_25);
    ASSERT_TRUE(decayed.has_value());

    const Amount expected = iterate_decay(balance, RATE_9985, SCALE_25, 12);
    EXPECT_LT(abs_diff(*decayed, expected), Amount{100});
}

TEST(FixedPoint_Rpow, MatchesIteratedDecay_HundredTwentyPeriods) {
    const Amount balance = Amount{"10000000000000000000000"};
    auto factor = FixedPoint::rpow(RATE_9985, 120, SCALE_25);
    ASSERT_TRUE(factor.has_value());
    auto decayed = FixedPoint::mul_div(balance, *factor, SCALE_25);
    ASSERT_TRUE(decayed.has_value());

    const Amount expected = iterate_decay(balance, RATE_9985, SCALE_25, 120);
    EXPECT_LT(abs_diff(*decayed, expected), Amount{100});
}

// ─── Checked primitives ──────────────────────────────────────────────────────

TEST(FixedPoint_Checked, AddOverflow_Nullopt) {
    const Amount max = std::numeric_limits<Amount>::max();
    EXPECT_FALSE(FixedPoint::checked_add(max, 1).has_value());
    auto ok = FixedPoint::checked_add(max - 1, 1);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, max);
}

TEST(FixedPoint_Checked, SubUnderflow_Nullopt) {
    EXPECT_FALSE(FixedPoint::checked_sub(1, 2).has_value());
    auto ok = FixedPoint::checked_sub(5, 5);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, Amount{0});
}

TEST(FixedPoint_Checked, MulOverflow_Nullopt) {
    const Amount half_range = Amount{1} << 128;
    EXPECT_FALSE(FixedPoint::checked_mul(half_range, half_range).has_value());
    auto ok = FixedPoint::checked_mul(half_range, half_range - 1);
    ASSERT_TRUE(ok.has_value());
}

TEST(FixedPoint_Checked, MulDiv_UsesWideIntermediate) {
    // max · 2 overflows 256 bits but max · 2 / 4 does not.
    const Amount max = std::numeric_limits<Amount>::max();
    auto result = FixedPoint::mul_div(max, 2, 4);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, max / 2);
}

TEST(FixedPoint_Checked, MulDiv_QuotientTooLarge_Nullopt) {
    const Amount max = std::numeric_limits<Amount>::max();
    EXPECT_FALSE(FixedPoint::mul_div(max, 2, 1).has_value());
}

TEST(FixedPoint_Checked, MulDiv_ZeroDivisor_Nullopt) {
    EXPECT_FALSE(FixedPoint::mul_div(1, 1, 0).has_value());
}

TEST(FixedPoint_Checked, Pow10) {
    auto s = FixedPoint::pow10(25);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(*s, SCALE_25);
    // 2^256 ~ 1.16 * 10^77
    EXPECT_TRUE(FixedPoint::pow10(77).has_value());
    EXPECT_FALSE(FixedPoint::pow10(78).has_value());
}

// ─── Text ────────────────────────────────────────────────────────────────────

TEST(FixedPoint_Text, ParseDigits) {
    auto v = FixedPoint::parse("10000000000000000000000");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, Amount{"10000000000000000000000"});
}

TEST(FixedPoint_Text, ParseScientificSuffix) {
    auto v = FixedPoint::parse("9985e21");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, RATE_9985);
}

TEST(FixedPoint_Text, ParseRejectsGarbage) {
    EXPECT_FALSE(FixedPoint::parse("").has_value());
    EXPECT_FALSE(FixedPoint::parse("12a").has_value());
    EXPECT_FALSE(FixedPoint::parse("-5").has_value());
    EXPECT_FALSE(FixedPoint::parse("1e").has_value());
    EXPECT_FALSE(FixedPoint::parse("e5").has_value());
    EXPECT_FALSE(FixedPoint::parse("1.5").has_value());
}

TEST(FixedPoint_Text, ParseOverflow_Nullopt) {
    EXPECT_FALSE(FixedPoint::parse("1e78").has_value());
    // 2^256 = 115792089237316195423570985008687907853269984665640564039457584007913129639936
    EXPECT_FALSE(FixedPoint::parse(
        "115792089237316195423570985008687907853269984665640564039457584007913129639936").has_value());
    EXPECT_TRUE(FixedPoint::parse(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935").has_value());
}

TEST(FixedPoint_Text, FormatScaled) {
    EXPECT_EQ(FixedPoint::format_scaled(RATE_9985, 25), "0.9985");
    EXPECT_EQ(FixedPoint::format_scaled(SCALE_25, 25), "1");
    EXPECT_EQ(FixedPoint::format_scaled(5, 3), "0.005");
    EXPECT_EQ(FixedPoint::format_scaled(1234500, 2), "12345");
    EXPECT_EQ(FixedPoint::format_scaled(1234567, 2), "12345.67");
    EXPECT_EQ(FixedPoint::format_scaled(0, 4), "0");
    EXPECT_EQ(FixedPoint::format_scaled(42, 0), "42");
}

TEST(FixedPoint_Text, ToString) {
    EXPECT_EQ(FixedPoint::to_string(RATE_9985), "9985000000000000000000000");
}
