/// @file tests/core/test_safe_math.cpp
/// @brief Unit tests for safe division and half-away-from-zero rounding.

#include <gtest/gtest.h>
#include "seqa/safe_math.hpp"
#include "seqa/errors.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>

using namespace seqa;

// ─── safe_divide ─────────────────────────────────────────────────────────────

TEST(SafeDivide, Ordinary) {
    const auto q = safe_divide(6.0, 4.0);
    ASSERT_TRUE(q.has_value());
    EXPECT_DOUBLE_EQ(*q, 1.5);
}

TEST(SafeDivide, ZeroDenominator_Nullopt) {
    EXPECT_FALSE(safe_divide(1.0, 0.0).has_value());
    EXPECT_FALSE(safe_divide(0.0, 0.0).has_value());
}

TEST(SafeDivide, MissingOperand_Nullopt) {
    EXPECT_FALSE(safe_divide(std::nullopt, 2.0).has_value());
    EXPECT_FALSE(safe_divide(2.0, std::nullopt).has_value());
}

TEST(SafeDivide, NonFinite_Nullopt) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(safe_divide(inf, 2.0).has_value());
    EXPECT_FALSE(safe_divide(1.0, std::nan("")).has_value());
    EXPECT_FALSE(safe_divide(1e308, 1e-308).has_value());  // overflow
}

// ─── round_half_away ─────────────────────────────────────────────────────────

TEST(RoundHalfAway, HalfwayAwayFromZero) {
    EXPECT_DOUBLE_EQ(round_half_away(2.5, 0), 3.0);
    EXPECT_DOUBLE_EQ(round_half_away(-2.5, 0), -3.0);
    EXPECT_DOUBLE_EQ(round_half_away(0.125, 2), 0.13);
    EXPECT_DOUBLE_EQ(round_half_away(-0.125, 2), -0.13);
}

TEST(RoundHalfAway, OneDecimal) {
    EXPECT_DOUBLE_EQ(round_half_away(33.333333, 1), 33.3);
    EXPECT_DOUBLE_EQ(round_half_away(66.666666, 1), 66.7);
}

TEST(RoundHalfAway, NegativeDigitsClampedToZero) {
    EXPECT_DOUBLE_EQ(round_half_away(12.6, -3), 13.0);
}

TEST(RoundHalfAway, NonFinitePassesThrough) {
    EXPECT_TRUE(std::isnan(round_half_away(std::nan(""), 1)));
}

// ─── rate_pct / change_pct ───────────────────────────────────────────────────

TEST(RatePct, OneDecimalByDefault) {
    const auto r = rate_pct(1.0, 3.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, 33.3);
}

TEST(RatePct, CustomPrecision) {
    const auto r = rate_pct(2.0, 3.0, 2);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, 66.67);
}

TEST(RatePct, ZeroDenominator_Nullopt) {
    EXPECT_FALSE(rate_pct(5.0, 0.0).has_value());
}

TEST(ChangePct, Growth) {
    const auto c = change_pct(150.0, 100.0);
    ASSERT_TRUE(c.has_value());
    EXPECT_DOUBLE_EQ(*c, 50.0);
}

TEST(ChangePct, Decline) {
    const auto c = change_pct(75.0, 150.0);
    ASSERT_TRUE(c.has_value());
    EXPECT_DOUBLE_EQ(*c, -50.0);
}

TEST(ChangePct, ZeroPrior_Nullopt) {
    EXPECT_FALSE(change_pct(10.0, 0.0).has_value());
}

TEST(ChangePct, MissingSide_Nullopt) {
    EXPECT_FALSE(change_pct(std::nullopt, 10.0).has_value());
    EXPECT_FALSE(change_pct(10.0, std::nullopt).has_value());
}

// ─── ValidationError ─────────────────────────────────────────────────────────

TEST(ValidationError, MessageNamesRecordAndField) {
    const ValidationError e(4, "occurred_at", "missing ordering key");
    EXPECT_EQ(std::string(e.what()), "record 4: field 'occurred_at': missing ordering key");
    ASSERT_TRUE(e.record_index().has_value());
    EXPECT_EQ(*e.record_index(), 4u);
    EXPECT_EQ(e.field(), "occurred_at");
}

TEST(ValidationError, NoIndex) {
    const ValidationError e(std::nullopt, "period", "duplicate");
    EXPECT_EQ(std::string(e.what()), "field 'period': duplicate");
    EXPECT_FALSE(e.record_index().has_value());
}
