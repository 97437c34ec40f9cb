/// @file tests/odds/test_odds_math.cpp
/// @brief Tests for OddsMath conversions.

#include "parlay/odds.hpp"
#include "parlay/constants.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

using namespace parlay;

// ─── americanToDecimal ────────────────────────────────────────────────────────

TEST(OddsMathAmericanToDecimal, PositiveOdds) {
    auto d = OddsMath::americanToDecimal(AmericanOdds{120});
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(d->value, 2.20, 1e-12);
}

TEST(OddsMathAmericanToDecimal, NegativeOdds) {
    auto d = OddsMath::americanToDecimal(AmericanOdds{-110});
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(d->value, 1.0 + 100.0 / 110.0, 1e-12);
}

TEST(OddsMathAmericanToDecimal, EvenMoneyBothNotations) {
    auto plus = OddsMath::americanToDecimal(AmericanOdds{100});
    auto minus = OddsMath::americanToDecimal(AmericanOdds{-100});
    ASSERT_TRUE(plus.has_value());
    ASSERT_TRUE(minus.has_value());
    EXPECT_DOUBLE_EQ(plus->value, 2.0);
    EXPECT_DOUBLE_EQ(minus->value, 2.0);
}

TEST(OddsMathAmericanToDecimal, ZeroIsInvalid) {
    EXPECT_FALSE(OddsMath::americanToDecimal(AmericanOdds{0}).has_value());
    EXPECT_FALSE(OddsMath::isValid(AmericanOdds{0}));
}

TEST(OddsMathAmericanToDecimal, AlwaysAboveOne) {
    for (int a : {-10000, -500, -101, 101, 250, 10000}) {
        auto d = OddsMath::americanToDecimal(AmericanOdds{a});
        ASSERT_TRUE(d.has_value());
        EXPECT_GT(d->value, 1.0) << "odds " << a;
    }
}

TEST(OddsMathAmericanToDecimal, ExtremeFavouriteStaysAboveOne) {
    auto d = OddsMath::americanToDecimal(AmericanOdds{-constants::AMERICAN_ODDS_LIMIT});
    ASSERT_TRUE(d.has_value());
    EXPECT_GT(d->value, 1.0);
    EXPECT_TRUE(OddsMath::decimalToAmerican(*d).has_value());
}

// ─── decimalToAmerican ────────────────────────────────────────────────────────

TEST(OddsMathDecimalToAmerican, AtLeastTwoIsPositive) {
    auto a = OddsMath::decimalToAmerican(DecimalOdds{3.8});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value, 280);

    auto even = OddsMath::decimalToAmerican(DecimalOdds{2.0});
    ASSERT_TRUE(even.has_value());
    EXPECT_EQ(even->value, 100);
}

TEST(OddsMathDecimalToAmerican, BelowTwoIsNegative) {
    auto a = OddsMath::decimalToAmerican(DecimalOdds{1.5});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value, -200);
}

TEST(OddsMathDecimalToAmerican, RoundsToWholeUnits) {
    // 1.909090... → −110
    auto a = OddsMath::decimalToAmerican(DecimalOdds{1.0 + 100.0 / 110.0});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value, -110);
}

TEST(OddsMathDecimalToAmerican, RejectsOneAndBelow) {
    EXPECT_FALSE(OddsMath::decimalToAmerican(DecimalOdds{1.0}).has_value());
    EXPECT_FALSE(OddsMath::decimalToAmerican(DecimalOdds{0.5}).has_value());
    EXPECT_FALSE(OddsMath::decimalToAmerican(DecimalOdds{-3.0}).has_value());
}

TEST(OddsMathDecimalToAmerican, RejectsNonFinite) {
    EXPECT_FALSE(OddsMath::decimalToAmerican(
        DecimalOdds{std::numeric_limits<double>::quiet_NaN()}).has_value());
    EXPECT_FALSE(OddsMath::decimalToAmerican(
        DecimalOdds{std::numeric_limits<double>::infinity()}).has_value());
}

TEST(OddsMathDecimalToAmerican, LongShotBeyondInt32) {
    // Four +6000 legs: 61^4 = 13845841.
    auto a = OddsMath::decimalToAmerican(DecimalOdds{13845841.0});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value, 1384584000);
    EXPECT_GT(a->value, std::numeric_limits<std::int32_t>::max());
}

TEST(OddsMathDecimalToAmerican, SaturatesAtLimit) {
    auto a = OddsMath::decimalToAmerican(DecimalOdds{1e300});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value, constants::AMERICAN_ODDS_LIMIT);

    auto b = OddsMath::decimalToAmerican(DecimalOdds{1e17});
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->value, constants::AMERICAN_ODDS_LIMIT);
}

TEST(OddsMathDecimalToAmerican, RoundTripCommonPrices) {
    for (int a : {-250, -150, -115, -110, -105, 105, 110, 150, 300, 1200}) {
        auto d = OddsMath::americanToDecimal(AmericanOdds{a});
        ASSERT_TRUE(d.has_value());
        auto back = OddsMath::decimalToAmerican(*d);
        ASSERT_TRUE(back.has_value());
        EXPECT_LE(std::abs(back->value - a), 1) << "odds " << a;
    }
}

// ─── impliedProbability ───────────────────────────────────────────────────────

TEST(OddsMathImpliedProbability, Favourite) {
    auto p = OddsMath::impliedProbability(AmericanOdds{-200});
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(*p, 2.0 / 3.0, 1e-12);
}

TEST(OddsMathImpliedProbability, Underdog) {
    auto p = OddsMath::impliedProbability(AmericanOdds{300});
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(*p, 0.25, 1e-12);
}

TEST(OddsMathImpliedProbability, ZeroIsInvalid) {
    EXPECT_FALSE(OddsMath::impliedProbability(AmericanOdds{0}).has_value());
}

// ─── format ───────────────────────────────────────────────────────────────────

TEST(OddsMathFormat, SignAlwaysShown) {
    EXPECT_EQ(OddsMath::format(AmericanOdds{120}), "+120");
    EXPECT_EQ(OddsMath::format(AmericanOdds{-110}), "-110");
    EXPECT_EQ(OddsMath::format(AmericanOdds{0}), "+0");
}
