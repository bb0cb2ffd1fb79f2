// File: tests/unit/FixedPointTests.cpp
// Purpose: Check the Q16.16 reference algorithms against real arithmetic.
// Key invariants: Conversions saturate; division by zero saturates with the
//                 dividend's sign; sqrt of non-positive input is zero.
// Ownership/Lifetime: Pure functions; no shared state.
// Links: src/il/fixed/FixedPoint.hpp

#include "il/fixed/FixedPoint.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace fx = il::fixed;

namespace
{
double real(int32_t v)
{
    return static_cast<double>(v) / fx::kScale;
}

double relErr(double got, double want)
{
    return std::fabs(got - want) / std::fabs(want);
}
} // namespace

TEST(FixedPoint, ToFixedRoundsToNearestUnit)
{
    EXPECT_EQ(fx::toFixed(1.5), 98304);
    EXPECT_EQ(fx::toFixed(-0.5), -32768);
    EXPECT_EQ(fx::toFixed(1.0 / 131072.0), 1); // half a unit rounds away from zero
    EXPECT_EQ(fx::toFixed(0.0), 0);
}

TEST(FixedPoint, ToFixedSaturates)
{
    EXPECT_EQ(fx::toFixed(40000.0), fx::kMaxFixed);
    EXPECT_EQ(fx::toFixed(-40000.0), fx::kMinFixed);
    EXPECT_EQ(fx::toFixed(std::numeric_limits<double>::infinity()), fx::kMaxFixed);
    EXPECT_EQ(fx::toFixed(-std::numeric_limits<double>::infinity()), fx::kMinFixed);
}

TEST(FixedPoint, NaNConvertsToZero)
{
    EXPECT_EQ(fx::toFixed(std::numeric_limits<double>::quiet_NaN()), 0);
}

TEST(FixedPoint, ToFloatInvertsExactValues)
{
    EXPECT_FLOAT_EQ(fx::toFloat(fx::toFixed(2.25)), 2.25f);
    EXPECT_FLOAT_EQ(fx::toFloat(fx::toFixed(-7.125)), -7.125f);
    EXPECT_FLOAT_EQ(fx::toFloat(fx::kOne), 1.0f);
}

TEST(FixedPoint, IntegerConversions)
{
    EXPECT_EQ(fx::fromInt(3), 3 * fx::kOne);
    EXPECT_EQ(fx::fromInt(-2), -2 * fx::kOne);
    EXPECT_EQ(fx::toInt(fx::toFixed(2.75)), 2);
    EXPECT_EQ(fx::toInt(fx::toFixed(-1.5)), -2); // rounds toward negative infinity
    EXPECT_EQ(fx::toInt(fx::toFixed(-2.0)), -2);
}

TEST(FixedPoint, AddIsWithinOneUnit)
{
    const double pairs[][2] = {{1.5, 2.5}, {0.1, 0.2}, {-3.3, 1.05}, {100.001, -0.0007}};
    for (const auto &p : pairs)
    {
        const int32_t sum = fx::add(fx::toFixed(p[0]), fx::toFixed(p[1]));
        EXPECT_LE(std::fabs(real(sum) - (p[0] + p[1])), 1.0 / fx::kScale + 1e-12) << p[0] << " + " << p[1];
    }
}

TEST(FixedPoint, SubNegAbsMinMax)
{
    const int32_t a = fx::toFixed(2.5);
    const int32_t b = fx::toFixed(-4.0);
    EXPECT_EQ(fx::sub(a, b), fx::toFixed(6.5));
    EXPECT_EQ(fx::neg(a), fx::toFixed(-2.5));
    EXPECT_EQ(fx::abs(b), fx::toFixed(4.0));
    EXPECT_EQ(fx::min(a, b), b);
    EXPECT_EQ(fx::max(a, b), a);
}

TEST(FixedPoint, MulWidensBeforeShifting)
{
    EXPECT_EQ(fx::mul(fx::toFixed(1.5), fx::toFixed(2.0)), fx::toFixed(3.0));
    EXPECT_EQ(fx::mul(fx::toFixed(-0.5), fx::toFixed(0.5)), fx::toFixed(-0.25));
    // 200 * 200 does not fit; the product wraps rather than saturating.
    EXPECT_EQ(fx::mul(fx::toFixed(200.0), fx::toFixed(200.0)), static_cast<int32_t>(40000u << 16));
}

TEST(FixedPoint, DivAccuracy)
{
    const double pairs[][2] = {{1, 3}, {10, 7}, {-5, 0.25}, {100, 0.02}, {0.5, -8}, {7.5, 2.5}, {1, 0.011}, {3, -0.5}};
    for (const auto &p : pairs)
    {
        const double got = real(fx::div(fx::toFixed(p[0]), fx::toFixed(p[1])));
        EXPECT_LT(relErr(got, p[0] / p[1]), 0.001) << p[0] << " / " << p[1];
    }
}

TEST(FixedPoint, DivNearSaturationStaysWithinThreePercent)
{
    const double got = real(fx::div(fx::kMaxFixed, fx::toFixed(1000.0)));
    EXPECT_LT(relErr(got, fx::kMaxRepresentable / 1000.0), 0.03);
}

TEST(FixedPoint, DivByZeroSaturates)
{
    EXPECT_EQ(fx::div(fx::toFixed(5.0), 0), fx::kMaxFixed);
    EXPECT_EQ(fx::div(fx::toFixed(-5.0), 0), fx::kMinFixed);
    EXPECT_EQ(fx::div(0, 0), 0);
}

TEST(FixedPoint, ReciprocalScale)
{
    EXPECT_EQ(fx::reciprocal(static_cast<uint32_t>(fx::kOne)), 1u << 15);
    EXPECT_EQ(fx::reciprocal(1u), fx::kReciprocalNumerator);
}

TEST(FixedPoint, SqrtAccuracy)
{
    for (double v : {0.25, 1.0, 2.0, 4.0, 9.0, 16.0, 25.0, 100.0, 1000.0})
    {
        const double got = real(fx::sqrt(fx::toFixed(v)));
        EXPECT_LT(relErr(got, std::sqrt(v)), 0.02) << "sqrt(" << v << ")";
    }
    EXPECT_EQ(fx::sqrt(fx::toFixed(4.0)), fx::toFixed(2.0));
}

TEST(FixedPoint, SqrtDegradesForLargeInputs)
{
    const double got = real(fx::sqrt(fx::toFixed(10000.0)));
    EXPECT_LT(relErr(got, 100.0), 0.60);
}

TEST(FixedPoint, SqrtOfNonPositiveIsZero)
{
    EXPECT_EQ(fx::sqrt(0), 0);
    EXPECT_EQ(fx::sqrt(fx::toFixed(-4.0)), 0);
    EXPECT_EQ(fx::sqrt(fx::kMinFixed), 0);
}

TEST(FixedPoint, FormatSupport)
{
    EXPECT_TRUE(fx::isSupported(fx::FixedPointFormat::Fixed16x16));
    EXPECT_FALSE(fx::isSupported(fx::FixedPointFormat::Fixed32x32));
    EXPECT_EQ(fx::storageType(fx::FixedPointFormat::Fixed16x16).kind, il::core::Type::Kind::I32);
    EXPECT_STREQ(fx::toString(fx::FixedPointFormat::Fixed16x16), "fixed16x16");
}
