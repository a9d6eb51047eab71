/**
 * @file test_math_utils.cpp
 * @brief Unit tests for per-sample rescaling and numeric helpers
 */

#include <gtest/gtest.h>
#include "MathUtils.h"
#include "AcMapExceptions.h"
#include <cmath>
#include <limits>
#include <random>
#include <vector>

TEST(MathUtilsTest, RescaleMapsExtremesToZeroAndOne) {
    const auto out = MathUtils::rescaleToUnitInterval({0.2, 0.6, 1.0, 0.4});
    ASSERT_EQ(out.size(), 4u);
    EXPECT_DOUBLE_EQ(out[0], 0.0);
    EXPECT_DOUBLE_EQ(out[1], (0.6 - 0.2) / (1.0 - 0.2));
    EXPECT_DOUBLE_EQ(out[2], 1.0);
    EXPECT_DOUBLE_EQ(out[3], (0.4 - 0.2) / (1.0 - 0.2));
}

TEST(MathUtilsTest, RescaleRandomVectorsStayInUnitInterval) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(-1000.0, 1000.0);
    for (int trial = 0; trial < 200; ++trial) {
        std::vector<double> raw(2 + trial % 17);
        for (double& x : raw) x = dist(rng);

        const auto out = MathUtils::rescaleToUnitInterval(raw);
        const auto range = MathUtils::minMax(out);
        ASSERT_TRUE(range.has_value());
        EXPECT_DOUBLE_EQ(range->min, 0.0);
        EXPECT_DOUBLE_EQ(range->max, 1.0);
        for (double v : out) {
            EXPECT_GE(v, 0.0);
            EXPECT_LE(v, 1.0);
        }
    }
}

TEST(MathUtilsTest, RescaleReusesOutputBuffer) {
    std::vector<double> out(10, -1.0);
    MathUtils::rescaleToUnitInterval({3.0, 1.0}, out);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0], 1.0);
    EXPECT_DOUBLE_EQ(out[1], 0.0);
}

TEST(MathUtilsTest, ConstantSampleIsRejected) {
    EXPECT_THROW(MathUtils::rescaleToUnitInterval({0.5, 0.5, 0.5}), AcMap::PreconditionException);
    EXPECT_THROW(MathUtils::rescaleToUnitInterval({7.0}), AcMap::PreconditionException);
}

TEST(MathUtilsTest, EmptyOrNonFiniteSampleIsRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(MathUtils::rescaleToUnitInterval(std::vector<double>{}), AcMap::PreconditionException);
    EXPECT_THROW(MathUtils::rescaleToUnitInterval({0.0, nan, 1.0}), AcMap::PreconditionException);
    EXPECT_THROW(MathUtils::rescaleToUnitInterval({0.0, inf}), AcMap::PreconditionException);
}

TEST(MathUtilsTest, OverflowingRangeIsRejected) {
    const double big = std::numeric_limits<double>::max();
    EXPECT_THROW(MathUtils::rescaleToUnitInterval({-big, big}), AcMap::PreconditionException);
}

TEST(MathUtilsTest, FirstNonFiniteReportsIndex) {
    const std::vector<double> values{1.0, 2.0, std::numeric_limits<double>::infinity(), 0.0};
    const auto idx = MathUtils::firstNonFinite(values.data(), values.size());
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(*idx, 2u);
    EXPECT_FALSE(MathUtils::firstNonFinite(values.data(), 2).has_value());
}

TEST(MathUtilsTest, MinMaxOfEmptyIsNullopt) {
    EXPECT_FALSE(MathUtils::minMax({}).has_value());
    EXPECT_DOUBLE_EQ(MathUtils::sum({0.25, 0.5, 0.25}), 1.0);
}
