/**
 * @file test_sample_provider.cpp
 * @brief Unit tests for the correlated and random training fixtures
 */

#include <gtest/gtest.h>
#include "SampleProvider.h"
#include "AcMapExceptions.h"
#include <string>
#include <vector>

TEST(SampleProviderTest, CorrelatedNeedsSixDimensions) {
    EXPECT_THROW(CorrelatedSampleProvider(5, 10, 1), AcMap::ConfigurationException);
    EXPECT_THROW(CorrelatedSampleProvider(10, 0, 1), AcMap::ConfigurationException);
    EXPECT_NO_THROW(CorrelatedSampleProvider(6, 10, 1));
}

TEST(SampleProviderTest, CorrelatedLabels) {
    const std::vector<std::string> ten{
        "R1", "2xR1", "R1+0.1", "R1^2", "2*R1^2", "3xR1^2", "R2>0.9", "R3>0.9", "R4>0.9", "R5>0.9"};
    EXPECT_EQ(CorrelatedSampleProvider::labelsFor(10), ten);

    const auto twelve = CorrelatedSampleProvider::labelsFor(12);
    ASSERT_EQ(twelve.size(), 12u);
    EXPECT_EQ(twelve[10], "R6");
    EXPECT_EQ(twelve[11], "R7");

    const auto seven = CorrelatedSampleProvider::labelsFor(7);
    ASSERT_EQ(seven.size(), 7u);
    EXPECT_EQ(seven.back(), "R2>0.9");
}

TEST(SampleProviderTest, CorrelatedRowsFollowTheirFormulas) {
    const SampleSet set = CorrelatedSampleProvider(12, 200, 7).provide();
    ASSERT_EQ(set.rows.size(), 200u);
    ASSERT_EQ(set.labels.size(), 12u);

    for (const auto& row : set.rows) {
        ASSERT_EQ(row.size(), 12u);
        const double r1 = row[0];
        EXPECT_GE(r1, 0.0);
        EXPECT_LT(r1, 1.0);
        EXPECT_DOUBLE_EQ(row[1], r1 * 2);
        EXPECT_DOUBLE_EQ(row[2], r1 + 0.1);
        EXPECT_DOUBLE_EQ(row[3], r1 * r1);
        EXPECT_DOUBLE_EQ(row[4], r1 * r1 * 2);
        EXPECT_DOUBLE_EQ(row[5], r1 * r1 * 3);
        for (size_t j = 6; j < 10; ++j) {
            EXPECT_GE(row[j], 0.9);
            EXPECT_LE(row[j], 1.0);
        }
        for (size_t j = 10; j < 12; ++j) {
            EXPECT_GE(row[j], 0.0);
            EXPECT_LT(row[j], 1.0);
        }
    }
}

TEST(SampleProviderTest, SameSeedSameRows) {
    const SampleSet a = CorrelatedSampleProvider(10, 50, 99).provide();
    const SampleSet b = CorrelatedSampleProvider(10, 50, 99).provide();
    const SampleSet c = CorrelatedSampleProvider(10, 50, 100).provide();
    EXPECT_EQ(a.rows, b.rows);
    EXPECT_NE(a.rows, c.rows);
}

TEST(SampleProviderTest, DrawsDependOnlyOnEngineOutput) {
    // Two 32-bit words per draw: (lo + hi * 2^32) / 2^64.
    const SampleSet correlated = CorrelatedSampleProvider(10, 1, 1337).provide();
    EXPECT_DOUBLE_EQ(correlated.rows[0][0], 0.5605297529283038);
    EXPECT_DOUBLE_EQ(correlated.rows[0][6], 0.21258764903961774 * 0.1 + 0.9);

    const SampleSet random = RandomSampleProvider(2, 1, 5).provide();
    EXPECT_DOUBLE_EQ(random.rows[0][0], 0.055180120799223235);
}

TEST(SampleProviderTest, RandomFixture) {
    EXPECT_THROW(RandomSampleProvider(0, 10, 1), AcMap::ConfigurationException);
    EXPECT_THROW(RandomSampleProvider(1, 10, 1), AcMap::ConfigurationException);
    EXPECT_NO_THROW(RandomSampleProvider(2, 10, 1));

    const SampleSet set = RandomSampleProvider(4, 30, 5).provide();
    EXPECT_EQ(set.labels, (std::vector<std::string>{"R0", "R1", "R2", "R3"}));
    ASSERT_EQ(set.rows.size(), 30u);
    for (const auto& row : set.rows) {
        ASSERT_EQ(row.size(), 4u);
        for (double x : row) {
            EXPECT_GE(x, 0.0);
            EXPECT_LT(x, 1.0);
        }
    }
    EXPECT_EQ(set.rows, RandomSampleProvider(4, 30, 5).provide().rows);
}
