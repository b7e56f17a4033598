/**
 * Tests for statistics utilities
 */

#include <gtest/gtest.h>
#include "stat_utils.hpp"

#include <cmath>

using namespace genescore;

// ============================================================================
// Descriptive statistics
// ============================================================================

TEST(StatUtils, MeanAndMedian) {
    EXPECT_DOUBLE_EQ(mean({1.0, 2.0, 3.0, 4.0}), 2.5);
    EXPECT_DOUBLE_EQ(median({3.0, 1.0, 2.0}), 2.0);
    EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
    EXPECT_DOUBLE_EQ(mean({}), 0.0);
    EXPECT_DOUBLE_EQ(median({}), 0.0);
}

TEST(StatUtils, PopulationVersusSampleStddev) {
    std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    EXPECT_DOUBLE_EQ(population_stddev(values), 2.0);
    ASSERT_TRUE(sample_stddev(values).has_value());
    EXPECT_NEAR(*sample_stddev(values), std::sqrt(32.0 / 7.0), 1e-12);

    EXPECT_FALSE(sample_stddev({1.0}).has_value());
    EXPECT_DOUBLE_EQ(population_stddev({1.0}), 0.0);
}

TEST(StatUtils, PercentileInterpolates) {
    std::vector<double> values = {1.0, 2.0, 3.0, 4.0};
    EXPECT_NEAR(*percentile_linear(values, 0.10), 1.3, 1e-12);
    EXPECT_NEAR(*percentile_linear(values, 0.50), 2.5, 1e-12);
    EXPECT_DOUBLE_EQ(*percentile_linear(values, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(*percentile_linear(values, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(*percentile_linear({5.0, 1.0, 3.0, 2.0, 4.0}, 0.25), 2.0);
    EXPECT_FALSE(percentile_linear({}, 0.5).has_value());
}

TEST(StatUtils, MedianAbsDeviationScaled) {
    // median 3, deviations {2,1,0,1,97} -> median 1
    std::vector<double> values = {1.0, 2.0, 3.0, 4.0, 100.0};
    EXPECT_NEAR(median_abs_deviation(values), MAD_NORMAL_SCALE, 1e-12);
    EXPECT_NEAR(median_abs_deviation(values, 1.0), 1.0, 1e-12);
}

TEST(StatUtils, MedianAbsDeviationOfConstantIsZero) {
    EXPECT_TRUE(is_close_to_zero(median_abs_deviation({0.4, 0.4, 0.4, 0.4})));
}

TEST(StatUtils, CloseToZero) {
    EXPECT_TRUE(is_close_to_zero(0.0));
    EXPECT_TRUE(is_close_to_zero(5e-9));
    EXPECT_TRUE(is_close_to_zero(-5e-9));
    EXPECT_FALSE(is_close_to_zero(1e-6));
}

// ============================================================================
// Ranks and correlation
// ============================================================================

TEST(StatUtils, AverageRanksWithTies) {
    auto ranks = average_ranks({10.0, 20.0, 20.0, 5.0});
    ASSERT_EQ(ranks.size(), 4u);
    EXPECT_DOUBLE_EQ(ranks[0], 2.0);
    EXPECT_DOUBLE_EQ(ranks[1], 3.5);
    EXPECT_DOUBLE_EQ(ranks[2], 3.5);
    EXPECT_DOUBLE_EQ(ranks[3], 1.0);
}

TEST(StatUtils, SpearmanMonotonic) {
    std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0};
    std::vector<double> y = {1.0, 4.0, 9.0, 16.0, 25.0};
    std::vector<double> reversed = {10.0, 8.0, 6.0, 4.0, 2.0};

    EXPECT_NEAR(*spearman_correlation(x, y), 1.0, 1e-12);
    EXPECT_NEAR(*spearman_correlation(x, reversed), -1.0, 1e-12);
}

TEST(StatUtils, SpearmanKnownValue) {
    // d = {0, 0, 1, -1, 0}: rho = 1 - 6*2 / (5*24) = 0.9
    std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0};
    std::vector<double> y = {1.0, 2.0, 4.0, 3.0, 5.0};
    EXPECT_NEAR(*spearman_correlation(x, y), 0.9, 1e-12);
}

TEST(StatUtils, SpearmanUndefined) {
    EXPECT_FALSE(spearman_correlation({1.0, 2.0, 3.0}, {2.0, 2.0, 2.0}).has_value());
    EXPECT_FALSE(spearman_correlation({1.0}, {1.0}).has_value());
    EXPECT_FALSE(spearman_correlation({1.0, 2.0}, {1.0}).has_value());
}

TEST(StatUtils, CorrelationPValue) {
    // Two degrees of freedom: two-sided p = 1 - |r|
    EXPECT_NEAR(*correlation_p_value(0.8, 4), 0.2, 1e-9);
    EXPECT_NEAR(*correlation_p_value(-0.8, 4), 0.2, 1e-9);
    // t = 1.8257, df = 10
    EXPECT_NEAR(*correlation_p_value(0.5, 12), 0.097855, 1e-5);
    EXPECT_NEAR(*correlation_p_value(0.0, 30), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(*correlation_p_value(1.0, 20), 0.0);
}

TEST(StatUtils, CorrelationPValueUndefined) {
    EXPECT_FALSE(correlation_p_value(0.5, 2).has_value());
    EXPECT_FALSE(correlation_p_value(1.5, 20).has_value());
    EXPECT_FALSE(correlation_p_value(std::nan(""), 20).has_value());
}

TEST(StatUtils, PercentRanks) {
    auto pr = percent_ranks({10.0, 20.0, 20.0, 30.0});
    EXPECT_DOUBLE_EQ(pr[0], 0.0);
    EXPECT_DOUBLE_EQ(pr[1], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(pr[2], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(pr[3], 1.0);

    auto single = percent_ranks({0.7});
    ASSERT_EQ(single.size(), 1u);
    EXPECT_DOUBLE_EQ(single[0], 0.0);
}
