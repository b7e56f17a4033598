/**
 * Statistics Utilities
 *
 * Descriptive statistics, robust spread and rank correlation used by the
 * QC analyzer, control validator and sensitivity analyzer.
 * All functions take plain value vectors; callers filter absent scores.
 */

#ifndef STAT_UTILS_HPP
#define STAT_UTILS_HPP

#include <cstddef>
#include <vector>
#include <optional>

namespace genescore {

/**
 * Scale factor making MAD consistent with the standard deviation of a
 * normal distribution (1 / Phi^-1(0.75))
 */
constexpr double MAD_NORMAL_SCALE = 1.482602218505602;

/**
 * Values whose magnitude is at most this are treated as zero spread
 */
constexpr double ZERO_TOLERANCE = 1e-8;

inline bool is_close_to_zero(double value) {
    return value <= ZERO_TOLERANCE && value >= -ZERO_TOLERANCE;
}

// Return 0.0 for empty input
double mean(const std::vector<double>& values);
double median(std::vector<double> values);

/**
 * Standard deviation with divisor n
 */
double population_stddev(const std::vector<double>& values);

/**
 * Standard deviation with divisor n-1 (nullopt for fewer than 2 values)
 */
std::optional<double> sample_stddev(const std::vector<double>& values);

/**
 * Percentile with linear interpolation between closest ranks
 * @param q Quantile in [0,1]
 * @return nullopt for empty input
 */
std::optional<double> percentile_linear(std::vector<double> values, double q);

/**
 * Median absolute deviation, multiplied by scale
 */
double median_abs_deviation(const std::vector<double>& values, double scale = MAD_NORMAL_SCALE);

/**
 * 1-based ranks, ties receive the mean of their positions
 */
std::vector<double> average_ranks(const std::vector<double>& values);

/**
 * Pearson correlation
 * @return nullopt if sizes differ, fewer than 2 points, or either side has zero variance
 */
std::optional<double> pearson_correlation(const std::vector<double>& x, const std::vector<double>& y);

/**
 * Spearman rank correlation (Pearson correlation of average ranks)
 */
std::optional<double> spearman_correlation(const std::vector<double>& x, const std::vector<double>& y);

/**
 * Two-sided p-value of a correlation coefficient over n pairs, from the
 * t statistic r * sqrt((n-2) / (1-r^2)) with n-2 degrees of freedom.
 * A perfect correlation gives 0.0.
 * @return nullopt for fewer than 3 pairs or r outside [-1,1]
 */
std::optional<double> correlation_p_value(double r, size_t n);

/**
 * Percent rank in [0,1]: (rank - 1) / (n - 1) where rank is the minimum
 * 1-based ascending position among tied values. A single value gets 0.
 */
std::vector<double> percent_ranks(const std::vector<double>& values);

} // namespace genescore

#endif // STAT_UTILS_HPP
