/**
 * Quality Control Analyzer
 *
 * Advisory checks over a scored gene set:
 * - Missing-data rate per evidence layer
 * - Distribution statistics per layer (present scores only)
 * - MAD-based outlier detection per layer
 * - Composite score summary statistics
 *
 * None of the checks throws on bad data; findings are returned as
 * warnings and errors in a QcReport.
 */

#ifndef QUALITY_CONTROL_HPP
#define QUALITY_CONTROL_HPP

#include "gene_scoring.hpp"
#include <string>
#include <vector>
#include <optional>

namespace genescore {

struct QcThresholds {
    double missing_rate_warn = 0.5;     // rate > warn -> warning
    double missing_rate_error = 0.8;    // rate > error -> error
    double min_std = 0.01;              // std below -> no variation warning
    double outlier_mad_multiple = 3.0;  // |score - median| > k * MAD -> outlier
    size_t outlier_example_limit = 5;
};

enum class QcSeverity { OK, WARNING, ERROR };

std::string qc_severity_to_string(QcSeverity severity);

struct LayerMissingRate {
    std::string layer;
    double rate = 0.0;
    QcSeverity severity = QcSeverity::OK;
};

struct MissingDataResult {
    size_t total_genes = 0;
    std::vector<LayerMissingRate> rates;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

struct DistributionStats {
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;        // population standard deviation
    double min = 0.0;
    double max = 0.0;
    size_t count = 0;
};

struct LayerDistribution {
    std::string layer;
    std::optional<DistributionStats> stats;    // nullopt when the layer has no data
};

struct DistributionResult {
    std::vector<LayerDistribution> distributions;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

struct LayerOutliers {
    std::string layer;
    size_t count = 0;
    std::vector<std::string> example_genes;
    std::optional<double> mad;      // nullopt when the layer has no data
    bool skipped = false;           // MAD ~ 0, no meaningful outliers
};

struct CompositeStats {
    size_t total_genes = 0;
    size_t non_null_count = 0;
    std::optional<double> mean;
    std::optional<double> median;
    std::optional<double> stddev;   // sample standard deviation
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> p10;
    std::optional<double> p25;
    std::optional<double> p50;
    std::optional<double> p75;
    std::optional<double> p90;
};

struct QcReport {
    QcThresholds thresholds;
    MissingDataResult missing_data;
    DistributionResult distributions;
    std::vector<LayerOutliers> outliers;
    CompositeStats composite_stats;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    bool passed = true;
};

/**
 * Fraction of genes with an absent score, per layer.
 * Classification: rate > error threshold -> error, > warn threshold -> warning.
 */
MissingDataResult compute_missing_data_rates(const ScoredGeneSet& scored,
                                             const QcThresholds& thresholds = QcThresholds());

/**
 * Mean/median/std/min/max over present scores.
 * Flags std < min_std as a warning and any value outside [0,1] as an error.
 */
DistributionResult compute_distribution_stats(const ScoredGeneSet& scored,
                                              const QcThresholds& thresholds = QcThresholds());

/**
 * Robust outlier detection: center = median, spread = normal-scaled MAD.
 * Layers with MAD ~ 0 are skipped and report zero outliers.
 */
std::vector<LayerOutliers> detect_outliers(const ScoredGeneSet& scored,
                                           const QcThresholds& thresholds = QcThresholds());

CompositeStats compute_composite_stats(const ScoredGeneSet& scored);

/**
 * Run every check and combine warnings/errors.
 * passed is true iff no check produced an error.
 */
QcReport run_qc_checks(const ScoredGeneSet& scored,
                       const QcThresholds& thresholds = QcThresholds());

std::string format_qc_report(const QcReport& report);

} // namespace genescore

#endif // QUALITY_CONTROL_HPP
