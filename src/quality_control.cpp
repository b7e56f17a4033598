/**
 * Quality Control Analyzer - Implementation
 */

#include "quality_control.hpp"
#include "stat_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace genescore {

namespace {

std::string format_percent(double fraction, int precision = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
    return oss.str();
}

std::string format_fixed(double value, int precision = 4) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

/**
 * Present scores of one layer, paired with their gene symbols
 */
void collect_layer(const ScoredGeneSet& scored, size_t layer_idx,
                   std::vector<double>& values, std::vector<std::string>* symbols) {
    values.clear();
    if (symbols) symbols->clear();
    for (const auto& gene : scored.genes()) {
        if (layer_idx < gene.layer_scores.size() && gene.layer_scores[layer_idx]) {
            values.push_back(*gene.layer_scores[layer_idx]);
            if (symbols) symbols->push_back(gene.gene_symbol);
        }
    }
}

} // anonymous namespace

std::string qc_severity_to_string(QcSeverity severity) {
    switch (severity) {
        case QcSeverity::OK:      return "ok";
        case QcSeverity::WARNING: return "warning";
        case QcSeverity::ERROR:   return "error";
        default: return "unknown";
    }
}

// ============================================================================
// Missing data
// ============================================================================

MissingDataResult compute_missing_data_rates(const ScoredGeneSet& scored,
                                             const QcThresholds& thresholds) {
    MissingDataResult result;
    result.total_genes = scored.size();

    for (size_t l = 0; l < scored.layers().size(); ++l) {
        const std::string& layer = scored.layers()[l];

        size_t missing = 0;
        for (const auto& gene : scored.genes()) {
            if (l >= gene.layer_scores.size() || !gene.layer_scores[l]) missing++;
        }

        LayerMissingRate entry;
        entry.layer = layer;
        entry.rate = scored.size() > 0 ? static_cast<double>(missing) / scored.size() : 0.0;

        if (entry.rate > thresholds.missing_rate_error) {
            entry.severity = QcSeverity::ERROR;
            result.errors.push_back(layer + ": " + format_percent(entry.rate) + " missing");
            log(LogLevel::ERROR, "Missing data error: " + layer + " " + format_percent(entry.rate) +
                                 " missing (threshold " + format_percent(thresholds.missing_rate_error, 0) + ")");
        } else if (entry.rate > thresholds.missing_rate_warn) {
            entry.severity = QcSeverity::WARNING;
            result.warnings.push_back(layer + ": " + format_percent(entry.rate) + " missing");
            log(LogLevel::WARNING, "Missing data warning: " + layer + " " + format_percent(entry.rate) +
                                   " missing (threshold " + format_percent(thresholds.missing_rate_warn, 0) + ")");
        } else {
            log(LogLevel::INFO, "Missing data ok: " + layer + " " + format_percent(entry.rate) + " missing");
        }

        result.rates.push_back(entry);
    }

    return result;
}

// ============================================================================
// Distribution statistics
// ============================================================================

DistributionResult compute_distribution_stats(const ScoredGeneSet& scored,
                                              const QcThresholds& thresholds) {
    DistributionResult result;
    std::vector<double> values;

    for (size_t l = 0; l < scored.layers().size(); ++l) {
        const std::string& layer = scored.layers()[l];
        collect_layer(scored, l, values, nullptr);

        LayerDistribution dist;
        dist.layer = layer;

        if (values.empty()) {
            result.warnings.push_back(layer + ": no data available");
            log(LogLevel::WARNING, "Distribution: " + layer + " has no data");
            result.distributions.push_back(dist);
            continue;
        }

        DistributionStats stats;
        stats.mean = mean(values);
        stats.median = median(values);
        stats.stddev = population_stddev(values);
        stats.min = *std::min_element(values.begin(), values.end());
        stats.max = *std::max_element(values.begin(), values.end());
        stats.count = values.size();

        if (stats.stddev < thresholds.min_std) {
            result.warnings.push_back(layer + ": no variation (std=" + format_fixed(stats.stddev) + ")");
            log(LogLevel::WARNING, "Distribution: " + layer + " shows no variation (std=" +
                                   format_fixed(stats.stddev) + ")");
        }

        if (stats.min < 0.0 || stats.max > 1.0) {
            result.errors.push_back(layer + ": out of range (min=" + format_fixed(stats.min) +
                                    ", max=" + format_fixed(stats.max) + ")");
            log(LogLevel::ERROR, "Distribution: " + layer + " out of range [" +
                                 format_fixed(stats.min) + ", " + format_fixed(stats.max) + "]");
        }

        log(LogLevel::INFO, "Distribution: " + layer + " mean=" + format_fixed(stats.mean) +
                            " median=" + format_fixed(stats.median) +
                            " std=" + format_fixed(stats.stddev) +
                            " range=[" + format_fixed(stats.min) + ", " + format_fixed(stats.max) + "]");

        dist.stats = stats;
        result.distributions.push_back(dist);
    }

    return result;
}

// ============================================================================
// Outliers
// ============================================================================

std::vector<LayerOutliers> detect_outliers(const ScoredGeneSet& scored,
                                           const QcThresholds& thresholds) {
    std::vector<LayerOutliers> result;
    std::vector<double> values;
    std::vector<std::string> symbols;

    for (size_t l = 0; l < scored.layers().size(); ++l) {
        LayerOutliers outliers;
        outliers.layer = scored.layers()[l];

        collect_layer(scored, l, values, &symbols);
        if (values.empty()) {
            result.push_back(outliers);
            continue;
        }

        double center = median(values);
        double mad = median_abs_deviation(values);
        outliers.mad = mad;

        if (is_close_to_zero(mad)) {
            outliers.skipped = true;
            log(LogLevel::INFO, "Outlier detection skipped for " + outliers.layer + ": no variation (MAD=0)");
            result.push_back(outliers);
            continue;
        }

        double limit = thresholds.outlier_mad_multiple * mad;
        for (size_t i = 0; i < values.size(); ++i) {
            if (std::fabs(values[i] - center) > limit) {
                outliers.count++;
                if (outliers.example_genes.size() < thresholds.outlier_example_limit) {
                    outliers.example_genes.push_back(symbols[i]);
                }
            }
        }

        if (outliers.count > 0) {
            std::ostringstream examples;
            for (size_t i = 0; i < outliers.example_genes.size(); ++i) {
                if (i > 0) examples << ",";
                examples << outliers.example_genes[i];
            }
            log(LogLevel::INFO, "Outliers detected in " + outliers.layer + ": " +
                                std::to_string(outliers.count) + " (MAD=" + format_fixed(mad) +
                                ", examples " + examples.str() + ")");
        } else {
            log(LogLevel::INFO, "No outliers in " + outliers.layer + " (MAD=" + format_fixed(mad) + ")");
        }

        result.push_back(outliers);
    }

    return result;
}

// ============================================================================
// Composite statistics
// ============================================================================

CompositeStats compute_composite_stats(const ScoredGeneSet& scored) {
    CompositeStats stats;
    stats.total_genes = scored.size();

    std::vector<double> values;
    values.reserve(scored.scored_count());
    for (const auto& gene : scored.genes()) {
        if (gene.composite_score) values.push_back(*gene.composite_score);
    }
    stats.non_null_count = values.size();

    if (values.empty()) return stats;

    stats.mean = mean(values);
    stats.median = median(values);
    stats.stddev = sample_stddev(values);
    stats.min = *std::min_element(values.begin(), values.end());
    stats.max = *std::max_element(values.begin(), values.end());
    stats.p10 = percentile_linear(values, 0.10);
    stats.p25 = percentile_linear(values, 0.25);
    stats.p50 = percentile_linear(values, 0.50);
    stats.p75 = percentile_linear(values, 0.75);
    stats.p90 = percentile_linear(values, 0.90);

    return stats;
}

// ============================================================================
// Orchestration
// ============================================================================

QcReport run_qc_checks(const ScoredGeneSet& scored, const QcThresholds& thresholds) {
    log(LogLevel::INFO, "Running QC checks on " + std::to_string(scored.size()) + " genes");

    QcReport report;
    report.thresholds = thresholds;
    report.missing_data = compute_missing_data_rates(scored, thresholds);
    report.distributions = compute_distribution_stats(scored, thresholds);
    report.outliers = detect_outliers(scored, thresholds);
    report.composite_stats = compute_composite_stats(scored);

    const CompositeStats& cs = report.composite_stats;
    log(LogLevel::INFO, "Composite score stats: mean=" + format_score(cs.mean) +
                        " median=" + format_score(cs.median) +
                        " std=" + format_score(cs.stddev) +
                        " p10=" + format_score(cs.p10) + " p90=" + format_score(cs.p90) +
                        " coverage=" + std::to_string(cs.non_null_count) + "/" +
                        std::to_string(cs.total_genes));

    report.warnings = report.missing_data.warnings;
    report.warnings.insert(report.warnings.end(),
                           report.distributions.warnings.begin(), report.distributions.warnings.end());
    report.errors = report.missing_data.errors;
    report.errors.insert(report.errors.end(),
                         report.distributions.errors.begin(), report.distributions.errors.end());
    report.passed = report.errors.empty();

    log(LogLevel::INFO, "QC complete: " + std::to_string(report.warnings.size()) + " warnings, " +
                        std::to_string(report.errors.size()) + " errors, " +
                        (report.passed ? "PASSED" : "FAILED"));

    return report;
}

std::string format_qc_report(const QcReport& report) {
    std::ostringstream out;

    out << "Quality Control: " << (report.passed ? "PASSED" : "FAILED") << "\n\n";

    out << "Missing Data (" << report.missing_data.total_genes << " genes):\n";
    for (const auto& rate : report.missing_data.rates) {
        out << "  " << std::left << std::setw(14) << rate.layer << std::right
            << std::setw(8) << format_percent(rate.rate)
            << "  " << qc_severity_to_string(rate.severity) << "\n";
    }

    out << "\nDistributions:\n";
    for (const auto& dist : report.distributions.distributions) {
        out << "  " << std::left << std::setw(14) << dist.layer << std::right;
        if (!dist.stats) {
            out << "  no data\n";
            continue;
        }
        const DistributionStats& s = *dist.stats;
        out << "  n=" << s.count
            << " mean=" << format_fixed(s.mean)
            << " median=" << format_fixed(s.median)
            << " std=" << format_fixed(s.stddev)
            << " range=[" << format_fixed(s.min) << ", " << format_fixed(s.max) << "]\n";
    }

    out << "\nOutliers (>" << std::fixed << std::setprecision(1)
        << report.thresholds.outlier_mad_multiple << " MAD):\n";
    for (const auto& o : report.outliers) {
        out << "  " << std::left << std::setw(14) << o.layer << std::right;
        if (!o.mad) {
            out << "  no data\n";
        } else if (o.skipped) {
            out << "  skipped (no variation)\n";
        } else {
            out << "  " << o.count;
            if (!o.example_genes.empty()) {
                out << " (";
                for (size_t i = 0; i < o.example_genes.size(); ++i) {
                    if (i > 0) out << ", ";
                    out << o.example_genes[i];
                }
                out << ")";
            }
            out << "\n";
        }
    }

    const CompositeStats& cs = report.composite_stats;
    out << "\nComposite Score (" << cs.non_null_count << "/" << cs.total_genes << " scored):\n";
    out << "  mean=" << format_score(cs.mean) << " median=" << format_score(cs.median)
        << " std=" << format_score(cs.stddev) << "\n";
    out << "  min=" << format_score(cs.min) << " max=" << format_score(cs.max) << "\n";
    out << "  p10=" << format_score(cs.p10) << " p25=" << format_score(cs.p25)
        << " p50=" << format_score(cs.p50) << " p75=" << format_score(cs.p75)
        << " p90=" << format_score(cs.p90) << "\n";

    if (!report.errors.empty()) {
        out << "\nErrors:\n";
        for (const auto& e : report.errors) out << "  - " << e << "\n";
    }
    if (!report.warnings.empty()) {
        out << "\nWarnings:\n";
        for (const auto& w : report.warnings) out << "  - " << w << "\n";
    }

    return out.str();
}

} // namespace genescore
