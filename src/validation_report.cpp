/**
 * Validation Report - Implementation
 */

#include "validation_report.hpp"
#include "file_parsers.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace genescore {

namespace {

std::string pct(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

std::string pct_or_na(const std::optional<double>& fraction) {
    return fraction ? pct(*fraction) : "N/A";
}

std::string status_mark(bool passed) {
    return passed ? "PASSED" : "FAILED";
}

/**
 * Layers with a defined mean, highest mean first
 */
std::vector<LayerMeanScore> ranked_layers(const std::vector<LayerMeanScore>& means) {
    std::vector<LayerMeanScore> ranked;
    for (const auto& m : means) {
        if (m.mean_score) ranked.push_back(m);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const LayerMeanScore& a, const LayerMeanScore& b) {
            return *a.mean_score > *b.mean_score;
        });
    return ranked;
}

std::string describe_layers(const std::vector<LayerMeanScore>& ranked, size_t limit) {
    std::ostringstream oss;
    for (size_t i = 0; i < ranked.size() && i < limit; ++i) {
        if (i > 0) oss << ", ";
        oss << ranked[i].layer << " (mean " << format_score(ranked[i].mean_score, 3) << ")";
    }
    return oss.str();
}

void make_parent_directories(const std::string& path) {
    size_t pos = 0;
    while ((pos = path.find('/', pos + 1)) != std::string::npos) {
        std::string dir = path.substr(0, pos);
        if (dir.empty() || file_exists(dir)) continue;
        if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            throw std::runtime_error("Cannot create directory " + dir + ": " + std::strerror(errno));
        }
    }
}

} // anonymous namespace

std::string overall_status_to_string(OverallStatus status) {
    switch (status) {
        case OverallStatus::ALL_PASSED:               return "ALL VALIDATIONS PASSED";
        case OverallStatus::PARTIAL_PASS_SENSITIVITY: return "PARTIAL PASS (Sensitivity Unstable)";
        case OverallStatus::PARTIAL_PASS_SPECIFICITY: return "PARTIAL PASS (Specificity Issue)";
        case OverallStatus::FAILED:                   return "VALIDATION FAILED";
        default: return "UNKNOWN";
    }
}

OverallStatus determine_overall_status(const PositiveControlResult& positive,
                                       const NegativeControlResult& negative,
                                       const SensitivitySummary& sensitivity) {
    bool pos = positive.ranking.validation_passed;
    bool neg = negative.ranking.validation_passed;
    bool stable = sensitivity.overall_stable;

    if (pos && neg && stable) return OverallStatus::ALL_PASSED;
    if (pos && neg) return OverallStatus::PARTIAL_PASS_SENSITIVITY;
    if (pos) return OverallStatus::PARTIAL_PASS_SPECIFICITY;
    return OverallStatus::FAILED;
}

std::string synthesize_verdict(OverallStatus status) {
    switch (status) {
        case OverallStatus::ALL_PASSED:
            return "The scoring system ranks known genes highly, ranks housekeeping genes low, "
                   "and keeps its ranking under weight perturbations.";
        case OverallStatus::PARTIAL_PASS_SENSITIVITY:
            return "Positive and negative controls pass, but rankings shift under small weight "
                   "perturbations. Results are directionally correct but may need weight tuning "
                   "for robustness.";
        case OverallStatus::PARTIAL_PASS_SPECIFICITY:
            return "Known genes rank highly, but housekeeping genes also rank higher than expected. "
                   "The scoring is sensitive but may lack specificity; review evidence layer weights.";
        case OverallStatus::FAILED:
        default:
            return "Known genes do not rank highly. Evidence layer weights or data quality "
                   "require investigation.";
    }
}

std::string recommend_weight_tuning(const PositiveControlResult& positive,
                                    const NegativeControlResult& negative,
                                    const SensitivitySummary& sensitivity) {
    bool pos = positive.ranking.validation_passed;
    bool neg = negative.ranking.validation_passed;
    bool stable = sensitivity.overall_stable;

    std::ostringstream out;

    if (pos && neg && stable) {
        out << "**Recommendation:** Current weights are validated. No tuning recommended.\n";
        log(LogLevel::INFO, "Weight tuning: no changes recommended");
        return out.str();
    }

    out << "**Recommendations for Weight Tuning:**\n\n";

    if (!pos) {
        out << "### Known Gene Ranking (Positive Controls)\n\n";
        out << "Reason: " << positive.ranking.reason << "\n\n";
        out << "**Suggested Actions:**\n";
        out << "- Review the per-source breakdown to find reference collections that validate poorly\n";
        auto ranked = ranked_layers(positive.ranking.layer_mean_scores);
        if (!ranked.empty()) {
            out << "- Consider increasing weights for layers where known genes score consistently high: "
                << describe_layers(ranked, 2) << "\n";
        } else {
            out << "- Examine evidence layer scores of known genes; none were available to compare layers\n";
        }
        out << "\n";
    }

    if (!neg) {
        out << "### Housekeeping Gene Ranking (Negative Controls)\n\n";
        out << "Reason: " << negative.ranking.reason << "\n\n";
        out << "**Suggested Actions:**\n";
        auto ranked = ranked_layers(negative.ranking.layer_mean_scores);
        if (!ranked.empty()) {
            out << "- Examine layers that boost housekeeping genes: " << describe_layers(ranked, 2) << "\n";
            out << "- Consider reducing the weight of " << ranked.front().layer << "\n";
        } else {
            out << "- Examine which evidence layers contribute high scores to housekeeping genes\n";
        }
        out << "\n";
    }

    if (!stable) {
        out << "### Weight Sensitivity (Stability)\n\n";
        out << "Reason: " << sensitivity.reason << "\n\n";
        out << "**Suggested Actions:**\n";
        if (sensitivity.most_sensitive_layer) {
            out << "- Most sensitive layer: **" << *sensitivity.most_sensitive_layer << "**\n";
            out << "- Consider reducing the weight of " << *sensitivity.most_sensitive_layer
                << " to improve stability\n";
        }
        if (sensitivity.most_robust_layer) {
            out << "- Most robust layer: " << *sensitivity.most_robust_layer << "\n";
        }
        if (sensitivity.defined_count == 0) {
            out << "- Increase top_n or check score coverage so perturbations share enough genes\n";
        }
        out << "\n";
    }

    out << "---\n\n";
    out << "### Circular Validation Risk\n\n";
    out << "**WARNING:** Tuning weights based on these results and then validating the tuned "
           "weights against the same positive and negative control sets is circular validation. "
           "Tuned weights must be re-validated against an independent hold-out reference set "
           "before they are trusted.\n";

    log(LogLevel::INFO, std::string("Weight tuning recommendations generated (positive ") +
                        status_mark(pos) + ", negative " + status_mark(neg) +
                        ", sensitivity " + (stable ? "STABLE" : "UNSTABLE") + ")");

    return out.str();
}

std::string generate_comprehensive_validation_report(const PositiveControlResult& positive,
                                                     const NegativeControlResult& negative,
                                                     const SensitivityResult* sensitivity_result,
                                                     const SensitivitySummary& sensitivity) {
    const PercentileValidationResult& pr = positive.ranking;
    const PercentileValidationResult& nr = negative.ranking;
    std::ostringstream out;

    out << "# Comprehensive Validation Report\n\n";

    // Positive controls
    out << "## 1. Positive Control Validation\n\n";
    out << "**Status:** " << status_mark(pr.validation_passed) << "\n\n";
    out << "### Summary\n";
    out << "- Known genes expected: " << pr.expected_count << "\n";
    out << "- Known genes found: " << pr.found_count << "\n";
    out << "- Median percentile: " << pct_or_na(pr.median_percentile) << "\n";
    out << "- Top quartile count: " << pr.top_quartile_count << "\n";
    out << "- Top quartile fraction: " << pct(pr.top_quartile_fraction) << "\n";
    out << "- Reason: " << pr.reason << "\n\n";

    const RecallMetrics& recall = positive.recall;
    if (!recall.absolute.empty() || !recall.percentage.empty()) {
        out << "### Recall@k Metrics\n\n";
        out << "Scored genes: " << recall.total_scored << "; curated known genes: "
            << recall.curated_count << " (" << recall.present_count << " present in scored set)\n\n";
        out << "| Threshold | k | Hits | Recall | Recall (present) |\n";
        out << "|-----------|---|------|--------|------------------|\n";
        for (const auto* group : {&recall.absolute, &recall.percentage}) {
            for (const auto& r : *group) {
                out << "| " << r.label << " | " << r.k << " | " << r.hits << " | "
                    << pct(r.recall) << " | " << pct_or_na(r.recall_present) << " |\n";
            }
        }
        out << "\n";
    }

    if (!positive.per_source.empty()) {
        out << "### Per-Source Breakdown\n\n";
        out << "| Source | Found | Median Percentile | Top Quartile |\n";
        out << "|--------|-------|-------------------|--------------|\n";
        for (const auto& sb : positive.per_source) {
            out << "| " << sb.source << " | " << sb.found_count << "/" << sb.expected_count
                << " | " << pct_or_na(sb.median_percentile) << " | " << sb.top_quartile_count << " |\n";
        }
        out << "\n";
    }

    // Negative controls
    out << "## 2. Negative Control Validation\n\n";
    out << "**Status:** " << status_mark(nr.validation_passed) << "\n\n";
    out << "### Summary\n";
    out << "- Housekeeping genes expected: " << nr.expected_count << "\n";
    out << "- Housekeeping genes found: " << nr.found_count << "\n";
    out << "- Median percentile: " << pct_or_na(nr.median_percentile) << "\n";
    out << "- Top quartile count: " << nr.top_quartile_count << "\n";
    out << "- High-tier count (score >= " << format_score(negative.high_tier_threshold, 2) << "): "
        << negative.in_high_tier_count << "\n";
    out << "- Reason: " << nr.reason << "\n\n";

    // Sensitivity
    out << "## 3. Sensitivity Analysis\n\n";
    std::string threshold = format_score(sensitivity.stability_threshold, 2);
    if (sensitivity.skipped) {
        out << "**Status:** SKIPPED\n\n";
        out << "- Reason: " << sensitivity.reason << "\n\n";
    } else {
        out << "**Status:** " << (sensitivity.overall_stable ? "STABLE" : "UNSTABLE") << "\n\n";
        out << "### Summary\n";
        out << "- Total perturbations: " << sensitivity.total_perturbations << "\n";
        out << "- Stable perturbations (rho >= " << threshold << "): " << sensitivity.stable_count << "\n";
        out << "- Unstable perturbations: " << sensitivity.unstable_count << "\n";
        out << "- Mean Spearman rho: " << (sensitivity.mean_rho ? format_score(sensitivity.mean_rho) : "N/A") << "\n";
        if (sensitivity.min_rho && sensitivity.max_rho) {
            out << "- Range: [" << format_score(sensitivity.min_rho) << ", "
                << format_score(sensitivity.max_rho) << "]\n";
        }
        if (sensitivity.most_sensitive_layer && sensitivity.most_robust_layer) {
            out << "- Most sensitive layer: " << *sensitivity.most_sensitive_layer << "\n";
            out << "- Most robust layer: " << *sensitivity.most_robust_layer << "\n";
        }
        out << "- Reason: " << sensitivity.reason << "\n\n";

        if (sensitivity_result) {
            out << "### Spearman Correlation by Perturbation\n\n";
            out << "| Layer | Delta | Spearman rho | p-value | Overlap | Stable? |\n";
            out << "|-------|-------|--------------|---------|---------|---------|\n";
            for (const auto& p : sensitivity_result->perturbations) {
                std::ostringstream delta;
                delta << std::showpos << std::fixed << std::setprecision(2) << p.delta;
                out << "| " << p.layer << " | " << delta.str() << " | "
                    << (p.spearman_rho ? format_score(p.spearman_rho) : "N/A") << " | "
                    << format_p_value(p.spearman_pval) << " | "
                    << p.overlap_count << " | "
                    << (p.spearman_rho ? (p.stable ? "yes" : "no") : "N/A") << " |\n";
            }
            out << "\n";
        }
    }

    // Overall
    OverallStatus status = determine_overall_status(positive, negative, sensitivity);
    out << "## 4. Overall Validation Summary\n\n";
    out << "**Status:** " << overall_status_to_string(status) << "\n\n";
    out << "**Verdict:** " << synthesize_verdict(status) << "\n\n";
    out << "| Validation Prong | Status | Verdict |\n";
    out << "|------------------|--------|---------|\n";
    out << "| Positive Controls | " << status_mark(pr.validation_passed) << " | Known genes rank "
        << (pr.validation_passed ? "high" : "low") << " |\n";
    out << "| Negative Controls | " << status_mark(nr.validation_passed) << " | Housekeeping genes rank "
        << (nr.validation_passed ? "low" : "high") << " |\n";
    out << "| Sensitivity Analysis | "
        << (sensitivity.skipped ? "SKIPPED" : (sensitivity.overall_stable ? "STABLE" : "UNSTABLE"))
        << " | Rankings " << (sensitivity.skipped ? "not tested" : (sensitivity.overall_stable ? "stable" : "unstable"))
        << " under perturbations |\n\n";

    out << "## 5. Weight Tuning Recommendations\n\n";
    out << recommend_weight_tuning(positive, negative, sensitivity);

    log(LogLevel::INFO, "Validation report generated: " + overall_status_to_string(status));

    return out.str();
}

void save_validation_report(const std::string& report_text, const std::string& output_path) {
    make_parent_directories(output_path);

    std::ofstream output(output_path, std::ios::out | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Cannot open report file for writing: " + output_path);
    }
    output << report_text;
    if (!output) {
        throw std::runtime_error("Failed writing report file: " + output_path);
    }

    log(LogLevel::INFO, "Validation report saved to " + output_path);
}

} // namespace genescore
