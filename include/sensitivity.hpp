/**
 * Sensitivity Analysis
 *
 * Measures how much the composite ranking changes when one layer weight
 * is nudged. Each (layer, delta) perturbation clamps the perturbed weight
 * to [0,1], renormalizes every weight to sum 1.0, re-runs the aggregation
 * and compares the top-N genes against the baseline with Spearman's rho.
 *
 * Cost: one full aggregation per (layer, delta) pair plus the baseline.
 */

#ifndef SENSITIVITY_HPP
#define SENSITIVITY_HPP

#include "gene_scoring.hpp"
#include <string>
#include <vector>
#include <optional>

namespace genescore {

struct SensitivityConfig {
    std::vector<double> deltas = {-0.10, -0.05, 0.05, 0.10};
    size_t top_n = 100;
    size_t min_overlap = 10;            // Fewer shared genes -> rho undefined
    double stability_threshold = 0.85;  // rho >= threshold -> stable
};

/**
 * Parse a comma-separated delta list ("-0.1,-0.05,0.05,0.1")
 * @throws std::invalid_argument on malformed or empty input
 */
std::vector<double> parse_deltas(const std::string& spec);

struct SensitivityPerturbation {
    std::string layer;
    double delta = 0.0;
    ScoringWeights perturbed_weights;
    std::optional<double> spearman_rho;     // nullopt: insufficient overlap or zero variance
    std::optional<double> spearman_pval;    // Absent whenever rho is absent
    size_t overlap_count = 0;
    bool stable = false;                    // Only meaningful when rho is defined

    bool has_rho() const { return spearman_rho.has_value(); }
};

struct SensitivityResult {
    ScoringWeights baseline_weights;
    std::vector<SensitivityPerturbation> perturbations;
    size_t top_n = 0;
    size_t min_overlap = 0;
    double stability_threshold = 0.0;
};

struct LayerSensitivity {
    std::string layer;
    std::optional<double> mean_rho;
    size_t defined_count = 0;
};

struct SensitivitySummary {
    size_t total_perturbations = 0;
    size_t defined_count = 0;
    std::optional<double> min_rho;
    std::optional<double> max_rho;
    std::optional<double> mean_rho;
    size_t stable_count = 0;
    size_t unstable_count = 0;
    bool overall_stable = false;
    std::optional<std::string> most_sensitive_layer;    // Lowest mean rho
    std::optional<std::string> most_robust_layer;       // Highest mean rho
    std::vector<LayerSensitivity> per_layer;
    double stability_threshold = 0.85;
    bool skipped = false;
    std::string reason;
};

/**
 * Overlap and rank agreement of two top-N lists
 */
struct TopNComparison {
    size_t overlap_count = 0;
    std::optional<double> spearman_rho;
    std::optional<double> spearman_pval;
};

/**
 * Add delta to one layer weight, clamp to [0,1] and renormalize all weights.
 * If every weight ends at zero the result is uniform.
 * @throws std::invalid_argument if the layer is not part of the weights
 */
ScoringWeights perturb_weight(const ScoringWeights& baseline, const std::string& layer, double delta);

/**
 * Intersect the top-N scored genes of two runs by gene symbol and
 * correlate their composite scores over the intersection.
 */
TopNComparison compare_top_n(const ScoredGeneSet& baseline,
                             const ScoredGeneSet& perturbed,
                             size_t top_n,
                             size_t min_overlap);

/**
 * Run every (layer, delta) perturbation against the store
 * @throws std::invalid_argument for invalid weights
 * @throws std::runtime_error if a store query fails
 */
SensitivityResult run_sensitivity_analysis(
    const EvidenceStore& store,
    const ScoringWeights& baseline_weights,
    const SensitivityConfig& config = SensitivityConfig(),
    const std::vector<LayerSpec>& specs = default_layer_specs()
);

SensitivitySummary summarize_sensitivity(const SensitivityResult& result);

/**
 * Summary for a run where sensitivity analysis was not performed.
 * Treated as stable so it does not affect the overall verdict.
 */
SensitivitySummary skipped_sensitivity_summary(const std::string& reason);

/**
 * Render a p-value with three significant digits, "N/A" when absent
 */
std::string format_p_value(const std::optional<double>& pval);

std::string format_sensitivity_report(const SensitivityResult& result,
                                      const SensitivitySummary& summary);

} // namespace genescore

#endif // SENSITIVITY_HPP
