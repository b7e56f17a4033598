/**
 * Control Validation
 *
 * Checks that the composite ranking places curated reference genes where
 * they belong:
 * - Positive controls (known disease/pathway genes) should rank high
 * - Negative controls (housekeeping genes) should rank low
 *
 * Percentiles follow the PERCENT_RANK convention: 0 for the lowest
 * composite score, 1 for the highest, ties share the lower rank. Genes
 * without a composite score are not ranked.
 *
 * A validation that does not pass is a normal result, not an exception;
 * every result carries a human-readable reason.
 */

#ifndef CONTROL_VALIDATION_HPP
#define CONTROL_VALIDATION_HPP

#include "gene_scoring.hpp"
#include "reference_genes.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace genescore {

/**
 * Fixed thresholds of the control validators
 */
struct ValidationConfig {
    double positive_percentile_threshold = 0.75;    // pass iff median >= this
    double negative_percentile_threshold = 0.50;    // pass iff median < this
    double top_quartile_percentile = 0.75;
    double high_tier_score = 0.70;                  // negative controls at or above are "high tier"
    std::vector<size_t> recall_k_values = {100, 500, 1000, 2000};
    std::vector<double> recall_percentages = {0.05, 0.10, 0.20};
    size_t gene_detail_limit = 20;
};

/**
 * One ranked gene
 */
struct GenePercentile {
    std::string gene_id;
    std::string gene_symbol;
    double composite_score = 0.0;
    double percentile = 0.0;
};

/**
 * Matched reference gene with its rank
 */
struct ControlGeneDetail {
    std::string gene_id;
    std::string gene_symbol;
    double composite_score = 0.0;
    double percentile = 0.0;
    int evidence_count = 0;
    std::vector<std::string> sources;   // Every provenance tag of the symbol
};

struct LayerMeanScore {
    std::string layer;
    std::optional<double> mean_score;   // Over matched genes with a present layer score
    size_t gene_count = 0;
};

/**
 * Rank statistics of one reference set
 */
struct PercentileValidationResult {
    std::string set_label;                      // "known", "housekeeping", ...
    size_t expected_count = 0;                  // Unique reference symbols
    size_t found_count = 0;                     // Unique symbols with a composite score
    std::optional<double> median_percentile;
    size_t top_quartile_count = 0;
    double top_quartile_fraction = 0.0;
    double percentile_threshold = 0.0;
    bool validation_passed = false;
    std::string reason;
    std::vector<ControlGeneDetail> per_gene_detail;
    std::vector<LayerMeanScore> layer_mean_scores;
};

struct SourceBreakdown {
    std::string source;
    size_t expected_count = 0;
    size_t found_count = 0;
    std::optional<double> median_percentile;
    size_t top_quartile_count = 0;
};

struct RecallAtK {
    std::string label;                      // "Top 100", "Top 10%"
    size_t k = 0;
    size_t hits = 0;                        // Unique reference symbols in the top k
    double recall = 0.0;                    // hits / curated
    std::optional<double> recall_present;   // hits / curated present in the scored set
};

struct RecallMetrics {
    size_t total_scored = 0;
    size_t curated_count = 0;
    size_t present_count = 0;
    std::vector<RecallAtK> absolute;
    std::vector<RecallAtK> percentage;

    /**
     * Look up a recall entry by label ("Top 10%")
     */
    const RecallAtK* find(const std::string& label) const;
};

struct PositiveControlResult {
    PercentileValidationResult ranking;
    RecallMetrics recall;
    std::vector<SourceBreakdown> per_source;
};

struct NegativeControlResult {
    PercentileValidationResult ranking;
    size_t in_high_tier_count = 0;
    double high_tier_threshold = 0.0;
};

/**
 * Percent rank of every gene with a composite score, in scored order
 */
std::vector<GenePercentile> compute_percentile_ranks(const ScoredGeneSet& scored);

/**
 * Known genes should rank in the top quartile
 */
PositiveControlResult validate_positive_controls(
    const ScoredGeneSet& scored,
    const std::vector<ReferenceGeneEntry>& reference = compile_known_genes(),
    const ValidationConfig& config = ValidationConfig()
);

/**
 * Housekeeping genes should rank below the median (inverted acceptance)
 */
NegativeControlResult validate_negative_controls(
    const ScoredGeneSet& scored,
    const std::vector<ReferenceGeneEntry>& reference = compile_housekeeping_genes(),
    const ValidationConfig& config = ValidationConfig()
);

/**
 * Fraction of reference genes among the top-k scored genes, for absolute
 * k values and for percentages of the scored gene count
 */
RecallMetrics compute_recall_at_k(
    const ScoredGeneSet& scored,
    const std::vector<ReferenceGeneEntry>& reference,
    const ValidationConfig& config = ValidationConfig()
);

/**
 * Median percentile and top-quartile count per provenance source
 */
std::vector<SourceBreakdown> compute_per_source_breakdown(
    const ScoredGeneSet& scored,
    const std::vector<ReferenceGeneEntry>& reference,
    const ValidationConfig& config = ValidationConfig()
);

std::string format_positive_control_report(const PositiveControlResult& result);
std::string format_negative_control_report(const NegativeControlResult& result);

} // namespace genescore

#endif // CONTROL_VALIDATION_HPP
