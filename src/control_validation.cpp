/**
 * Control Validation - Implementation
 */

#include "control_validation.hpp"
#include "stat_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace genescore {

namespace {

std::string pct(double fraction, int precision = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
    return oss.str();
}

/**
 * Unique reference symbols in first-seen order, each with all its sources
 */
std::vector<std::pair<std::string, std::vector<std::string>>> group_by_symbol(
    const std::vector<ReferenceGeneEntry>& reference) {

    std::vector<std::pair<std::string, std::vector<std::string>>> groups;
    std::unordered_map<std::string, size_t> index;

    for (const auto& entry : reference) {
        auto it = index.find(entry.gene_symbol);
        if (it == index.end()) {
            index[entry.gene_symbol] = groups.size();
            groups.push_back({entry.gene_symbol, {entry.source}});
        } else {
            auto& sources = groups[it->second].second;
            if (std::find(sources.begin(), sources.end(), entry.source) == sources.end()) {
                sources.push_back(entry.source);
            }
        }
    }
    return groups;
}

std::unordered_map<std::string, double> percentile_by_id(const ScoredGeneSet& scored) {
    std::unordered_map<std::string, double> result;
    for (const auto& gp : compute_percentile_ranks(scored)) {
        result[gp.gene_id] = gp.percentile;
    }
    return result;
}

/**
 * Match reference symbols against ranked genes.
 * A symbol carried by several genes matches the highest-ranked one.
 */
std::vector<ControlGeneDetail> match_reference(
    const ScoredGeneSet& scored,
    const std::unordered_map<std::string, double>& percentiles,
    const std::vector<ReferenceGeneEntry>& reference) {

    std::vector<ControlGeneDetail> matched;
    for (const auto& [symbol, sources] : group_by_symbol(reference)) {
        const ScoredGene* gene = scored.find_by_symbol(symbol);
        if (!gene || !gene->has_score()) continue;

        auto it = percentiles.find(gene->gene_id);
        if (it == percentiles.end()) continue;

        ControlGeneDetail detail;
        detail.gene_id = gene->gene_id;
        detail.gene_symbol = gene->gene_symbol;
        detail.composite_score = *gene->composite_score;
        detail.percentile = it->second;
        detail.evidence_count = gene->evidence_count;
        detail.sources = sources;
        matched.push_back(std::move(detail));
    }
    return matched;
}

std::vector<LayerMeanScore> compute_layer_means(const ScoredGeneSet& scored,
                                                const std::vector<ControlGeneDetail>& matched) {
    std::vector<LayerMeanScore> means;
    for (size_t l = 0; l < scored.layers().size(); ++l) {
        LayerMeanScore entry;
        entry.layer = scored.layers()[l];

        std::vector<double> values;
        for (const auto& detail : matched) {
            const ScoredGene* gene = scored.find_by_id(detail.gene_id);
            if (gene && l < gene->layer_scores.size() && gene->layer_scores[l]) {
                values.push_back(*gene->layer_scores[l]);
            }
        }
        entry.gene_count = values.size();
        if (!values.empty()) entry.mean_score = mean(values);
        means.push_back(entry);
    }
    return means;
}

/**
 * Shared ranking procedure; acceptance direction decided by the caller
 */
PercentileValidationResult rank_reference_set(
    const ScoredGeneSet& scored,
    const std::vector<ReferenceGeneEntry>& reference,
    const ValidationConfig& config,
    const std::string& label,
    bool highest_first) {

    PercentileValidationResult result;
    result.set_label = label;
    result.expected_count = unique_symbol_count(reference);

    auto percentiles = percentile_by_id(scored);
    std::vector<ControlGeneDetail> matched = match_reference(scored, percentiles, reference);
    result.found_count = matched.size();

    if (matched.empty()) return result;

    std::vector<double> values;
    values.reserve(matched.size());
    for (const auto& detail : matched) {
        values.push_back(detail.percentile);
        if (detail.percentile >= config.top_quartile_percentile) {
            result.top_quartile_count++;
        }
    }
    result.median_percentile = median(values);
    result.top_quartile_fraction = static_cast<double>(result.top_quartile_count) / matched.size();
    result.layer_mean_scores = compute_layer_means(scored, matched);

    std::sort(matched.begin(), matched.end(),
        [highest_first](const ControlGeneDetail& a, const ControlGeneDetail& b) {
            if (a.percentile != b.percentile) {
                return highest_first ? a.percentile > b.percentile : a.percentile < b.percentile;
            }
            return a.gene_symbol < b.gene_symbol;
        });
    if (matched.size() > config.gene_detail_limit) {
        matched.resize(config.gene_detail_limit);
    }
    result.per_gene_detail = std::move(matched);

    return result;
}

std::string no_genes_found_reason(const PercentileValidationResult& r) {
    return "no " + r.set_label + " genes found in scored dataset (expected " +
           std::to_string(r.expected_count) +
           "; check gene symbol mapping, filtering, or that composite scores exist)";
}

void append_detail_table(std::ostringstream& out, const std::vector<ControlGeneDetail>& details) {
    out << std::string(80, '-') << "\n";
    out << std::left << std::setw(12) << "Gene" << std::right
        << std::setw(9) << "Score" << std::setw(13) << "Percentile"
        << "  " << "Source" << "\n";
    out << std::string(80, '-') << "\n";

    for (const auto& d : details) {
        std::string sources;
        for (size_t i = 0; i < d.sources.size(); ++i) {
            if (i > 0) sources += ",";
            sources += d.sources[i];
        }
        out << std::left << std::setw(12) << d.gene_symbol << std::right
            << std::setw(9) << format_score(d.composite_score)
            << std::setw(13) << pct(d.percentile)
            << "  " << sources << "\n";
    }
}

} // anonymous namespace

const RecallAtK* RecallMetrics::find(const std::string& label) const {
    for (const auto& r : absolute) {
        if (r.label == label) return &r;
    }
    for (const auto& r : percentage) {
        if (r.label == label) return &r;
    }
    return nullptr;
}

std::vector<GenePercentile> compute_percentile_ranks(const ScoredGeneSet& scored) {
    std::vector<GenePercentile> ranked;
    std::vector<double> scores;
    ranked.reserve(scored.scored_count());
    scores.reserve(scored.scored_count());

    for (const auto& gene : scored.genes()) {
        if (!gene.composite_score) continue;
        GenePercentile gp;
        gp.gene_id = gene.gene_id;
        gp.gene_symbol = gene.gene_symbol;
        gp.composite_score = *gene.composite_score;
        ranked.push_back(gp);
        scores.push_back(*gene.composite_score);
    }

    std::vector<double> ranks = percent_ranks(scores);
    for (size_t i = 0; i < ranked.size(); ++i) {
        ranked[i].percentile = ranks[i];
    }
    return ranked;
}

// ============================================================================
// Positive controls
// ============================================================================

RecallMetrics compute_recall_at_k(const ScoredGeneSet& scored,
                                  const std::vector<ReferenceGeneEntry>& reference,
                                  const ValidationConfig& config) {
    RecallMetrics metrics;
    metrics.total_scored = scored.scored_count();

    std::set<std::string> curated;
    for (const auto& entry : reference) {
        curated.insert(entry.gene_symbol);
    }
    metrics.curated_count = curated.size();

    for (const auto& symbol : curated) {
        const ScoredGene* gene = scored.find_by_symbol(symbol);
        if (gene && gene->has_score()) metrics.present_count++;
    }

    auto measure = [&](size_t k, const std::string& label) {
        RecallAtK entry;
        entry.label = label;
        entry.k = k;

        std::set<std::string> hit_symbols;
        for (const ScoredGene* gene : scored.top_scored(k)) {
            if (curated.count(gene->gene_symbol)) hit_symbols.insert(gene->gene_symbol);
        }
        entry.hits = hit_symbols.size();
        entry.recall = metrics.curated_count > 0
            ? static_cast<double>(entry.hits) / metrics.curated_count : 0.0;
        if (metrics.present_count > 0) {
            entry.recall_present = static_cast<double>(entry.hits) / metrics.present_count;
        }
        return entry;
    };

    for (size_t k : config.recall_k_values) {
        metrics.absolute.push_back(measure(k, "Top " + std::to_string(k)));
    }

    for (double fraction : config.recall_percentages) {
        size_t k = static_cast<size_t>(metrics.total_scored * fraction);
        std::ostringstream label;
        label << "Top " << std::round(fraction * 100.0) << "%";
        metrics.percentage.push_back(measure(k, label.str()));
    }

    return metrics;
}

std::vector<SourceBreakdown> compute_per_source_breakdown(
    const ScoredGeneSet& scored,
    const std::vector<ReferenceGeneEntry>& reference,
    const ValidationConfig& config) {

    std::vector<SourceBreakdown> breakdown;
    auto percentiles = percentile_by_id(scored);

    for (const auto& source : reference_sources(reference)) {
        std::vector<ReferenceGeneEntry> subset;
        for (const auto& entry : reference) {
            if (entry.source == source) subset.push_back(entry);
        }

        SourceBreakdown sb;
        sb.source = source;
        sb.expected_count = unique_symbol_count(subset);

        std::vector<double> values;
        for (const auto& detail : match_reference(scored, percentiles, subset)) {
            values.push_back(detail.percentile);
            if (detail.percentile >= config.top_quartile_percentile) sb.top_quartile_count++;
        }
        sb.found_count = values.size();
        if (!values.empty()) sb.median_percentile = median(values);

        log(LogLevel::DEBUG, "Source " + source + ": " + std::to_string(sb.found_count) + "/" +
                             std::to_string(sb.expected_count) + " found, median percentile " +
                             format_score(sb.median_percentile));
        breakdown.push_back(sb);
    }

    return breakdown;
}

PositiveControlResult validate_positive_controls(const ScoredGeneSet& scored,
                                                 const std::vector<ReferenceGeneEntry>& reference,
                                                 const ValidationConfig& config) {
    log(LogLevel::INFO, "Validating positive controls (threshold " +
                        pct(config.positive_percentile_threshold) + ")");

    PositiveControlResult result;
    result.ranking = rank_reference_set(scored, reference, config, "known", true);
    result.ranking.percentile_threshold = config.positive_percentile_threshold;
    result.recall = compute_recall_at_k(scored, reference, config);
    result.per_source = compute_per_source_breakdown(scored, reference, config);

    PercentileValidationResult& r = result.ranking;

    if (r.found_count == 0) {
        r.validation_passed = false;
        r.reason = no_genes_found_reason(r);
        log(LogLevel::ERROR, "Positive control validation failed: " + r.reason);
        return result;
    }

    r.validation_passed = *r.median_percentile >= config.positive_percentile_threshold;

    if (r.validation_passed) {
        r.reason = "median percentile " + pct(*r.median_percentile) + " >= " +
                   pct(config.positive_percentile_threshold);
        log(LogLevel::INFO, "Positive controls passed: " + std::to_string(r.found_count) + "/" +
                            std::to_string(r.expected_count) + " found, " + r.reason +
                            ", top quartile " + pct(r.top_quartile_fraction));
    } else {
        r.reason = "median percentile " + pct(*r.median_percentile) + " below threshold " +
                   pct(config.positive_percentile_threshold);
        log(LogLevel::WARNING, "Positive controls failed: " + r.reason +
                               ", top quartile " + pct(r.top_quartile_fraction));
    }

    return result;
}

// ============================================================================
// Negative controls
// ============================================================================

NegativeControlResult validate_negative_controls(const ScoredGeneSet& scored,
                                                 const std::vector<ReferenceGeneEntry>& reference,
                                                 const ValidationConfig& config) {
    log(LogLevel::INFO, "Validating negative controls (threshold " +
                        pct(config.negative_percentile_threshold) + ")");

    NegativeControlResult result;
    result.high_tier_threshold = config.high_tier_score;
    result.ranking = rank_reference_set(scored, reference, config, "housekeeping", false);
    result.ranking.percentile_threshold = config.negative_percentile_threshold;

    PercentileValidationResult& r = result.ranking;

    if (r.found_count == 0) {
        r.validation_passed = false;
        r.reason = no_genes_found_reason(r);
        log(LogLevel::ERROR, "Negative control validation failed: " + r.reason);
        return result;
    }

    auto percentiles = percentile_by_id(scored);
    for (const auto& detail : match_reference(scored, percentiles, reference)) {
        if (detail.composite_score >= config.high_tier_score) result.in_high_tier_count++;
    }

    // Inverted: housekeeping genes pass by ranking low
    r.validation_passed = *r.median_percentile < config.negative_percentile_threshold;

    if (r.validation_passed) {
        r.reason = "median percentile " + pct(*r.median_percentile) + " < " +
                   pct(config.negative_percentile_threshold);
        log(LogLevel::INFO, "Negative controls passed: " + std::to_string(r.found_count) + "/" +
                            std::to_string(r.expected_count) + " found, " + r.reason +
                            ", " + std::to_string(result.in_high_tier_count) + " in high tier");
    } else {
        r.reason = "median percentile " + pct(*r.median_percentile) + " at or above threshold " +
                   pct(config.negative_percentile_threshold);
        log(LogLevel::WARNING, "Negative controls failed: " + r.reason + ", " +
                               std::to_string(r.top_quartile_count) + " in top quartile, " +
                               std::to_string(result.in_high_tier_count) + " in high tier");
    }

    return result;
}

// ============================================================================
// Reports
// ============================================================================

std::string format_positive_control_report(const PositiveControlResult& result) {
    const PercentileValidationResult& r = result.ranking;
    std::ostringstream out;

    out << "Positive Control Validation: " << (r.validation_passed ? "PASSED" : "FAILED") << "\n\n";

    if (r.found_count == 0) {
        out << "Reason: " << r.reason << "\n";
        out << "Expected: " << r.expected_count << " known genes\n";
        out << "Found: 0 genes\n";
        return out.str();
    }

    out << "Summary:\n";
    out << "  Known genes expected: " << r.expected_count << "\n";
    out << "  Known genes found: " << r.found_count << "\n";
    out << "  Median percentile: " << pct(*r.median_percentile) << "\n";
    out << "  Top quartile count: " << r.top_quartile_count << "\n";
    out << "  Top quartile fraction: " << pct(r.top_quartile_fraction) << "\n\n";
    out << (r.validation_passed ? "Known genes rank highly: " : "Warning: known genes rank below threshold: ")
        << r.reason << "\n\n";

    out << "Recall@k (" << result.recall.present_count << "/" << result.recall.curated_count
        << " curated genes scored):\n";
    for (const auto* group : {&result.recall.absolute, &result.recall.percentage}) {
        for (const auto& entry : *group) {
            out << "  " << std::left << std::setw(10) << entry.label << std::right
                << " k=" << std::setw(5) << entry.k
                << "  recall " << std::setw(6) << pct(entry.recall)
                << "  of present " << (entry.recall_present ? pct(*entry.recall_present) : "N/A")
                << "\n";
        }
    }
    out << "\n";

    if (!result.per_source.empty()) {
        out << "Per-Source Breakdown:\n";
        for (const auto& sb : result.per_source) {
            out << "  " << std::left << std::setw(22) << sb.source << std::right
                << " " << sb.found_count << "/" << sb.expected_count
                << "  median " << (sb.median_percentile ? pct(*sb.median_percentile) : "N/A")
                << "  top quartile " << sb.top_quartile_count << "\n";
        }
        out << "\n";
    }

    out << "Top-Ranked Known Genes:\n";
    append_detail_table(out, r.per_gene_detail);

    return out.str();
}

std::string format_negative_control_report(const NegativeControlResult& result) {
    const PercentileValidationResult& r = result.ranking;
    std::ostringstream out;

    out << "Negative Control Validation: " << (r.validation_passed ? "PASSED" : "FAILED") << "\n\n";

    if (r.found_count == 0) {
        out << "Reason: " << r.reason << "\n";
        out << "Expected: " << r.expected_count << " housekeeping genes\n";
        out << "Found: 0 genes\n";
        return out.str();
    }

    out << "Summary:\n";
    out << "  Housekeeping genes expected: " << r.expected_count << "\n";
    out << "  Housekeeping genes found: " << r.found_count << "\n";
    out << "  Median percentile: " << pct(*r.median_percentile) << "\n";
    out << "  Top quartile count: " << r.top_quartile_count << "\n";
    out << "  High-tier count (score >= " << format_score(result.high_tier_threshold, 2) << "): "
        << result.in_high_tier_count << "\n\n";
    out << (r.validation_passed ? "Housekeeping genes rank low: "
                                : "Warning: housekeeping genes rank higher than expected: ")
        << r.reason << "\n\n";

    out << "Lowest-Ranked Housekeeping Genes:\n";
    append_detail_table(out, r.per_gene_detail);

    return out.str();
}

} // namespace genescore
