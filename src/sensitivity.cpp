/**
 * Sensitivity Analysis - Implementation
 */

#include "sensitivity.hpp"
#include "evidence_store.hpp"
#include "file_parsers.hpp"
#include "stat_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace genescore {

namespace {

std::string format_delta(double delta) {
    std::ostringstream oss;
    oss << std::showpos << std::fixed << std::setprecision(2) << delta;
    return oss.str();
}

} // anonymous namespace

std::vector<double> parse_deltas(const std::string& spec) {
    std::vector<double> deltas;
    for (const auto& token : split_line(spec, ',')) {
        std::string value = trim(token);
        if (value.empty()) continue;
        auto parsed = parse_score_cell(value);
        if (!parsed) {
            throw std::invalid_argument("Invalid perturbation delta '" + value + "'");
        }
        deltas.push_back(*parsed);
    }
    if (deltas.empty()) {
        throw std::invalid_argument("No perturbation deltas given in '" + spec + "'");
    }
    return deltas;
}

ScoringWeights perturb_weight(const ScoringWeights& baseline, const std::string& layer, double delta) {
    if (!baseline.has_layer(layer)) {
        std::ostringstream oss;
        oss << "Invalid layer '" << layer << "' for perturbation. Must be one of: ";
        const auto names = baseline.layers();
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << names[i];
        }
        throw std::invalid_argument(oss.str());
    }

    std::vector<std::pair<std::string, double>> weights = baseline.entries();
    for (auto& [name, weight] : weights) {
        if (name == layer) {
            weight = std::max(0.0, std::min(1.0, weight + delta));
        }
    }

    double total = 0.0;
    for (const auto& entry : weights) total += entry.second;

    if (total > 0.0) {
        for (auto& entry : weights) entry.second /= total;
    } else {
        double uniform = 1.0 / weights.size();
        for (auto& entry : weights) entry.second = uniform;
    }

    return ScoringWeights(std::move(weights));
}

TopNComparison compare_top_n(const ScoredGeneSet& baseline,
                             const ScoredGeneSet& perturbed,
                             size_t top_n,
                             size_t min_overlap) {
    TopNComparison comparison;

    // First (highest) occurrence of each symbol in the perturbed top N
    std::unordered_map<std::string, double> perturbed_scores;
    for (const ScoredGene* gene : perturbed.top_scored(top_n)) {
        perturbed_scores.emplace(gene->gene_symbol, *gene->composite_score);
    }

    std::vector<double> x;
    std::vector<double> y;
    std::set<std::string> seen;
    for (const ScoredGene* gene : baseline.top_scored(top_n)) {
        if (!seen.insert(gene->gene_symbol).second) continue;
        auto it = perturbed_scores.find(gene->gene_symbol);
        if (it == perturbed_scores.end()) continue;
        x.push_back(*gene->composite_score);
        y.push_back(it->second);
    }

    comparison.overlap_count = x.size();
    if (comparison.overlap_count < min_overlap) return comparison;

    comparison.spearman_rho = spearman_correlation(x, y);
    if (comparison.spearman_rho) {
        comparison.spearman_pval = correlation_p_value(*comparison.spearman_rho, comparison.overlap_count);
    }
    return comparison;
}

SensitivityResult run_sensitivity_analysis(const EvidenceStore& store,
                                           const ScoringWeights& baseline_weights,
                                           const SensitivityConfig& config,
                                           const std::vector<LayerSpec>& specs) {
    std::vector<std::string> layers = layer_names(specs);

    // Reject unknown layers before any aggregation run
    for (const auto& layer : layers) {
        if (!baseline_weights.has_layer(layer)) {
            throw std::invalid_argument("No scoring weight for evidence layer '" + layer + "'");
        }
    }

    log(LogLevel::INFO, "Sensitivity analysis: " + std::to_string(layers.size() * config.deltas.size()) +
                        " perturbations, top_n=" + std::to_string(config.top_n) +
                        ", baseline " + baseline_weights.to_string());

    SensitivityResult result{baseline_weights, {}, config.top_n, config.min_overlap,
                             config.stability_threshold};

    ScoredGeneSet baseline = compute_composite_scores(store, baseline_weights, specs);

    for (const auto& layer : layers) {
        for (double delta : config.deltas) {
            ScoringWeights perturbed_weights = perturb_weight(baseline_weights, layer, delta);
            ScoredGeneSet perturbed = compute_composite_scores(store, perturbed_weights, specs);

            TopNComparison cmp = compare_top_n(baseline, perturbed, config.top_n, config.min_overlap);

            SensitivityPerturbation p{layer, delta, perturbed_weights, cmp.spearman_rho,
                                      cmp.spearman_pval, cmp.overlap_count, false};
            p.stable = p.spearman_rho && *p.spearman_rho >= config.stability_threshold;

            if (cmp.overlap_count < config.min_overlap) {
                log(LogLevel::WARNING, "Perturbation " + layer + " " + format_delta(delta) +
                                       ": insufficient overlap for Spearman correlation (" +
                                       std::to_string(cmp.overlap_count) + " < " +
                                       std::to_string(config.min_overlap) + ")");
            } else if (!cmp.spearman_rho) {
                log(LogLevel::WARNING, "Perturbation " + layer + " " + format_delta(delta) +
                                       ": correlation undefined (zero variance in top genes)");
            }

            log(LogLevel::INFO, "Perturbation " + layer + " " + format_delta(delta) +
                                ": rho=" + format_score(p.spearman_rho) +
                                " p=" + format_p_value(p.spearman_pval) +
                                " overlap=" + std::to_string(p.overlap_count) +
                                (p.has_rho() ? (p.stable ? " stable" : " unstable") : ""));

            result.perturbations.push_back(std::move(p));
        }
    }

    log(LogLevel::INFO, "Sensitivity analysis complete: " +
                        std::to_string(result.perturbations.size()) + " perturbations");

    return result;
}

SensitivitySummary summarize_sensitivity(const SensitivityResult& result) {
    SensitivitySummary summary;
    summary.total_perturbations = result.perturbations.size();
    summary.stability_threshold = result.stability_threshold;

    std::vector<double> rhos;
    std::vector<std::string> layer_order;
    for (const auto& p : result.perturbations) {
        if (std::find(layer_order.begin(), layer_order.end(), p.layer) == layer_order.end()) {
            layer_order.push_back(p.layer);
        }
        if (!p.spearman_rho) continue;
        rhos.push_back(*p.spearman_rho);
        if (*p.spearman_rho >= result.stability_threshold) {
            summary.stable_count++;
        } else {
            summary.unstable_count++;
        }
    }
    summary.defined_count = rhos.size();

    for (const auto& layer : layer_order) {
        LayerSensitivity ls;
        ls.layer = layer;
        std::vector<double> layer_rhos;
        for (const auto& p : result.perturbations) {
            if (p.layer == layer && p.spearman_rho) layer_rhos.push_back(*p.spearman_rho);
        }
        ls.defined_count = layer_rhos.size();
        if (!layer_rhos.empty()) ls.mean_rho = mean(layer_rhos);
        summary.per_layer.push_back(ls);
    }

    if (rhos.empty()) {
        summary.overall_stable = false;
        summary.reason = "no perturbation produced a defined correlation";
        return summary;
    }

    summary.min_rho = *std::min_element(rhos.begin(), rhos.end());
    summary.max_rho = *std::max_element(rhos.begin(), rhos.end());
    summary.mean_rho = mean(rhos);
    summary.overall_stable = summary.unstable_count == 0;

    const LayerSensitivity* most_sensitive = nullptr;
    const LayerSensitivity* most_robust = nullptr;
    for (const auto& ls : summary.per_layer) {
        if (!ls.mean_rho) continue;
        if (!most_sensitive || *ls.mean_rho < *most_sensitive->mean_rho) most_sensitive = &ls;
        if (!most_robust || *ls.mean_rho > *most_robust->mean_rho) most_robust = &ls;
    }
    if (most_sensitive) summary.most_sensitive_layer = most_sensitive->layer;
    if (most_robust) summary.most_robust_layer = most_robust->layer;

    std::ostringstream reason;
    if (summary.overall_stable) {
        reason << "all " << summary.defined_count << " defined correlations >= "
               << format_score(result.stability_threshold, 2);
    } else {
        reason << summary.unstable_count << " of " << summary.defined_count
               << " defined correlations below " << format_score(result.stability_threshold, 2);
    }
    summary.reason = reason.str();

    return summary;
}

std::string format_p_value(const std::optional<double>& pval) {
    if (!pval) return "N/A";
    std::ostringstream oss;
    oss << std::setprecision(3) << *pval;
    return oss.str();
}

SensitivitySummary skipped_sensitivity_summary(const std::string& reason) {
    SensitivitySummary summary;
    summary.skipped = true;
    summary.overall_stable = true;
    summary.reason = reason;
    return summary;
}

std::string format_sensitivity_report(const SensitivityResult& result,
                                      const SensitivitySummary& summary) {
    std::ostringstream out;
    std::string threshold = format_score(summary.stability_threshold, 2);

    if (summary.skipped) {
        out << "Sensitivity Analysis: SKIPPED\n\nReason: " << summary.reason << "\n";
        return out.str();
    }

    out << "Sensitivity Analysis: " << (summary.overall_stable ? "STABLE" : "UNSTABLE") << "\n\n";
    out << "Summary:\n";
    out << "  Total perturbations: " << summary.total_perturbations << "\n";
    out << "  Stable perturbations: " << summary.stable_count << " (rho >= " << threshold << ")\n";
    out << "  Unstable perturbations: " << summary.unstable_count << "\n";
    out << "  Undefined correlations: " << summary.total_perturbations - summary.defined_count << "\n";
    out << "  Mean Spearman rho: " << (summary.mean_rho ? format_score(summary.mean_rho) : "N/A") << "\n";
    if (summary.min_rho && summary.max_rho) {
        out << "  Range: [" << format_score(summary.min_rho) << ", " << format_score(summary.max_rho) << "]\n";
    } else {
        out << "  Range: N/A\n";
    }
    out << "\n";

    if (summary.overall_stable) {
        out << "All weight perturbations produce stable rankings (rho >= " << threshold << ").\n";
    } else {
        out << "Warning: " << summary.reason << ". Results may be sensitive to weight choices.\n";
    }

    if (summary.most_sensitive_layer && summary.most_robust_layer) {
        out << "\n  Most sensitive layer: " << *summary.most_sensitive_layer << "\n";
        out << "  Most robust layer: " << *summary.most_robust_layer << "\n";
    }

    out << "\nPerturbation Results:\n";
    out << std::string(80, '-') << "\n";
    out << std::left << std::setw(15) << "Layer" << std::right
        << std::setw(8) << "Delta" << std::setw(14) << "Spearman rho"
        << std::setw(12) << "p-value"
        << std::setw(10) << "Overlap" << std::setw(10) << "Stable?" << "\n";
    out << std::string(80, '-') << "\n";

    for (const auto& p : result.perturbations) {
        std::string rho = p.spearman_rho ? format_score(p.spearman_rho) : "N/A";
        std::string stable = p.spearman_rho ? (p.stable ? "yes" : "no") : "N/A";
        out << std::left << std::setw(15) << p.layer << std::right
            << std::setw(8) << format_delta(p.delta)
            << std::setw(14) << rho
            << std::setw(12) << format_p_value(p.spearman_pval)
            << std::setw(10) << p.overlap_count
            << std::setw(10) << stable << "\n";
    }

    return out.str();
}

} // namespace genescore
