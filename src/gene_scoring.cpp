/**
 * Gene Scoring - Multi-Evidence Composite Scoring
 */

#include "gene_scoring.hpp"
#include "evidence_store.hpp"
#include "file_parsers.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <set>
#include <stdexcept>

namespace genescore {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::cerr << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// Layer specs
// ============================================================================

const std::vector<LayerSpec>& default_layer_specs() {
    static const std::vector<LayerSpec> specs = {
        {"gnomad",       "gene_id", "loeuf_normalized"},
        {"expression",   "gene_id", "expression_score_normalized"},
        {"annotation",   "gene_id", "annotation_score_normalized"},
        {"localization", "gene_id", "localization_score_normalized"},
        {"animal_model", "gene_id", "animal_model_score_normalized"},
        {"literature",   "gene_id", "literature_score_normalized"},
    };
    return specs;
}

std::vector<std::string> layer_names(const std::vector<LayerSpec>& specs) {
    std::vector<std::string> names;
    names.reserve(specs.size());
    for (const auto& spec : specs) {
        names.push_back(spec.name);
    }
    return names;
}

std::string format_score(const std::optional<double>& value, int precision) {
    if (!value) return ".";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << *value;
    return oss.str();
}

// ============================================================================
// ScoringWeights
// ============================================================================

ScoringWeights::ScoringWeights(std::vector<std::pair<std::string, double>> weights)
    : weights_(std::move(weights)) {

    if (weights_.empty()) {
        throw std::invalid_argument("Scoring weights must name at least one layer");
    }

    std::set<std::string> seen;
    for (const auto& [layer, weight] : weights_) {
        if (layer.empty()) {
            throw std::invalid_argument("Scoring weight has an empty layer name");
        }
        if (!seen.insert(layer).second) {
            throw std::invalid_argument("Duplicate scoring weight for layer '" + layer + "'");
        }
        if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
            std::ostringstream oss;
            oss << "Scoring weight for '" << layer << "' must be in [0, 1], got " << weight;
            throw std::invalid_argument(oss.str());
        }
    }

    validate_sum();
}

ScoringWeights ScoringWeights::defaults() {
    return ScoringWeights({
        {"gnomad",       0.20},
        {"expression",   0.20},
        {"annotation",   0.15},
        {"localization", 0.15},
        {"animal_model", 0.15},
        {"literature",   0.15},
    });
}

double ScoringWeights::get(const std::string& layer) const {
    for (const auto& [name, weight] : weights_) {
        if (name == layer) return weight;
    }
    throw std::invalid_argument("Unknown evidence layer '" + layer + "'");
}

bool ScoringWeights::has_layer(const std::string& layer) const {
    for (const auto& entry : weights_) {
        if (entry.first == layer) return true;
    }
    return false;
}

std::vector<std::string> ScoringWeights::layers() const {
    std::vector<std::string> names;
    names.reserve(weights_.size());
    for (const auto& entry : weights_) {
        names.push_back(entry.first);
    }
    return names;
}

double ScoringWeights::sum() const {
    double total = 0.0;
    for (const auto& entry : weights_) {
        total += entry.second;
    }
    return total;
}

void ScoringWeights::validate_sum() const {
    double total = sum();
    if (std::fabs(total - 1.0) > WEIGHT_SUM_TOLERANCE) {
        std::ostringstream oss;
        oss << "Scoring weights must sum to 1.0, got " << std::fixed << std::setprecision(6) << total;
        throw std::invalid_argument(oss.str());
    }
}

std::string ScoringWeights::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    for (size_t i = 0; i < weights_.size(); ++i) {
        if (i > 0) oss << ",";
        oss << weights_[i].first << "=" << weights_[i].second;
    }
    return oss.str();
}

bool ScoringWeights::approx_equal(const ScoringWeights& other, double tolerance) const {
    if (weights_.size() != other.weights_.size()) return false;
    for (size_t i = 0; i < weights_.size(); ++i) {
        if (weights_[i].first != other.weights_[i].first) return false;
        if (std::fabs(weights_[i].second - other.weights_[i].second) > tolerance) return false;
    }
    return true;
}

ScoringWeights parse_weights(const std::string& spec, const ScoringWeights& base) {
    std::vector<std::pair<std::string, double>> weights = base.entries();

    std::istringstream iss(spec);
    std::string token;

    while (std::getline(iss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t eq = token.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Invalid weight '" + token + "', expected LAYER=VALUE");
        }

        std::string layer = trim(token.substr(0, eq));
        auto value = parse_score_cell(token.substr(eq + 1));
        if (!value) {
            throw std::invalid_argument("Invalid weight value in '" + token + "'");
        }

        auto it = std::find_if(weights.begin(), weights.end(),
            [&layer](const std::pair<std::string, double>& w) { return w.first == layer; });
        if (it == weights.end()) {
            throw std::invalid_argument("Unknown evidence layer '" + layer + "' in weights");
        }
        it->second = *value;
    }

    return ScoringWeights(std::move(weights));
}

// ============================================================================
// Quality flags
// ============================================================================

QualityFlag quality_flag_for(int evidence_count) {
    if (evidence_count >= 4) return QualityFlag::SUFFICIENT_EVIDENCE;
    if (evidence_count >= 2) return QualityFlag::MODERATE_EVIDENCE;
    if (evidence_count >= 1) return QualityFlag::SPARSE_EVIDENCE;
    return QualityFlag::NO_EVIDENCE;
}

std::string quality_flag_to_string(QualityFlag flag) {
    switch (flag) {
        case QualityFlag::SUFFICIENT_EVIDENCE: return "sufficient_evidence";
        case QualityFlag::MODERATE_EVIDENCE:   return "moderate_evidence";
        case QualityFlag::SPARSE_EVIDENCE:     return "sparse_evidence";
        case QualityFlag::NO_EVIDENCE:         return "no_evidence";
        default: return "unknown";
    }
}

// ============================================================================
// JoinedEvidence
// ============================================================================

double JoinedEvidence::null_rate(size_t layer_idx) const {
    if (rows.empty()) return 0.0;
    size_t missing = 0;
    for (const auto& row : rows) {
        if (layer_idx >= row.layer_scores.size() || !row.layer_scores[layer_idx]) {
            missing++;
        }
    }
    return static_cast<double>(missing) / rows.size();
}

double JoinedEvidence::mean_evidence_count() const {
    if (rows.empty()) return 0.0;
    double total = 0.0;
    for (const auto& row : rows) {
        total += row.evidence_count;
    }
    return total / rows.size();
}

// ============================================================================
// ScoredGeneSet
// ============================================================================

ScoredGeneSet::ScoredGeneSet(std::vector<std::string> layers,
                             ScoringWeights weights,
                             std::vector<ScoredGene> genes)
    : layers_(std::move(layers)), weights_(std::move(weights)), genes_(std::move(genes)) {

    // Composite descending, absent last, gene_id ascending on ties
    std::sort(genes_.begin(), genes_.end(),
        [](const ScoredGene& a, const ScoredGene& b) {
            if (a.composite_score.has_value() != b.composite_score.has_value()) {
                return a.composite_score.has_value();
            }
            if (a.composite_score && *a.composite_score != *b.composite_score) {
                return *a.composite_score > *b.composite_score;
            }
            return a.gene_id < b.gene_id;
        });

    for (size_t i = 0; i < genes_.size(); ++i) {
        if (genes_[i].has_score()) scored_count_++;
        id_index_.emplace(genes_[i].gene_id, i);
        symbol_index_.emplace(genes_[i].gene_symbol, i);  // keeps first (highest ranked)
    }
}

int ScoredGeneSet::layer_index(const std::string& layer) const {
    for (size_t i = 0; i < layers_.size(); ++i) {
        if (layers_[i] == layer) return static_cast<int>(i);
    }
    return -1;
}

const ScoredGene* ScoredGeneSet::find_by_id(const std::string& gene_id) const {
    auto it = id_index_.find(gene_id);
    if (it == id_index_.end()) return nullptr;
    return &genes_[it->second];
}

const ScoredGene* ScoredGeneSet::find_by_symbol(const std::string& gene_symbol) const {
    auto it = symbol_index_.find(gene_symbol);
    if (it == symbol_index_.end()) return nullptr;
    return &genes_[it->second];
}

std::vector<const ScoredGene*> ScoredGeneSet::top_scored(size_t n) const {
    std::vector<const ScoredGene*> result;
    size_t limit = std::min(n, scored_count_);
    result.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        result.push_back(&genes_[i]);
    }
    return result;
}

std::map<QualityFlag, int> ScoredGeneSet::quality_distribution() const {
    std::map<QualityFlag, int> dist;
    for (const auto& gene : genes_) {
        dist[gene.quality_flag]++;
    }
    return dist;
}

// ============================================================================
// Aggregation
// ============================================================================

JoinedEvidence join_evidence_layers(const EvidenceStore& store,
                                    const std::vector<LayerSpec>& specs) {
    JoinedEvidence joined;
    joined.layers = layer_names(specs);

    std::vector<GeneIdentity> universe = store.gene_universe();

    std::vector<std::string> gene_ids;
    gene_ids.reserve(universe.size());
    for (const auto& gene : universe) {
        gene_ids.push_back(gene.gene_id);
    }

    joined.rows.reserve(universe.size());
    for (const auto& gene : universe) {
        EvidenceRow row;
        row.gene_id = gene.gene_id;
        row.gene_symbol = gene.gene_symbol;
        row.layer_scores.assign(specs.size(), std::nullopt);
        joined.rows.push_back(std::move(row));
    }

    for (size_t l = 0; l < specs.size(); ++l) {
        LayerScores scores = store.fetch_layer_scores(specs[l], gene_ids);

        for (auto& row : joined.rows) {
            auto it = scores.find(row.gene_id);
            if (it != scores.end() && it->second) {
                row.layer_scores[l] = it->second;
                row.evidence_count++;
            }
        }
    }

    std::ostringstream null_rates;
    null_rates << std::fixed << std::setprecision(1);
    for (size_t l = 0; l < joined.layers.size(); ++l) {
        if (l > 0) null_rates << ", ";
        null_rates << joined.layers[l] << "=" << joined.null_rate(l) * 100.0 << "%";
    }

    std::ostringstream msg;
    msg << "Joined evidence layers from " << store.name() << " store: "
        << joined.rows.size() << " genes, mean evidence count "
        << std::fixed << std::setprecision(2) << joined.mean_evidence_count()
        << ", null rates {" << null_rates.str() << "}";
    log(LogLevel::INFO, msg.str());

    return joined;
}

/**
 * Check that the weights cover exactly the given layers
 */
static void check_weight_coverage(const std::vector<std::string>& layers,
                                  const ScoringWeights& weights) {
    for (const auto& layer : layers) {
        if (!weights.has_layer(layer)) {
            throw std::invalid_argument("No scoring weight for evidence layer '" + layer + "'");
        }
    }
    for (const auto& layer : weights.layers()) {
        if (std::find(layers.begin(), layers.end(), layer) == layers.end()) {
            throw std::invalid_argument("Scoring weight names unknown evidence layer '" + layer + "'");
        }
    }
}

ScoredGeneSet score_joined_evidence(const JoinedEvidence& joined, const ScoringWeights& weights) {
    weights.validate_sum();
    check_weight_coverage(joined.layers, weights);

    std::vector<double> layer_weights;
    layer_weights.reserve(joined.layers.size());
    for (const auto& layer : joined.layers) {
        layer_weights.push_back(weights.get(layer));
    }

    std::vector<ScoredGene> genes;
    genes.reserve(joined.rows.size());

    for (const auto& row : joined.rows) {
        ScoredGene gene;
        gene.gene_id = row.gene_id;
        gene.gene_symbol = row.gene_symbol;
        gene.layer_scores = row.layer_scores;
        gene.layer_contributions.assign(row.layer_scores.size(), std::nullopt);

        double weighted_sum = 0.0;
        double available_weight = 0.0;
        double plain_sum = 0.0;
        int count = 0;

        for (size_t l = 0; l < row.layer_scores.size(); ++l) {
            if (!row.layer_scores[l]) continue;
            double score = *row.layer_scores[l];
            double contribution = score * layer_weights[l];
            gene.layer_contributions[l] = contribution;
            weighted_sum += contribution;
            available_weight += layer_weights[l];
            plain_sum += score;
            count++;
        }

        gene.evidence_count = count;
        gene.quality_flag = quality_flag_for(count);

        if (count == 1) {
            // Weight cancels out of a single-layer average
            for (const auto& score : row.layer_scores) {
                if (score) gene.composite_score = *score;
            }
        } else if (count > 1) {
            if (available_weight > 0.0) {
                gene.composite_score = weighted_sum / available_weight;
            } else {
                // Every present layer carries zero weight: equal-weight limit
                gene.composite_score = plain_sum / count;
            }
        }

        genes.push_back(std::move(gene));
    }

    return ScoredGeneSet(joined.layers, weights, std::move(genes));
}

ScoredGeneSet compute_composite_scores(const EvidenceStore& store,
                                       const ScoringWeights& weights,
                                       const std::vector<LayerSpec>& specs) {
    // Fail fast before any store query
    weights.validate_sum();
    check_weight_coverage(layer_names(specs), weights);

    JoinedEvidence joined = join_evidence_layers(store, specs);
    ScoredGeneSet scored = score_joined_evidence(joined, weights);

    std::vector<double> present;
    present.reserve(scored.scored_count());
    for (const auto& gene : scored.genes()) {
        if (gene.composite_score) present.push_back(*gene.composite_score);
    }

    std::ostringstream msg;
    msg << "Composite scores computed: " << scored.size() << " genes, "
        << scored.scored_count() << " with score";
    if (!scored.genes().empty()) {
        msg << " (" << std::fixed << std::setprecision(1)
            << 100.0 * scored.scored_count() / scored.size() << "% coverage)";
    }
    if (!present.empty()) {
        double total = 0.0;
        for (double v : present) total += v;
        msg << ", mean " << std::setprecision(4) << total / present.size();
    }
    msg << "; quality:";
    for (const auto& [flag, count] : scored.quality_distribution()) {
        msg << " " << quality_flag_to_string(flag) << "=" << count;
    }
    msg << "; weights " << weights.to_string();
    log(LogLevel::INFO, msg.str());

    return scored;
}

} // namespace genescore
