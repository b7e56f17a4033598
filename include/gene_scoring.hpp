/**
 * Gene Scoring - Multi-Evidence Composite Scoring
 *
 * Combines per-layer normalized evidence scores (each in [0,1] or missing)
 * into a single comparable confidence score per gene.
 *
 * Missing evidence is never treated as zero evidence: the composite score
 * is a weighted average over the layers that actually scored a gene, with
 * the weights renormalized over those layers only.
 */

#ifndef GENE_SCORING_HPP
#define GENE_SCORING_HPP

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <utility>

namespace genescore {

// Forward declarations
class EvidenceStore;

/**
 * Maximum allowed deviation of the weight total from 1.0
 */
constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

/**
 * Declarative join specification for one evidence layer.
 * The aggregator iterates over an ordered list of these; adding a layer
 * is a data change.
 */
struct LayerSpec {
    std::string name;           // Layer name (e.g., "gnomad", "expression")
    std::string key_column;     // Gene identifier column in the layer table
    std::string score_column;   // Normalized score column
};

/**
 * The six evidence layers in canonical order
 */
const std::vector<LayerSpec>& default_layer_specs();

/**
 * Get layer names from a join specification, in order
 */
std::vector<std::string> layer_names(const std::vector<LayerSpec>& specs);

/**
 * Immutable set of per-layer aggregation weights.
 *
 * Every instance satisfies the invariant: each weight in [0,1] and the
 * weights sum to 1.0 within WEIGHT_SUM_TOLERANCE. Construction throws
 * std::invalid_argument otherwise.
 */
class ScoringWeights {
public:
    /**
     * @param weights Ordered (layer name, weight) pairs
     */
    explicit ScoringWeights(std::vector<std::pair<std::string, double>> weights);

    /**
     * Default weights: gnomad 0.20, expression 0.20, annotation 0.15,
     * localization 0.15, animal_model 0.15, literature 0.15
     */
    static ScoringWeights defaults();

    /**
     * Get the weight of a layer
     * @throws std::invalid_argument if the layer is unknown
     */
    double get(const std::string& layer) const;

    bool has_layer(const std::string& layer) const;

    std::vector<std::string> layers() const;

    const std::vector<std::pair<std::string, double>>& entries() const { return weights_; }

    size_t size() const { return weights_.size(); }

    double sum() const;

    /**
     * Re-check the sum invariant
     * @throws std::invalid_argument if the total deviates from 1.0
     */
    void validate_sum() const;

    /**
     * Format as "layer=weight,..." (4 decimals)
     */
    std::string to_string() const;

    bool approx_equal(const ScoringWeights& other, double tolerance = 1e-9) const;

private:
    std::vector<std::pair<std::string, double>> weights_;
};

/**
 * Parse weights from "layer=value,layer=value" notation.
 * Layers not mentioned keep their value from base.
 * @throws std::invalid_argument on malformed input or an invalid result
 */
ScoringWeights parse_weights(const std::string& spec,
                             const ScoringWeights& base = ScoringWeights::defaults());

/**
 * Evidence-count based quality classification
 */
enum class QualityFlag {
    SUFFICIENT_EVIDENCE,    // >= 4 layers
    MODERATE_EVIDENCE,      // >= 2 layers
    SPARSE_EVIDENCE,        // >= 1 layer
    NO_EVIDENCE             // 0 layers
};

QualityFlag quality_flag_for(int evidence_count);

std::string quality_flag_to_string(QualityFlag flag);

/**
 * Gene identity from the universe table
 */
struct GeneIdentity {
    std::string gene_id;        // Ensembl gene ID
    std::string gene_symbol;    // HGNC symbol
};

/**
 * One gene joined against every evidence layer (unweighted)
 */
struct EvidenceRow {
    std::string gene_id;
    std::string gene_symbol;
    std::vector<std::optional<double>> layer_scores;  // Aligned to layer order
    int evidence_count = 0;
};

/**
 * Universe left-joined against all evidence layers
 */
struct JoinedEvidence {
    std::vector<std::string> layers;
    std::vector<EvidenceRow> rows;

    /**
     * Fraction of rows with an absent score in layer i
     */
    double null_rate(size_t layer_idx) const;

    double mean_evidence_count() const;
};

/**
 * Scored gene record
 */
struct ScoredGene {
    std::string gene_id;
    std::string gene_symbol;

    std::vector<std::optional<double>> layer_scores;          // Aligned to layer order
    std::vector<std::optional<double>> layer_contributions;   // score * weight, absent if score absent

    int evidence_count = 0;
    std::optional<double> composite_score;    // Absent iff evidence_count == 0
    QualityFlag quality_flag = QualityFlag::NO_EVIDENCE;

    bool has_score() const { return composite_score.has_value(); }
};

/**
 * Canonical scored-gene dataset produced by one aggregation run.
 *
 * Genes are ordered by composite score descending, absent scores last,
 * ties broken by gene_id ascending. The set is never mutated; a new run
 * produces a new set.
 */
class ScoredGeneSet {
public:
    ScoredGeneSet(std::vector<std::string> layers,
                  ScoringWeights weights,
                  std::vector<ScoredGene> genes);

    const std::vector<std::string>& layers() const { return layers_; }
    const ScoringWeights& weights() const { return weights_; }
    const std::vector<ScoredGene>& genes() const { return genes_; }

    size_t size() const { return genes_.size(); }

    /**
     * Number of genes with a present composite score
     */
    size_t scored_count() const { return scored_count_; }

    /**
     * Index of a layer, or -1 if the layer is not part of this set
     */
    int layer_index(const std::string& layer) const;

    const ScoredGene* find_by_id(const std::string& gene_id) const;

    /**
     * Highest-ranked gene carrying this symbol
     */
    const ScoredGene* find_by_symbol(const std::string& gene_symbol) const;

    /**
     * First n genes with a present composite score (fewer if not available)
     */
    std::vector<const ScoredGene*> top_scored(size_t n) const;

    std::map<QualityFlag, int> quality_distribution() const;

private:
    std::vector<std::string> layers_;
    ScoringWeights weights_;
    std::vector<ScoredGene> genes_;
    size_t scored_count_ = 0;
    std::unordered_map<std::string, size_t> id_index_;
    std::unordered_map<std::string, size_t> symbol_index_;
};

/**
 * Left-join the gene universe against every requested layer.
 * Genes absent from every layer are kept with evidence_count = 0.
 */
JoinedEvidence join_evidence_layers(
    const EvidenceStore& store,
    const std::vector<LayerSpec>& specs = default_layer_specs()
);

/**
 * Apply weights to already-joined evidence
 * @throws std::invalid_argument if the weights do not cover exactly the joined layers
 */
ScoredGeneSet score_joined_evidence(const JoinedEvidence& joined, const ScoringWeights& weights);

/**
 * Compute NULL-preserving weighted composite scores for the whole universe.
 *
 * composite = sum(score_l * w_l) / sum(w_l) over present layers l.
 * Weights are validated before the store is queried.
 *
 * @throws std::invalid_argument for invalid weights or a weight/layer mismatch
 * @throws std::runtime_error if the store query fails
 */
ScoredGeneSet compute_composite_scores(
    const EvidenceStore& store,
    const ScoringWeights& weights,
    const std::vector<LayerSpec>& specs = default_layer_specs()
);

/**
 * Format a score with fixed precision, "." when absent
 */
std::string format_score(const std::optional<double>& value, int precision = 4);

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace genescore

#endif // GENE_SCORING_HPP
