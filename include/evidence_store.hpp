/**
 * Evidence Store Interface
 *
 * Narrow query interface over the per-layer evidence tables. The
 * aggregator, QC and validators only ever see this interface, never a
 * concrete storage back end.
 */

#ifndef EVIDENCE_STORE_HPP
#define EVIDENCE_STORE_HPP

#include "gene_scoring.hpp"
#include "reference_genes.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>

namespace genescore {

/**
 * Present/absent scores keyed by gene_id.
 * A missing key and an empty optional both mean "absent".
 */
using LayerScores = std::unordered_map<std::string, std::optional<double>>;

/**
 * Abstract base class for evidence stores
 */
class EvidenceStore {
public:
    virtual ~EvidenceStore() = default;

    /**
     * Get the store name (for logging)
     */
    virtual std::string name() const = 0;

    /**
     * Get the gene universe in table order
     */
    virtual std::vector<GeneIdentity> gene_universe() const = 0;

    /**
     * Fetch scores of one layer for a set of genes
     * @param spec Layer join specification (key and score column)
     * @param gene_ids Genes to look up
     * @return Scores for the requested genes that have a row in the layer
     * @throws std::runtime_error if the layer cannot be queried
     */
    virtual LayerScores fetch_layer_scores(
        const LayerSpec& spec,
        const std::vector<std::string>& gene_ids
    ) const = 0;

    /**
     * Fetch a reference gene list stored alongside the evidence
     * @return Entries, or empty if the store holds no such list
     */
    virtual std::vector<ReferenceGeneEntry> fetch_reference_genes(
        const std::string& set_name
    ) const {
        (void)set_name;
        return {};
    }

    /**
     * Get stats string
     */
    virtual std::string get_stats() const { return ""; }
};

/**
 * Reference list from the store, or the built-in list when the store has none
 */
std::vector<ReferenceGeneEntry> load_reference_set(const EvidenceStore& store,
                                                   const std::string& set_name);

// ============================================================================
// In-memory store
// ============================================================================

/**
 * Evidence store held entirely in memory.
 * Used by embedding callers and tests.
 */
class InMemoryEvidenceStore : public EvidenceStore {
public:
    InMemoryEvidenceStore() = default;

    std::string name() const override { return "memory"; }

    /**
     * Add a gene to the universe (duplicate gene_ids are ignored)
     */
    void add_gene(const std::string& gene_id, const std::string& gene_symbol);

    /**
     * Declare a layer table, possibly empty
     */
    void add_layer(const std::string& layer);

    /**
     * Set a layer row. An empty optional or a non-finite value stores an
     * explicit NULL.
     */
    void set_score(const std::string& layer, const std::string& gene_id,
                   std::optional<double> score);

    void set_reference_genes(const std::string& set_name,
                             std::vector<ReferenceGeneEntry> entries);

    std::vector<GeneIdentity> gene_universe() const override;

    LayerScores fetch_layer_scores(
        const LayerSpec& spec,
        const std::vector<std::string>& gene_ids
    ) const override;

    std::vector<ReferenceGeneEntry> fetch_reference_genes(
        const std::string& set_name
    ) const override;

    std::string get_stats() const override;

private:
    std::vector<GeneIdentity> universe_;
    std::unordered_map<std::string, size_t> universe_index_;
    std::map<std::string, LayerScores> layers_;
    std::map<std::string, std::vector<ReferenceGeneEntry>> references_;
};

// ============================================================================
// Tab-separated file store
// ============================================================================

/**
 * Evidence store backed by tab-separated tables, one per layer.
 *
 * Each table has a header row naming its columns. Files ending in .gz are
 * read through zlib. Score cells "NA", ".", "NaN" or empty are absent.
 *
 * The universe table needs "gene_id" and "gene_symbol" columns; reference
 * tables need "gene_symbol" and optionally "source" and "confidence".
 */
class TsvEvidenceStore : public EvidenceStore {
public:
    /**
     * @param universe_path Path to the gene universe table
     * @throws std::runtime_error if the universe table cannot be read
     */
    explicit TsvEvidenceStore(const std::string& universe_path);
    ~TsvEvidenceStore();

    // Prevent copying
    TsvEvidenceStore(const TsvEvidenceStore&) = delete;
    TsvEvidenceStore& operator=(const TsvEvidenceStore&) = delete;

    std::string name() const override { return "tsv"; }

    /**
     * Register the table holding one layer (read lazily on first query)
     */
    void add_layer_table(const std::string& layer, const std::string& path);

    /**
     * Register a reference gene table under a set name
     * @throws std::runtime_error if the table cannot be read
     */
    void add_reference_table(const std::string& set_name, const std::string& path);

    std::vector<GeneIdentity> gene_universe() const override;

    LayerScores fetch_layer_scores(
        const LayerSpec& spec,
        const std::vector<std::string>& gene_ids
    ) const override;

    std::vector<ReferenceGeneEntry> fetch_reference_genes(
        const std::string& set_name
    ) const override;

    std::string get_stats() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace genescore

#endif // EVIDENCE_STORE_HPP
