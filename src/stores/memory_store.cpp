/**
 * In-Memory Evidence Store
 *
 * Holds the gene universe, layer tables and reference lists in process.
 */

#include "evidence_store.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace genescore {

std::vector<ReferenceGeneEntry> load_reference_set(const EvidenceStore& store,
                                                   const std::string& set_name) {
    std::vector<ReferenceGeneEntry> entries = store.fetch_reference_genes(set_name);
    if (!entries.empty()) {
        log(LogLevel::DEBUG, "Using " + std::to_string(entries.size()) + " " + set_name +
                             " entries from " + store.name() + " store");
        return entries;
    }

    if (set_name == KNOWN_GENES_SET) return compile_known_genes();
    if (set_name == HOUSEKEEPING_GENES_SET) return compile_housekeeping_genes();

    log(LogLevel::WARNING, "No reference gene set named '" + set_name + "'");
    return {};
}

void InMemoryEvidenceStore::add_gene(const std::string& gene_id, const std::string& gene_symbol) {
    if (universe_index_.count(gene_id)) return;
    universe_index_[gene_id] = universe_.size();
    universe_.push_back({gene_id, gene_symbol});
}

void InMemoryEvidenceStore::add_layer(const std::string& layer) {
    layers_[layer];
}

void InMemoryEvidenceStore::set_score(const std::string& layer, const std::string& gene_id,
                                      std::optional<double> score) {
    if (score && !std::isfinite(*score)) score.reset();
    layers_[layer][gene_id] = score;
}

void InMemoryEvidenceStore::set_reference_genes(const std::string& set_name,
                                                std::vector<ReferenceGeneEntry> entries) {
    references_[set_name] = std::move(entries);
}

std::vector<GeneIdentity> InMemoryEvidenceStore::gene_universe() const {
    return universe_;
}

LayerScores InMemoryEvidenceStore::fetch_layer_scores(
    const LayerSpec& spec,
    const std::vector<std::string>& gene_ids
) const {
    auto layer_it = layers_.find(spec.name);
    if (layer_it == layers_.end()) {
        throw std::runtime_error("Evidence layer table not found: " + spec.name);
    }

    LayerScores result;
    for (const auto& gene_id : gene_ids) {
        auto it = layer_it->second.find(gene_id);
        if (it != layer_it->second.end()) {
            result[gene_id] = it->second;
        }
    }
    return result;
}

std::vector<ReferenceGeneEntry> InMemoryEvidenceStore::fetch_reference_genes(
    const std::string& set_name
) const {
    auto it = references_.find(set_name);
    if (it == references_.end()) return {};
    return it->second;
}

std::string InMemoryEvidenceStore::get_stats() const {
    std::ostringstream oss;
    oss << "genes=" << universe_.size() << ", layers=" << layers_.size();
    for (const auto& [name, scores] : layers_) {
        oss << ", " << name << "=" << scores.size();
    }
    return oss.str();
}

} // namespace genescore
