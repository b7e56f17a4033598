/**
 * Tab-Separated Evidence Store
 *
 * One table per evidence layer plus a gene universe table. Layer tables
 * are read on first query and cached for subsequent aggregation runs.
 */

#include "evidence_store.hpp"
#include "file_parsers.hpp"
#include <sstream>
#include <mutex>
#include <set>
#include <stdexcept>

namespace genescore {

struct TsvEvidenceStore::Impl {
    std::string universe_path;
    std::vector<GeneIdentity> universe;
    std::map<std::string, std::string> layer_paths;
    std::map<std::string, std::vector<ReferenceGeneEntry>> references;

    mutable std::mutex mutex;
    mutable std::map<std::string, LayerScores> cache;

    // Caller holds mutex; the reference is valid only while it is held
    const LayerScores& load_layer(const LayerSpec& spec) const;
};

const LayerScores& TsvEvidenceStore::Impl::load_layer(const LayerSpec& spec) const {
    auto cached = cache.find(spec.name);
    if (cached != cache.end()) return cached->second;

    auto path_it = layer_paths.find(spec.name);
    if (path_it == layer_paths.end()) {
        throw std::runtime_error("No table registered for evidence layer '" + spec.name + "'");
    }

    log(LogLevel::INFO, "Loading " + spec.name + " evidence from: " + path_it->second);

    DelimitedTableReader reader(path_it->second);
    int key_idx = reader.require_column(spec.key_column);
    int score_idx = reader.require_column(spec.score_column);

    LayerScores scores;
    size_t unparsable = 0;
    size_t present = 0;
    std::vector<std::string> fields;

    while (reader.next(fields)) {
        std::string gene_id = trim(fields[key_idx]);
        if (gene_id.empty()) continue;

        const std::string& cell = fields[score_idx];
        auto value = parse_score_cell(cell);
        if (!value && !is_missing_cell(cell)) {
            unparsable++;
        }
        if (value) present++;

        // First row for a gene wins
        scores.emplace(gene_id, value);
    }

    if (unparsable > 0) {
        log(LogLevel::DEBUG, spec.name + ": " + std::to_string(unparsable) +
                             " unparsable score cells treated as absent");
    }
    log(LogLevel::INFO, spec.name + " loaded " + std::to_string(scores.size()) +
                        " genes (" + std::to_string(present) + " with score)");

    return cache.emplace(spec.name, std::move(scores)).first->second;
}

TsvEvidenceStore::TsvEvidenceStore(const std::string& universe_path)
    : pimpl_(std::make_unique<Impl>()) {

    pimpl_->universe_path = universe_path;

    DelimitedTableReader reader(universe_path);
    int id_idx = reader.require_column("gene_id");
    int symbol_idx = reader.require_column("gene_symbol");

    std::set<std::string> seen;
    std::vector<std::string> fields;
    while (reader.next(fields)) {
        std::string gene_id = trim(fields[id_idx]);
        if (gene_id.empty() || !seen.insert(gene_id).second) continue;
        pimpl_->universe.push_back({gene_id, trim(fields[symbol_idx])});
    }

    log(LogLevel::INFO, "Gene universe loaded: " + std::to_string(pimpl_->universe.size()) +
                        " genes from " + universe_path);
}

TsvEvidenceStore::~TsvEvidenceStore() = default;

void TsvEvidenceStore::add_layer_table(const std::string& layer, const std::string& path) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->layer_paths[layer] = path;
    pimpl_->cache.erase(layer);
}

void TsvEvidenceStore::add_reference_table(const std::string& set_name, const std::string& path) {
    DelimitedTableReader reader(path);
    int symbol_idx = reader.require_column("gene_symbol");
    int source_idx = reader.column_index("source");
    int confidence_idx = reader.column_index("confidence");

    std::vector<ReferenceGeneEntry> entries;
    std::vector<std::string> fields;
    while (reader.next(fields)) {
        ReferenceGeneEntry entry;
        entry.gene_symbol = trim(fields[symbol_idx]);
        if (entry.gene_symbol.empty()) continue;

        entry.source = source_idx >= 0 ? trim(fields[source_idx]) : "";
        if (entry.source.empty()) entry.source = set_name;
        if (confidence_idx >= 0 && !trim(fields[confidence_idx]).empty()) {
            entry.confidence = trim(fields[confidence_idx]);
        }
        entries.push_back(std::move(entry));
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(entries.size()) + " " + set_name +
                        " entries from " + path);
    pimpl_->references[set_name] = std::move(entries);
}

std::vector<GeneIdentity> TsvEvidenceStore::gene_universe() const {
    return pimpl_->universe;
}

LayerScores TsvEvidenceStore::fetch_layer_scores(
    const LayerSpec& spec,
    const std::vector<std::string>& gene_ids
) const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    const LayerScores& table = pimpl_->load_layer(spec);

    LayerScores result;
    for (const auto& gene_id : gene_ids) {
        auto it = table.find(gene_id);
        if (it != table.end()) {
            result[gene_id] = it->second;
        }
    }
    return result;
}

std::vector<ReferenceGeneEntry> TsvEvidenceStore::fetch_reference_genes(
    const std::string& set_name
) const {
    auto it = pimpl_->references.find(set_name);
    if (it == pimpl_->references.end()) return {};
    return it->second;
}

std::string TsvEvidenceStore::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    std::ostringstream oss;
    oss << "genes=" << pimpl_->universe.size()
        << ", layer tables=" << pimpl_->layer_paths.size()
        << ", loaded=" << pimpl_->cache.size()
        << ", reference sets=" << pimpl_->references.size();
    return oss.str();
}

} // namespace genescore
