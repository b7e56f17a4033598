/**
 * Reference Gene Sets
 *
 * Curated positive controls (established Usher syndrome and core ciliary
 * genes) and negative controls (ubiquitously expressed housekeeping genes)
 * used to sanity-check the scoring methodology.
 */

#ifndef REFERENCE_GENES_HPP
#define REFERENCE_GENES_HPP

#include <string>
#include <vector>

namespace genescore {

/**
 * Store set names for reference lists
 */
constexpr const char* KNOWN_GENES_SET = "known_genes";
constexpr const char* HOUSEKEEPING_GENES_SET = "housekeeping_genes";

/**
 * Reference gene with provenance
 */
struct ReferenceGeneEntry {
    std::string gene_symbol;
    std::string source;                 // Provenance tag (e.g., "omim_usher")
    std::string confidence = "HIGH";
};

/**
 * OMIM Usher syndrome genes (source "omim_usher")
 */
const std::vector<std::string>& omim_usher_genes();

/**
 * SYSCILIA gold standard v2 core subset (source "syscilia_scgs_v2")
 */
const std::vector<std::string>& syscilia_core_genes();

/**
 * Literature-validated housekeeping genes (source "literature_validated")
 */
const std::vector<std::string>& housekeeping_genes();

/**
 * Positive-control reference set. A symbol listed by both sources appears
 * once per source; provenance is not deduplicated.
 */
std::vector<ReferenceGeneEntry> compile_known_genes();

/**
 * Negative-control reference set
 */
std::vector<ReferenceGeneEntry> compile_housekeeping_genes();

/**
 * Number of distinct gene symbols
 */
size_t unique_symbol_count(const std::vector<ReferenceGeneEntry>& entries);

/**
 * Distinct source tags in first-seen order
 */
std::vector<std::string> reference_sources(const std::vector<ReferenceGeneEntry>& entries);

} // namespace genescore

#endif // REFERENCE_GENES_HPP
