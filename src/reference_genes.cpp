/**
 * Reference Gene Sets - Implementation
 */

#include "reference_genes.hpp"
#include <set>

namespace genescore {

const std::vector<std::string>& omim_usher_genes() {
    static const std::vector<std::string> genes = {
        "MYO7A",    // USH1B
        "USH1C",    // USH1C (harmonin)
        "CDH23",    // USH1D
        "PCDH15",   // USH1F
        "USH1G",    // USH1G (SANS)
        "CIB2",     // USH1J
        "USH2A",    // USH2A
        "ADGRV1",   // USH2C (GPR98)
        "WHRN",     // USH2D (whirlin)
        "CLRN1",    // USH3A
    };
    return genes;
}

const std::vector<std::string>& syscilia_core_genes() {
    // Curated subset of SCGS v2 (van Dam et al. 2021)
    static const std::vector<std::string> genes = {
        "IFT88", "IFT140", "IFT172",                            // IFT
        "BBS1", "BBS2", "BBS4", "BBS5", "BBS7", "BBS9", "BBS10", // BBSome
        "RPGRIP1L", "CEP290",                                   // Transition zone
        "ARL13B", "INPP5E",                                     // Ciliary membrane
        "TMEM67", "CC2D2A", "TMEM216", "TMEM231", "TMEM138",    // MKS/JBTS
        "NPHP1", "NPHP3", "NPHP4",                              // Nephronophthisis
        "RPGR", "CEP164", "OFD1", "MKS1",
        "TCTN1", "TCTN2",                                       // Tectonic complex
    };
    return genes;
}

const std::vector<std::string>& housekeeping_genes() {
    // Eisenberg & Levanon (2013) and common expression normalization references
    static const std::vector<std::string> genes = {
        "RPL13A", "RPL32", "RPLP0",                 // Ribosomal
        "GAPDH", "ACTB", "PGK1", "SDHA",            // Metabolic / cytoskeletal
        "B2M", "HPRT1", "TBP",
        "PPIA", "UBC", "YWHAZ",
    };
    return genes;
}

static void append_entries(std::vector<ReferenceGeneEntry>& entries,
                           const std::vector<std::string>& symbols,
                           const std::string& source) {
    for (const auto& symbol : symbols) {
        entries.push_back({symbol, source, "HIGH"});
    }
}

std::vector<ReferenceGeneEntry> compile_known_genes() {
    std::vector<ReferenceGeneEntry> entries;
    entries.reserve(omim_usher_genes().size() + syscilia_core_genes().size());
    append_entries(entries, omim_usher_genes(), "omim_usher");
    append_entries(entries, syscilia_core_genes(), "syscilia_scgs_v2");
    return entries;
}

std::vector<ReferenceGeneEntry> compile_housekeeping_genes() {
    std::vector<ReferenceGeneEntry> entries;
    append_entries(entries, housekeeping_genes(), "literature_validated");
    return entries;
}

size_t unique_symbol_count(const std::vector<ReferenceGeneEntry>& entries) {
    std::set<std::string> symbols;
    for (const auto& entry : entries) {
        symbols.insert(entry.gene_symbol);
    }
    return symbols.size();
}

std::vector<std::string> reference_sources(const std::vector<ReferenceGeneEntry>& entries) {
    std::vector<std::string> sources;
    std::set<std::string> seen;
    for (const auto& entry : entries) {
        if (seen.insert(entry.source).second) {
            sources.push_back(entry.source);
        }
    }
    return sources;
}

} // namespace genescore
