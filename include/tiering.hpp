/**
 * Confidence Tiering - Candidate gene tier assignment
 *
 * Classifies scored genes into HIGH/MEDIUM/LOW confidence tiers from their
 * composite score and evidence count. Genes below the LOW threshold, and
 * genes without a composite score, are EXCLUDED and dropped.
 */

#ifndef TIERING_HPP
#define TIERING_HPP

#include "gene_scoring.hpp"
#include <string>
#include <vector>
#include <map>
#include <algorithm>

namespace genescore {

enum class ConfidenceTier {
    HIGH,
    MEDIUM,
    LOW,
    EXCLUDED
};

inline std::string confidence_tier_to_string(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::HIGH:     return "HIGH";
        case ConfidenceTier::MEDIUM:   return "MEDIUM";
        case ConfidenceTier::LOW:      return "LOW";
        case ConfidenceTier::EXCLUDED: return "EXCLUDED";
        default: return "UNKNOWN";
    }
}

/**
 * Tier cut-offs
 */
struct TierThresholds {
    double high_score = 0.70;
    int high_evidence = 3;
    double medium_score = 0.40;
    int medium_evidence = 2;
    double low_score = 0.20;
};

struct TieredGene {
    const ScoredGene* gene = nullptr;   // Owned by the ScoredGeneSet
    ConfidenceTier tier = ConfidenceTier::EXCLUDED;
};

inline ConfidenceTier classify_tier(const ScoredGene& gene,
                                    const TierThresholds& thresholds = TierThresholds()) {
    if (!gene.composite_score) return ConfidenceTier::EXCLUDED;
    double score = *gene.composite_score;

    if (score >= thresholds.high_score && gene.evidence_count >= thresholds.high_evidence) {
        return ConfidenceTier::HIGH;
    }
    if (score >= thresholds.medium_score && gene.evidence_count >= thresholds.medium_evidence) {
        return ConfidenceTier::MEDIUM;
    }
    if (score >= thresholds.low_score) {
        return ConfidenceTier::LOW;
    }
    return ConfidenceTier::EXCLUDED;
}

/**
 * Assign tiers and drop EXCLUDED genes.
 * Result is sorted by composite score descending, gene_id ascending.
 * The returned pointers stay valid while the scored set lives.
 */
inline std::vector<TieredGene> assign_tiers(const ScoredGeneSet& scored,
                                            const TierThresholds& thresholds = TierThresholds()) {
    std::vector<TieredGene> tiered;
    for (const auto& gene : scored.genes()) {
        ConfidenceTier tier = classify_tier(gene, thresholds);
        if (tier == ConfidenceTier::EXCLUDED) continue;
        tiered.push_back({&gene, tier});
    }

    std::sort(tiered.begin(), tiered.end(), [](const TieredGene& a, const TieredGene& b) {
        if (*a.gene->composite_score != *b.gene->composite_score) {
            return *a.gene->composite_score > *b.gene->composite_score;
        }
        return a.gene->gene_id < b.gene->gene_id;
    });

    return tiered;
}

inline std::map<ConfidenceTier, size_t> count_tiers(const std::vector<TieredGene>& tiered) {
    std::map<ConfidenceTier, size_t> counts;
    for (const auto& t : tiered) {
        counts[t.tier]++;
    }
    return counts;
}

} // namespace genescore

#endif // TIERING_HPP
