/**
 * Tests for confidence tier assignment
 */

#include <gtest/gtest.h>
#include "tiering.hpp"

using namespace genescore;

namespace {

ScoredGene make_gene(const std::string& id, std::optional<double> score, int evidence) {
    ScoredGene gene;
    gene.gene_id = id;
    gene.gene_symbol = "SYM_" + id;
    gene.composite_score = score;
    gene.evidence_count = evidence;
    gene.layer_scores = {score};
    gene.layer_contributions = {score};
    gene.quality_flag = quality_flag_for(evidence);
    return gene;
}

} // namespace

// ============================================================================
// classify_tier
// ============================================================================

TEST(Tiering, HighNeedsScoreAndEvidence) {
    EXPECT_EQ(classify_tier(make_gene("A", 0.70, 3)), ConfidenceTier::HIGH);
    EXPECT_EQ(classify_tier(make_gene("A", 0.95, 6)), ConfidenceTier::HIGH);
    // High score, too little evidence falls through to MEDIUM
    EXPECT_EQ(classify_tier(make_gene("A", 0.90, 2)), ConfidenceTier::MEDIUM);
}

TEST(Tiering, MediumAndLow) {
    EXPECT_EQ(classify_tier(make_gene("A", 0.40, 2)), ConfidenceTier::MEDIUM);
    EXPECT_EQ(classify_tier(make_gene("A", 0.69, 3)), ConfidenceTier::MEDIUM);
    EXPECT_EQ(classify_tier(make_gene("A", 0.90, 1)), ConfidenceTier::LOW);
    EXPECT_EQ(classify_tier(make_gene("A", 0.20, 1)), ConfidenceTier::LOW);
}

TEST(Tiering, Excluded) {
    EXPECT_EQ(classify_tier(make_gene("A", 0.19, 5)), ConfidenceTier::EXCLUDED);
    EXPECT_EQ(classify_tier(make_gene("A", std::nullopt, 0)), ConfidenceTier::EXCLUDED);
}

TEST(Tiering, CustomThresholds) {
    TierThresholds strict;
    strict.high_score = 0.9;
    strict.high_evidence = 5;
    EXPECT_EQ(classify_tier(make_gene("A", 0.85, 6), strict), ConfidenceTier::MEDIUM);
}

TEST(Tiering, TierStrings) {
    EXPECT_EQ(confidence_tier_to_string(ConfidenceTier::HIGH), "HIGH");
    EXPECT_EQ(confidence_tier_to_string(ConfidenceTier::MEDIUM), "MEDIUM");
    EXPECT_EQ(confidence_tier_to_string(ConfidenceTier::LOW), "LOW");
    EXPECT_EQ(confidence_tier_to_string(ConfidenceTier::EXCLUDED), "EXCLUDED");
}

// ============================================================================
// assign_tiers
// ============================================================================

TEST(Tiering, AssignDropsExcludedAndSorts) {
    std::vector<ScoredGene> genes = {
        make_gene("G_LOW", 0.25, 1),
        make_gene("G_NONE", std::nullopt, 0),
        make_gene("G_HIGH_B", 0.80, 4),
        make_gene("G_HIGH_A", 0.80, 3),
        make_gene("G_OUT", 0.10, 2),
        make_gene("G_MED", 0.50, 2),
    };
    ScoredGeneSet scored({"L1"}, ScoringWeights({{"L1", 1.0}}), std::move(genes));

    auto tiered = assign_tiers(scored);
    ASSERT_EQ(tiered.size(), 4u);
    EXPECT_EQ(tiered[0].gene->gene_id, "G_HIGH_A");
    EXPECT_EQ(tiered[0].tier, ConfidenceTier::HIGH);
    EXPECT_EQ(tiered[1].gene->gene_id, "G_HIGH_B");
    EXPECT_EQ(tiered[2].gene->gene_id, "G_MED");
    EXPECT_EQ(tiered[2].tier, ConfidenceTier::MEDIUM);
    EXPECT_EQ(tiered[3].gene->gene_id, "G_LOW");
    EXPECT_EQ(tiered[3].tier, ConfidenceTier::LOW);

    auto counts = count_tiers(tiered);
    EXPECT_EQ(counts[ConfidenceTier::HIGH], 2u);
    EXPECT_EQ(counts[ConfidenceTier::MEDIUM], 1u);
    EXPECT_EQ(counts[ConfidenceTier::LOW], 1u);
    EXPECT_EQ(counts.count(ConfidenceTier::EXCLUDED), 0u);
}
