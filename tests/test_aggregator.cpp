/**
 * Tests for composite score aggregation
 */

#include <gtest/gtest.h>
#include "gene_scoring.hpp"
#include "evidence_store.hpp"

#include <stdexcept>

using namespace genescore;

namespace {

std::vector<LayerSpec> two_layer_specs() {
    return {
        {"L1", "gene_id", "s1"},
        {"L2", "gene_id", "s2"},
    };
}

ScoringWeights two_layer_weights() {
    return ScoringWeights({{"L1", 0.6}, {"L2", 0.4}});
}

/**
 * Store wrapper that counts layer queries
 */
class CountingStore : public EvidenceStore {
public:
    explicit CountingStore(const InMemoryEvidenceStore& inner) : inner_(inner) {}

    std::string name() const override { return "counting"; }

    std::vector<GeneIdentity> gene_universe() const override {
        queries_++;
        return inner_.gene_universe();
    }

    LayerScores fetch_layer_scores(const LayerSpec& spec,
                                   const std::vector<std::string>& gene_ids) const override {
        queries_++;
        return inner_.fetch_layer_scores(spec, gene_ids);
    }

    int queries() const { return queries_; }

private:
    const InMemoryEvidenceStore& inner_;
    mutable int queries_ = 0;
};

} // namespace

// ============================================================================
// Composite score arithmetic
// ============================================================================

class AggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.add_layer("L1");
        store.add_layer("L2");
    }

    InMemoryEvidenceStore store;
};

TEST_F(AggregatorTest, WeightedAverageOverPresentLayers) {
    store.add_gene("G1", "GENE1");
    store.set_score("L1", "G1", 0.8);
    store.set_score("L2", "G1", 0.4);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    const ScoredGene* g1 = scored.find_by_id("G1");
    ASSERT_NE(g1, nullptr);
    ASSERT_TRUE(g1->composite_score.has_value());
    EXPECT_NEAR(*g1->composite_score, 0.64, 1e-12);
    EXPECT_EQ(g1->evidence_count, 2);
    EXPECT_EQ(g1->quality_flag, QualityFlag::MODERATE_EVIDENCE);

    ASSERT_EQ(g1->layer_contributions.size(), 2u);
    EXPECT_NEAR(*g1->layer_contributions[0], 0.48, 1e-12);
    EXPECT_NEAR(*g1->layer_contributions[1], 0.16, 1e-12);
}

TEST_F(AggregatorTest, GeneWithoutEvidenceHasNoScore) {
    store.add_gene("G1", "GENE1");
    store.add_gene("G2", "GENE2");
    store.set_score("L1", "G1", 0.8);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    const ScoredGene* g2 = scored.find_by_id("G2");
    ASSERT_NE(g2, nullptr);
    EXPECT_FALSE(g2->composite_score.has_value());
    EXPECT_EQ(g2->evidence_count, 0);
    EXPECT_EQ(g2->quality_flag, QualityFlag::NO_EVIDENCE);
    EXPECT_FALSE(g2->layer_contributions[0].has_value());
    EXPECT_FALSE(g2->layer_contributions[1].has_value());
    EXPECT_EQ(scored.size(), 2u);
    EXPECT_EQ(scored.scored_count(), 1u);
}

TEST_F(AggregatorTest, SingleLayerScoreIsExact) {
    store.add_gene("G3", "GENE3");
    store.set_score("L2", "G3", 0.37);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    const ScoredGene* g3 = scored.find_by_id("G3");
    ASSERT_NE(g3, nullptr);
    ASSERT_TRUE(g3->composite_score.has_value());
    EXPECT_EQ(*g3->composite_score, 0.37);
    EXPECT_EQ(g3->quality_flag, QualityFlag::SPARSE_EVIDENCE);
}

TEST_F(AggregatorTest, MissingLayerIsNotZeroEvidence) {
    // A missing layer must not pull the score down the way a zero does
    store.add_gene("MISSING", "M");
    store.add_gene("ZERO", "Z");
    store.set_score("L1", "MISSING", 0.9);
    store.set_score("L1", "ZERO", 0.9);
    store.set_score("L2", "ZERO", 0.0);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    EXPECT_NEAR(*scored.find_by_id("MISSING")->composite_score, 0.9, 1e-12);
    EXPECT_NEAR(*scored.find_by_id("ZERO")->composite_score, 0.54, 1e-12);
}

TEST_F(AggregatorTest, ExplicitNullCountsAsAbsent) {
    store.add_gene("G1", "GENE1");
    store.set_score("L1", "G1", std::nullopt);
    store.set_score("L2", "G1", 0.5);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    const ScoredGene* g1 = scored.find_by_id("G1");
    EXPECT_EQ(g1->evidence_count, 1);
    EXPECT_FALSE(g1->layer_scores[0].has_value());
    EXPECT_EQ(*g1->composite_score, 0.5);
}

TEST_F(AggregatorTest, MonotonicInLayerScore) {
    const double l1_scores[] = {0.0, 0.1, 0.35, 0.5, 0.77, 1.0};
    std::optional<double> previous;

    for (double s : l1_scores) {
        InMemoryEvidenceStore local;
        local.add_layer("L1");
        local.add_layer("L2");
        local.add_gene("G1", "GENE1");
        local.set_score("L1", "G1", s);
        local.set_score("L2", "G1", 0.3);

        auto scored = compute_composite_scores(local, two_layer_weights(), two_layer_specs());
        double composite = *scored.find_by_id("G1")->composite_score;
        EXPECT_GE(composite, 0.0);
        EXPECT_LE(composite, 1.0);
        if (previous) {
            EXPECT_GE(composite, *previous);
        }
        previous = composite;
    }
}

TEST(Aggregator, ZeroWeightLayersFallBackToPlainMean) {
    InMemoryEvidenceStore store;
    store.add_layer("L1");
    store.add_layer("L2");
    store.add_layer("L3");
    store.add_gene("G1", "GENE1");
    store.set_score("L2", "G1", 0.2);
    store.set_score("L3", "G1", 0.4);

    std::vector<LayerSpec> specs = {
        {"L1", "gene_id", "s1"}, {"L2", "gene_id", "s2"}, {"L3", "gene_id", "s3"},
    };
    ScoringWeights weights({{"L1", 1.0}, {"L2", 0.0}, {"L3", 0.0}});

    auto scored = compute_composite_scores(store, weights, specs);
    const ScoredGene* g1 = scored.find_by_id("G1");
    ASSERT_TRUE(g1->composite_score.has_value());
    EXPECT_NEAR(*g1->composite_score, 0.3, 1e-12);
    EXPECT_EQ(*g1->layer_contributions[1], 0.0);
}

// ============================================================================
// Ordering and lookups
// ============================================================================

TEST_F(AggregatorTest, SortedByScoreThenGeneId) {
    store.add_gene("G_NONE", "NONE");
    store.add_gene("G_B", "B");
    store.add_gene("G_A", "A");
    store.add_gene("G_TOP", "TOP");
    store.set_score("L1", "G_B", 0.5);
    store.set_score("L1", "G_A", 0.5);
    store.set_score("L1", "G_TOP", 0.9);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    const auto& genes = scored.genes();
    ASSERT_EQ(genes.size(), 4u);
    EXPECT_EQ(genes[0].gene_id, "G_TOP");
    EXPECT_EQ(genes[1].gene_id, "G_A");
    EXPECT_EQ(genes[2].gene_id, "G_B");
    EXPECT_EQ(genes[3].gene_id, "G_NONE");

    auto top = scored.top_scored(10);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0]->gene_id, "G_TOP");
}

TEST_F(AggregatorTest, FindBySymbolReturnsHighestRanked) {
    store.add_gene("G1", "DUP");
    store.add_gene("G2", "DUP");
    store.set_score("L1", "G1", 0.2);
    store.set_score("L1", "G2", 0.8);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    const ScoredGene* dup = scored.find_by_symbol("DUP");
    ASSERT_NE(dup, nullptr);
    EXPECT_EQ(dup->gene_id, "G2");
    EXPECT_EQ(scored.find_by_symbol("ABSENT"), nullptr);
    EXPECT_EQ(scored.find_by_id("ABSENT"), nullptr);
}

TEST_F(AggregatorTest, LayerIndexAndQualityDistribution) {
    store.add_gene("G1", "GENE1");
    store.add_gene("G2", "GENE2");
    store.set_score("L1", "G1", 0.2);
    store.set_score("L2", "G1", 0.2);

    auto scored = compute_composite_scores(store, two_layer_weights(), two_layer_specs());
    EXPECT_EQ(scored.layer_index("L1"), 0);
    EXPECT_EQ(scored.layer_index("L2"), 1);
    EXPECT_EQ(scored.layer_index("L9"), -1);

    auto dist = scored.quality_distribution();
    EXPECT_EQ(dist[QualityFlag::MODERATE_EVIDENCE], 1);
    EXPECT_EQ(dist[QualityFlag::NO_EVIDENCE], 1);
}

// ============================================================================
// Join
// ============================================================================

TEST_F(AggregatorTest, JoinKeepsWholeUniverse) {
    store.add_gene("G1", "GENE1");
    store.add_gene("G2", "GENE2");
    store.add_gene("G3", "GENE3");
    store.add_gene("G4", "GENE4");
    store.set_score("L1", "G1", 0.1);
    store.set_score("L1", "G2", 0.2);
    store.set_score("L2", "G1", 0.3);
    store.set_score("L1", "UNKNOWN_GENE", 0.9);

    JoinedEvidence joined = join_evidence_layers(store, two_layer_specs());
    ASSERT_EQ(joined.rows.size(), 4u);
    EXPECT_EQ(joined.rows[0].gene_id, "G1");
    EXPECT_EQ(joined.rows[0].evidence_count, 2);
    EXPECT_EQ(joined.rows[3].evidence_count, 0);
    EXPECT_DOUBLE_EQ(joined.null_rate(0), 0.5);
    EXPECT_DOUBLE_EQ(joined.null_rate(1), 0.75);
    EXPECT_DOUBLE_EQ(joined.mean_evidence_count(), 0.75);
}

// ============================================================================
// Validation failures
// ============================================================================

TEST_F(AggregatorTest, WeightLayerMismatchFailsBeforeQuery) {
    store.add_gene("G1", "GENE1");
    CountingStore counting(store);

    ScoringWeights wrong({{"L1", 0.5}, {"L3", 0.5}});
    EXPECT_THROW(compute_composite_scores(counting, wrong, two_layer_specs()), std::invalid_argument);
    EXPECT_EQ(counting.queries(), 0);
}

TEST_F(AggregatorTest, MissingWeightForLayerFails) {
    ScoringWeights partial({{"L1", 1.0}});
    EXPECT_THROW(compute_composite_scores(store, partial, two_layer_specs()), std::invalid_argument);
}

TEST(Aggregator, MissingLayerTableIsStoreError) {
    InMemoryEvidenceStore store;
    store.add_layer("L1");
    store.add_gene("G1", "GENE1");

    std::vector<LayerSpec> specs = {{"L1", "gene_id", "s1"}, {"L2", "gene_id", "s2"}};
    ScoringWeights weights({{"L1", 0.5}, {"L2", 0.5}});
    EXPECT_THROW(compute_composite_scores(store, weights, specs), std::runtime_error);
}

TEST(Aggregator, DefaultLayersEndToEnd) {
    InMemoryEvidenceStore store;
    for (const auto& spec : default_layer_specs()) store.add_layer(spec.name);
    store.add_gene("ENSG01", "FULL");
    for (const auto& spec : default_layer_specs()) store.set_score(spec.name, "ENSG01", 0.5);
    store.set_score("gnomad", "ENSG01", 1.0);

    auto scored = compute_composite_scores(store, ScoringWeights::defaults());
    const ScoredGene* gene = scored.find_by_id("ENSG01");
    ASSERT_NE(gene, nullptr);
    EXPECT_EQ(gene->evidence_count, 6);
    EXPECT_EQ(gene->quality_flag, QualityFlag::SUFFICIENT_EVIDENCE);
    // 0.2 * 1.0 + 0.8 * 0.5
    EXPECT_NEAR(*gene->composite_score, 0.6, 1e-12);
}
