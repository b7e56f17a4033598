/**
 * Tests for ScoringWeights: validation, defaults, parsing, quality flags
 */

#include <gtest/gtest.h>
#include "gene_scoring.hpp"

#include <cmath>
#include <stdexcept>

using namespace genescore;

// ============================================================================
// Defaults
// ============================================================================

TEST(ScoringWeights, DefaultsSumToOne) {
    auto w = ScoringWeights::defaults();
    EXPECT_NEAR(w.sum(), 1.0, WEIGHT_SUM_TOLERANCE);
    EXPECT_EQ(w.size(), 6u);
}

TEST(ScoringWeights, DefaultValues) {
    auto w = ScoringWeights::defaults();
    EXPECT_DOUBLE_EQ(w.get("gnomad"), 0.20);
    EXPECT_DOUBLE_EQ(w.get("expression"), 0.20);
    EXPECT_DOUBLE_EQ(w.get("annotation"), 0.15);
    EXPECT_DOUBLE_EQ(w.get("localization"), 0.15);
    EXPECT_DOUBLE_EQ(w.get("animal_model"), 0.15);
    EXPECT_DOUBLE_EQ(w.get("literature"), 0.15);
}

TEST(ScoringWeights, DefaultsCoverDefaultLayers) {
    auto w = ScoringWeights::defaults();
    EXPECT_EQ(w.layers(), layer_names(default_layer_specs()));
}

TEST(ScoringWeights, ToStringFormat) {
    ScoringWeights w({{"a", 0.25}, {"b", 0.75}});
    EXPECT_EQ(w.to_string(), "a=0.2500,b=0.7500");
}

// ============================================================================
// Validation
// ============================================================================

TEST(ScoringWeights, RejectsSumAboveOne) {
    EXPECT_THROW(ScoringWeights({{"a", 0.6}, {"b", 0.5}}), std::invalid_argument);
}

TEST(ScoringWeights, RejectsSumBelowOne) {
    EXPECT_THROW(ScoringWeights({{"a", 0.4}, {"b", 0.5}}), std::invalid_argument);
}

TEST(ScoringWeights, AcceptsSumWithinTolerance) {
    EXPECT_NO_THROW(ScoringWeights({{"a", 0.5}, {"b", 0.5 + 5e-7}}));
}

TEST(ScoringWeights, RejectsSumJustOutsideTolerance) {
    EXPECT_THROW(ScoringWeights({{"a", 0.5}, {"b", 0.5 + 5e-6}}), std::invalid_argument);
}

TEST(ScoringWeights, RejectsNegativeWeight) {
    EXPECT_THROW(ScoringWeights({{"a", -0.1}, {"b", 1.1}}), std::invalid_argument);
}

TEST(ScoringWeights, RejectsNonFiniteWeight) {
    EXPECT_THROW(ScoringWeights({{"a", NAN}, {"b", 1.0}}), std::invalid_argument);
}

TEST(ScoringWeights, RejectsDuplicateLayer) {
    EXPECT_THROW(ScoringWeights({{"a", 0.5}, {"a", 0.5}}), std::invalid_argument);
}

TEST(ScoringWeights, RejectsEmpty) {
    EXPECT_THROW(ScoringWeights(std::vector<std::pair<std::string, double>>{}), std::invalid_argument);
}

TEST(ScoringWeights, ZeroWeightLayerAllowed) {
    ScoringWeights w({{"a", 1.0}, {"b", 0.0}});
    EXPECT_DOUBLE_EQ(w.get("b"), 0.0);
}

TEST(ScoringWeights, UnknownLayerThrows) {
    auto w = ScoringWeights::defaults();
    EXPECT_FALSE(w.has_layer("proteomics"));
    EXPECT_THROW(w.get("proteomics"), std::invalid_argument);
}

TEST(ScoringWeights, ApproxEqual) {
    ScoringWeights a({{"a", 0.5}, {"b", 0.5}});
    ScoringWeights b({{"a", 0.5 + 1e-12}, {"b", 0.5 - 1e-12}});
    ScoringWeights c({{"a", 0.4}, {"b", 0.6}});
    EXPECT_TRUE(a.approx_equal(b));
    EXPECT_FALSE(a.approx_equal(c));
}

// ============================================================================
// parse_weights
// ============================================================================

TEST(ParseWeights, OverridesNamedLayers) {
    auto w = parse_weights("gnomad=0.30,expression=0.10");
    EXPECT_DOUBLE_EQ(w.get("gnomad"), 0.30);
    EXPECT_DOUBLE_EQ(w.get("expression"), 0.10);
    EXPECT_DOUBLE_EQ(w.get("literature"), 0.15);
    EXPECT_NEAR(w.sum(), 1.0, WEIGHT_SUM_TOLERANCE);
}

TEST(ParseWeights, ToleratesWhitespace) {
    auto w = parse_weights(" gnomad = 0.25 , expression = 0.15 ");
    EXPECT_DOUBLE_EQ(w.get("gnomad"), 0.25);
    EXPECT_DOUBLE_EQ(w.get("expression"), 0.15);
}

TEST(ParseWeights, EmptySpecKeepsBase) {
    auto w = parse_weights("");
    EXPECT_TRUE(w.approx_equal(ScoringWeights::defaults()));
}

TEST(ParseWeights, MissingEqualsThrows) {
    EXPECT_THROW(parse_weights("gnomad"), std::invalid_argument);
}

TEST(ParseWeights, UnknownLayerThrows) {
    EXPECT_THROW(parse_weights("proteomics=0.1"), std::invalid_argument);
}

TEST(ParseWeights, NonNumericValueThrows) {
    EXPECT_THROW(parse_weights("gnomad=high"), std::invalid_argument);
}

TEST(ParseWeights, ResultMustSumToOne) {
    EXPECT_THROW(parse_weights("gnomad=0.5"), std::invalid_argument);
}

// ============================================================================
// Quality flags and layer specs
// ============================================================================

TEST(QualityFlag, Thresholds) {
    EXPECT_EQ(quality_flag_for(6), QualityFlag::SUFFICIENT_EVIDENCE);
    EXPECT_EQ(quality_flag_for(4), QualityFlag::SUFFICIENT_EVIDENCE);
    EXPECT_EQ(quality_flag_for(3), QualityFlag::MODERATE_EVIDENCE);
    EXPECT_EQ(quality_flag_for(2), QualityFlag::MODERATE_EVIDENCE);
    EXPECT_EQ(quality_flag_for(1), QualityFlag::SPARSE_EVIDENCE);
    EXPECT_EQ(quality_flag_for(0), QualityFlag::NO_EVIDENCE);
}

TEST(QualityFlag, Strings) {
    EXPECT_EQ(quality_flag_to_string(QualityFlag::SUFFICIENT_EVIDENCE), "sufficient_evidence");
    EXPECT_EQ(quality_flag_to_string(QualityFlag::MODERATE_EVIDENCE), "moderate_evidence");
    EXPECT_EQ(quality_flag_to_string(QualityFlag::SPARSE_EVIDENCE), "sparse_evidence");
    EXPECT_EQ(quality_flag_to_string(QualityFlag::NO_EVIDENCE), "no_evidence");
}

TEST(LayerSpecs, DefaultOrderAndColumns) {
    const auto& specs = default_layer_specs();
    ASSERT_EQ(specs.size(), 6u);
    EXPECT_EQ(specs[0].name, "gnomad");
    EXPECT_EQ(specs[0].score_column, "loeuf_normalized");
    EXPECT_EQ(specs[5].name, "literature");
    EXPECT_EQ(specs[5].score_column, "literature_score_normalized");
    for (const auto& spec : specs) {
        EXPECT_EQ(spec.key_column, "gene_id");
    }
}

TEST(FormatScore, AbsentIsDot) {
    EXPECT_EQ(format_score(std::nullopt), ".");
    EXPECT_EQ(format_score(0.5), "0.5000");
    EXPECT_EQ(format_score(0.123456, 2), "0.12");
}
