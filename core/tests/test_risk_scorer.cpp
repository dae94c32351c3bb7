#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <telescore/recommendation.hpp>
#include <telescore/risk_scorer.hpp>

using namespace telescore;

// =============================================================================
// RiskScorer Tests
// =============================================================================

class RiskScorerTest : public ::testing::Test {
protected:
  RiskScorer scorer_{RiskBands{.medium_above = 0.2, .high_above = 0.4}};
};

TEST_F(RiskScorerTest, BandBoundariesAreExclusive) {
  EXPECT_EQ(scorer_.band(0.0), RiskLevel::Low);
  EXPECT_EQ(scorer_.band(0.2), RiskLevel::Low);
  EXPECT_EQ(scorer_.band(0.2000001), RiskLevel::Medium);
  EXPECT_EQ(scorer_.band(0.4), RiskLevel::Medium);
  EXPECT_EQ(scorer_.band(0.4000001), RiskLevel::High);
  EXPECT_EQ(scorer_.band(1.0), RiskLevel::High);
}

TEST_F(RiskScorerTest, BandIsMonotonic) {
  RiskLevel previous = RiskLevel::Low;
  for (int i = 0; i <= 1000; ++i) {
    RiskLevel level = scorer_.band(i / 1000.0);
    EXPECT_GE(static_cast<int>(level), static_cast<int>(previous)) << "p=" << i / 1000.0;
    previous = level;
  }
}

TEST_F(RiskScorerTest, ConfidenceIsMaximalAtExtremes) {
  EXPECT_DOUBLE_EQ(scorer_.confidence(0.0), 1.0);
  EXPECT_DOUBLE_EQ(scorer_.confidence(1.0), 1.0);
}

TEST_F(RiskScorerTest, ConfidenceIsMinimalAtCutPoints) {
  EXPECT_DOUBLE_EQ(scorer_.confidence(0.2), 0.0);
  EXPECT_DOUBLE_EQ(scorer_.confidence(0.4), 0.0);
  EXPECT_EQ(scorer_.score(0.4).label, ConfidenceLabel::Low);
}

TEST_F(RiskScorerTest, ConfidenceIsSymmetricAroundCutPoints) {
  for (double d : {0.01, 0.05, 0.09}) {
    EXPECT_NEAR(scorer_.confidence(0.2 - d), scorer_.confidence(0.2 + d), 1e-12);
    EXPECT_NEAR(scorer_.confidence(0.4 - d), scorer_.confidence(0.4 + d), 1e-12);
  }
}

TEST_F(RiskScorerTest, ConfidenceGrowsWithDistance) {
  EXPECT_DOUBLE_EQ(scorer_.saturation_distance(), 0.2);
  EXPECT_NEAR(scorer_.confidence(0.1), 0.5, 1e-12);
  EXPECT_NEAR(scorer_.confidence(0.3), 0.5, 1e-12);
  EXPECT_NEAR(scorer_.confidence(0.45), 0.25, 1e-12);
  EXPECT_LT(scorer_.confidence(0.21), scorer_.confidence(0.25));
}

TEST_F(RiskScorerTest, ScoreCombinesBandAndConfidence) {
  auto low = scorer_.score(0.02);
  EXPECT_EQ(low.level, RiskLevel::Low);
  EXPECT_NEAR(low.confidence, 0.9, 1e-12);
  EXPECT_EQ(low.label, ConfidenceLabel::VeryHigh);

  auto high = scorer_.score(0.95);
  EXPECT_EQ(high.level, RiskLevel::High);
  EXPECT_DOUBLE_EQ(high.confidence, 1.0);
}

TEST_F(RiskScorerTest, RejectsProbabilityOutsideUnitInterval) {
  EXPECT_THROW((void)scorer_.band(-0.01), std::invalid_argument);
  EXPECT_THROW((void)scorer_.band(1.01), std::invalid_argument);
  EXPECT_THROW((void)scorer_.confidence(std::nan("")), std::invalid_argument);
}

TEST(RiskScorerConfigTest, RejectsInvalidCutPoints) {
  EXPECT_THROW(RiskScorer(RiskBands{.medium_above = 0.4, .high_above = 0.2}), std::invalid_argument);
  EXPECT_THROW(RiskScorer(RiskBands{.medium_above = 0.3, .high_above = 0.3}), std::invalid_argument);
  EXPECT_THROW(RiskScorer(RiskBands{.medium_above = 0.0, .high_above = 0.4}), std::invalid_argument);
  EXPECT_THROW(RiskScorer(RiskBands{.medium_above = 0.2, .high_above = 1.0}), std::invalid_argument);
}

TEST(RiskScorerConfigTest, CustomCutPoints) {
  RiskScorer scorer(RiskBands{.medium_above = 0.5, .high_above = 0.8});
  EXPECT_EQ(scorer.band(0.45), RiskLevel::Low);
  EXPECT_EQ(scorer.band(0.6), RiskLevel::Medium);
  EXPECT_EQ(scorer.band(0.85), RiskLevel::High);
  EXPECT_DOUBLE_EQ(scorer.saturation_distance(), 0.2);
}

TEST(ConfidenceLabelTest, Thresholds) {
  EXPECT_EQ(RiskScorer::label_for(1.0), ConfidenceLabel::VeryHigh);
  EXPECT_EQ(RiskScorer::label_for(0.75), ConfidenceLabel::VeryHigh);
  EXPECT_EQ(RiskScorer::label_for(0.74), ConfidenceLabel::High);
  EXPECT_EQ(RiskScorer::label_for(0.5), ConfidenceLabel::High);
  EXPECT_EQ(RiskScorer::label_for(0.49), ConfidenceLabel::Moderate);
  EXPECT_EQ(RiskScorer::label_for(0.25), ConfidenceLabel::Moderate);
  EXPECT_EQ(RiskScorer::label_for(0.1), ConfidenceLabel::Low);
  EXPECT_EQ(to_string(ConfidenceLabel::VeryHigh), "Very High");
}

// =============================================================================
// Recommendation Tests
// =============================================================================

TEST(RecommendationTest, TotalOverRiskLevels) {
  EXPECT_EQ(recommend(RiskLevel::High), RecommendedAction::ImmediateRetentionOutreach);
  EXPECT_EQ(recommend(RiskLevel::Medium), RecommendedAction::ProactiveEngagement);
  EXPECT_EQ(recommend(RiskLevel::Low), RecommendedAction::StandardMaintenance);

  static_assert(recommend(RiskLevel::High) == RecommendedAction::ImmediateRetentionOutreach);
}

TEST(RecommendationTest, ActionStrings) {
  EXPECT_EQ(to_string(RecommendedAction::ImmediateRetentionOutreach),
            "immediate retention outreach");
  EXPECT_EQ(to_string(RecommendedAction::ProactiveEngagement), "proactive engagement");
  EXPECT_EQ(to_string(RecommendedAction::StandardMaintenance), "standard maintenance");
}

TEST(RecommendationTest, ValueSegmentIsStrictlyAboveThreshold) {
  constexpr ValueSegmentConfig config;
  constexpr auto outreach = RecommendedAction::ImmediateRetentionOutreach;
  constexpr auto proactive = RecommendedAction::ProactiveEngagement;

  EXPECT_EQ(classify_value(30000.0, outreach, config), ValueSegment::Standard);
  EXPECT_EQ(classify_value(30000.01, outreach, config), ValueSegment::HighValue);
  EXPECT_EQ(classify_value(30000.0, proactive, config), ValueSegment::Standard);
  EXPECT_EQ(classify_value(30000.01, proactive, config), ValueSegment::HighValue);
  EXPECT_EQ(classify_value(0.0, proactive, config), ValueSegment::Standard);

  static_assert(classify_value(30000.0, outreach, config) == ValueSegment::Standard);
}

TEST(RecommendationTest, LowRiskUsesNurtureThreshold) {
  constexpr ValueSegmentConfig config;
  constexpr auto maintain = RecommendedAction::StandardMaintenance;

  EXPECT_EQ(classify_value(35000.0, maintain, config), ValueSegment::Standard);
  EXPECT_EQ(classify_value(40000.0, maintain, config), ValueSegment::Standard);
  EXPECT_EQ(classify_value(40000.01, maintain, config), ValueSegment::HighValue);

  // Same CLV clears the bar in the medium band but not the low one
  EXPECT_EQ(classify_value(35000.0, RecommendedAction::ProactiveEngagement, config),
            ValueSegment::HighValue);
}

TEST(RecommendationTest, PlaybookCoversEveryCombination) {
  for (auto action : {RecommendedAction::ImmediateRetentionOutreach,
                      RecommendedAction::ProactiveEngagement,
                      RecommendedAction::StandardMaintenance}) {
    auto standard = playbook(action, ValueSegment::Standard);
    auto high_value = playbook(action, ValueSegment::HighValue);
    EXPECT_FALSE(standard.empty());
    EXPECT_FALSE(high_value.empty());
    EXPECT_NE(standard, high_value);
  }
}
