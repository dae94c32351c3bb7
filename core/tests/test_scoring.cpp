#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <stdexcept>
#include <telescore/errors.hpp>
#include <telescore/scoring.hpp>
#include <thread>
#include <vector>

#include "test_artifacts.hpp"

using namespace telescore;

class ScoringTest : public ::testing::Test {
protected:
  ModelRegistry registry_ = ModelRegistry::from_artifact(test::small_artifact());
};

// =============================================================================
// score_customer
// =============================================================================

TEST_F(ScoringTest, LowRiskHighValueCustomer) {
  auto result = score_customer(registry_, test::basic_record());

  EXPECT_DOUBLE_EQ(result.churn_probability, 0.1);
  EXPECT_FALSE(result.churn_predicted);
  EXPECT_EQ(result.risk_level, RiskLevel::Low);
  EXPECT_NEAR(result.confidence_score, 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(result.clv_estimate, 3500.0);
  EXPECT_EQ(result.value_segment, ValueSegment::HighValue);
  EXPECT_EQ(result.recommendation, RecommendedAction::StandardMaintenance);
  EXPECT_EQ(result.playbook,
            playbook(RecommendedAction::StandardMaintenance, ValueSegment::HighValue));
  EXPECT_EQ(result.model_version, "unit-v1");
}

TEST_F(ScoringTest, MediumRiskFromInternationalPlan) {
  auto record = test::basic_record();
  record.international_plan = true;

  auto result = score_customer(registry_, record);

  EXPECT_DOUBLE_EQ(result.churn_probability, 0.3);
  EXPECT_EQ(result.risk_level, RiskLevel::Medium);
  EXPECT_EQ(result.recommendation, RecommendedAction::ProactiveEngagement);
}

TEST_F(ScoringTest, HighRiskWithClampedClv) {
  auto record = test::basic_record();
  record.customer_service_calls = 4;

  auto result = score_customer(registry_, record);

  EXPECT_DOUBLE_EQ(result.churn_probability, 0.9);
  EXPECT_TRUE(result.churn_predicted);
  EXPECT_EQ(result.risk_level, RiskLevel::High);
  EXPECT_EQ(result.confidence_label, ConfidenceLabel::VeryHigh);
  EXPECT_EQ(result.clv_estimate, 0.0);
  EXPECT_EQ(result.value_segment, ValueSegment::Standard);
  EXPECT_EQ(result.recommendation, RecommendedAction::ImmediateRetentionOutreach);
}

TEST_F(ScoringTest, ValueSegmentDependsOnRiskBand) {
  // clv = 3100: above the 3000 bar for medium risk, below the 3200 nurture bar
  auto record = test::basic_record();
  record.day.charge = 26.0;

  auto low = score_customer(registry_, record);
  EXPECT_EQ(low.risk_level, RiskLevel::Low);
  EXPECT_DOUBLE_EQ(low.clv_estimate, 3100.0);
  EXPECT_EQ(low.value_segment, ValueSegment::Standard);

  record.international_plan = true;
  auto medium = score_customer(registry_, record);
  EXPECT_EQ(medium.risk_level, RiskLevel::Medium);
  EXPECT_DOUBLE_EQ(medium.clv_estimate, 3100.0);
  EXPECT_EQ(medium.value_segment, ValueSegment::HighValue);
}

TEST_F(ScoringTest, ClvAtThresholdIsStandard) {
  auto record = test::basic_record();
  record.international_plan = true;
  record.day.charge = 25.0;

  auto result = score_customer(registry_, record);

  EXPECT_EQ(result.risk_level, RiskLevel::Medium);
  EXPECT_DOUBLE_EQ(result.clv_estimate, 3000.0);
  EXPECT_EQ(result.value_segment, ValueSegment::Standard);
}

TEST_F(ScoringTest, RecommendationIgnoresClv) {
  auto cheap = test::basic_record();
  cheap.day.charge = 0.0;
  auto rich = test::basic_record();
  rich.day.charge = 500.0;

  auto a = score_customer(registry_, cheap);
  auto b = score_customer(registry_, rich);

  EXPECT_NE(a.clv_estimate, b.clv_estimate);
  EXPECT_EQ(a.risk_level, b.risk_level);
  EXPECT_EQ(a.recommendation, b.recommendation);
}

TEST_F(ScoringTest, ValidationFailurePropagates) {
  auto record = test::basic_record();
  record.area_code = "212";
  EXPECT_THROW((void)score_customer(registry_, record), ValidationError);

  record.area_code = "415";
  record.customer_service_calls = -2;
  EXPECT_THROW((void)score_customer(registry_, record), ValidationError);
}

TEST_F(ScoringTest, InferenceFailureIsNotCoerced) {
  auto artifact = test::small_artifact();
  artifact.regressor.coefficients = {std::numeric_limits<double>::max(), 0.0};
  auto registry = ModelRegistry::from_artifact(artifact);

  EXPECT_THROW((void)score_customer(registry, test::basic_record()), InferenceError);
  EXPECT_THROW((void)score_customer(registry, test::basic_record(),
                                    {.inference = InferenceMode::Concurrent}),
               InferenceError);
}

// =============================================================================
// Determinism
// =============================================================================

TEST_F(ScoringTest, SequentialAndConcurrentAgree) {
  for (int calls = 0; calls < 8; ++calls) {
    auto record = test::basic_record();
    record.customer_service_calls = calls;
    record.international_plan = calls % 2 == 1;

    auto sequential = score_customer(registry_, record, {.inference = InferenceMode::Sequential});
    auto concurrent = score_customer(registry_, record, {.inference = InferenceMode::Concurrent});
    EXPECT_EQ(sequential, concurrent) << "customer_service_calls=" << calls;
  }
}

TEST_F(ScoringTest, RepeatedCallsAreIdentical) {
  auto record = test::basic_record();
  auto first = score_customer(registry_, record);
  for (int i = 0; i < 100; ++i) {
    ASSERT_EQ(score_customer(registry_, record), first);
  }
}

TEST_F(ScoringTest, ConcurrentCallersShareOneRegistry) {
  static constexpr int N_THREADS = 16;
  static constexpr int N_CALLS_PER_THREAD = 500;

  auto record = test::basic_record();
  const auto expected = score_customer(registry_, record);

  std::atomic<int> mismatch_count{0};
  std::atomic<int> success_count{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < N_THREADS; ++t) {
    threads.emplace_back([&, t]() {
      ScoringOptions options{.inference = t % 2 ? InferenceMode::Concurrent
                                                : InferenceMode::Sequential};
      for (int i = 0; i < N_CALLS_PER_THREAD; ++i) {
        if (score_customer(registry_, record, options) == expected) {
          success_count.fetch_add(1, std::memory_order_relaxed);
        } else {
          mismatch_count.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(mismatch_count.load(), 0);
  EXPECT_EQ(success_count.load(), N_THREADS * N_CALLS_PER_THREAD);
}

// =============================================================================
// score_batch
// =============================================================================

TEST_F(ScoringTest, BatchPreservesOrderAndIsolatesFailures) {
  std::vector<CustomerRecord> records(5, test::basic_record());
  records[1].customer_service_calls = 6;
  records[2].state = "WY";
  records[3].international_plan = true;
  records[4].day.minutes = -1.0;

  auto outcomes = score_batch(registry_, records);

  ASSERT_EQ(outcomes.size(), 5);
  ASSERT_TRUE(outcomes[0].has_value());
  EXPECT_EQ(outcomes[0]->risk_level, RiskLevel::Low);
  ASSERT_TRUE(outcomes[1].has_value());
  EXPECT_EQ(outcomes[1]->risk_level, RiskLevel::High);
  ASSERT_TRUE(outcomes[3].has_value());
  EXPECT_EQ(outcomes[3]->risk_level, RiskLevel::Medium);

  ASSERT_FALSE(outcomes[2].has_value());
  EXPECT_EQ(outcomes[2].error().kind, FailureKind::Validation);
  EXPECT_EQ(outcomes[2].error().field, "state");

  ASSERT_FALSE(outcomes[4].has_value());
  EXPECT_EQ(outcomes[4].error().field, "day_minutes");
}

TEST_F(ScoringTest, BatchMatchesSingleCalls) {
  std::vector<CustomerRecord> records;
  for (int i = 0; i < 64; ++i) {
    auto r = test::basic_record();
    r.customer_service_calls = i % 7;
    r.international_plan = i % 3 == 0;
    r.day.charge = 5.0 * (i % 11);
    records.push_back(r);
  }

  auto outcomes = score_batch(registry_, records, {.inference = InferenceMode::Concurrent});

  ASSERT_EQ(outcomes.size(), records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    ASSERT_TRUE(outcomes[i].has_value()) << i;
    EXPECT_EQ(*outcomes[i], score_customer(registry_, records[i])) << i;
  }
}

TEST_F(ScoringTest, UnexpectedExceptionIsCapturedPerRecord) {
  std::vector<CustomerRecord> records(4, test::basic_record());
  records[1].state = "NY";
  records[3].state = "TX";

  auto outcomes = score_each(records, [this](const CustomerRecord& record) {
    if (record.state == "NY") throw std::runtime_error("backend unavailable");
    if (record.state == "TX") throw ValidationError("state", "blocked region");
    return score_customer(registry_, record);
  });

  ASSERT_EQ(outcomes.size(), 4);
  ASSERT_TRUE(outcomes[0].has_value());
  ASSERT_TRUE(outcomes[2].has_value());
  EXPECT_EQ(*outcomes[2], score_customer(registry_, records[2]));

  ASSERT_FALSE(outcomes[1].has_value());
  EXPECT_EQ(outcomes[1].error().kind, FailureKind::Internal);
  EXPECT_TRUE(outcomes[1].error().field.empty());
  EXPECT_EQ(outcomes[1].error().message, "backend unavailable");

  ASSERT_FALSE(outcomes[3].has_value());
  EXPECT_EQ(outcomes[3].error().kind, FailureKind::Validation);
  EXPECT_EQ(outcomes[3].error().field, "state");
}

TEST_F(ScoringTest, FailureKindNames) {
  EXPECT_EQ(to_string(FailureKind::Validation), "validation");
  EXPECT_EQ(to_string(FailureKind::Inference), "inference");
  EXPECT_EQ(to_string(FailureKind::Internal), "internal");
}

TEST_F(ScoringTest, EmptyBatch) {
  EXPECT_TRUE(score_batch(registry_, std::vector<CustomerRecord>{}).empty());
}
