#pragma once
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <telescore/customer.hpp>
#include <telescore/model_registry.hpp>
#include <telescore/recommendation.hpp>
#include <telescore/risk_scorer.hpp>

namespace telescore {

enum class InferenceMode { Sequential, Concurrent };

struct ScoringOptions {
  InferenceMode inference = InferenceMode::Sequential;
};

struct PredictionResult {
  double churn_probability;
  bool churn_predicted;  // at the classifier's tuned decision threshold
  RiskLevel risk_level;
  double confidence_score;
  ConfidenceLabel confidence_label;
  double clv_estimate;
  ValueSegment value_segment;
  RecommendedAction recommendation;
  std::string_view playbook;
  std::string model_version;  // feature spec the result was produced with

  bool operator==(const PredictionResult&) const = default;
};

// Internal covers any other exception escaping a record's scoring
enum class FailureKind { Validation, Inference, Internal };

struct ScoringFailure {
  FailureKind kind;
  std::string field;  // offending input field, empty unless kind is Validation
  std::string message;

  bool operator==(const ScoringFailure&) const = default;
};

using ScoreOutcome = std::expected<PredictionResult, ScoringFailure>;

using RecordScorer = std::function<PredictionResult(const CustomerRecord&)>;

// Encode once, run both models, band the probability and derive the action.
// All-or-nothing: throws ValidationError or InferenceError without a partial result.
[[nodiscard]] PredictionResult score_customer(const ModelRegistry& registry,
                                              const CustomerRecord& record,
                                              const ScoringOptions& options = {});

// Scores each record independently; one bad record never affects the others.
[[nodiscard]] std::vector<ScoreOutcome> score_batch(const ModelRegistry& registry,
                                                    std::span<const CustomerRecord> records,
                                                    const ScoringOptions& options = {});

// Runs scorer over every record (in parallel under OpenMP) and captures each
// exception as that record's failure. scorer must be safe to call concurrently.
[[nodiscard]] std::vector<ScoreOutcome> score_each(std::span<const CustomerRecord> records,
                                                   const RecordScorer& scorer);

[[nodiscard]] std::string_view to_string(InferenceMode mode) noexcept;
[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

}  // namespace telescore
