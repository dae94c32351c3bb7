#include <spdlog/spdlog.h>

#include <future>
#include <telescore/errors.hpp>
#include <telescore/feature_encoder.hpp>
#include <telescore/scoring.hpp>
#include <telescore/tracy.hpp>
#include <utility>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace telescore {

namespace {

  struct Inference {
    double churn_probability;
    double clv_estimate;
  };

  Inference run_models(const ModelRegistry& registry, const ModelInputs& inputs,
                       InferenceMode mode) {
    const auto& classifier = registry.classifier();
    const auto& regressor = registry.regressor();

    if (mode == InferenceMode::Sequential) {
      return Inference{.churn_probability = classifier.predict(inputs.churn),
                       .clv_estimate = regressor.predict(inputs.clv)};
    }

    // Join both: the future's destructor waits even if the regressor throws
    auto churn = std::async(std::launch::async,
                            [&classifier, &inputs] { return classifier.predict(inputs.churn); });
    double clv = regressor.predict(inputs.clv);
    return Inference{.churn_probability = churn.get(), .clv_estimate = clv};
  }

  // Nothing may leave an OpenMP worker; every exception becomes the record's failure
  ScoreOutcome score_one(const RecordScorer& scorer, const CustomerRecord& record,
                         std::size_t index) {
    try {
      return scorer(record);
    } catch (const ValidationError& e) {
      spdlog::debug("Batch record {} rejected: {}", index, e.what());
      return std::unexpected(ScoringFailure{FailureKind::Validation, e.field(), e.what()});
    } catch (const InferenceError& e) {
      spdlog::warn("Batch record {} failed inference: {}", index, e.what());
      return std::unexpected(ScoringFailure{FailureKind::Inference, {}, e.what()});
    } catch (const std::exception& e) {
      spdlog::warn("Batch record {} failed: {}", index, e.what());
      return std::unexpected(ScoringFailure{FailureKind::Internal, {}, e.what()});
    }
  }

}  // namespace

PredictionResult score_customer(const ModelRegistry& registry, const CustomerRecord& record,
                                const ScoringOptions& options) {
  TELESCORE_ZONE;
  FeatureEncoder encoder(registry.feature_spec());
  ModelInputs inputs = encoder.encode(record, registry.classifier().view(),
                                      registry.regressor().view());

  Inference inference = run_models(registry, inputs, options.inference);

  RiskAssessment risk = registry.risk_scorer().score(inference.churn_probability);
  RecommendedAction action = recommend(risk.level);
  ValueSegment segment
      = classify_value(inference.clv_estimate, action, registry.value_segments());

  return PredictionResult{
      .churn_probability = inference.churn_probability,
      .churn_predicted = registry.classifier().is_churn(inference.churn_probability),
      .risk_level = risk.level,
      .confidence_score = risk.confidence,
      .confidence_label = risk.label,
      .clv_estimate = inference.clv_estimate,
      .value_segment = segment,
      .recommendation = action,
      .playbook = playbook(action, segment),
      .model_version = registry.feature_spec().version()};
}

std::vector<ScoreOutcome> score_each(std::span<const CustomerRecord> records,
                                     const RecordScorer& scorer) {
  TELESCORE_ZONE;
  std::vector<ScoreOutcome> results(
      records.size(), std::unexpected(ScoringFailure{FailureKind::Internal, {}, "not scored"}));

#ifdef _OPENMP
#  pragma omp parallel for schedule(static)
#endif
  for (int i = 0; i < static_cast<int>(records.size()); ++i) {
    auto idx = static_cast<std::size_t>(i);
    results[idx] = score_one(scorer, records[idx], idx);
  }

  return results;
}

std::vector<ScoreOutcome> score_batch(const ModelRegistry& registry,
                                      std::span<const CustomerRecord> records,
                                      const ScoringOptions& options) {
  return score_each(records, [&registry, &options](const CustomerRecord& record) {
    return score_customer(registry, record, options);
  });
}

std::string_view to_string(InferenceMode mode) noexcept {
  switch (mode) {
    case InferenceMode::Sequential:
      return "sequential";
    case InferenceMode::Concurrent:
      return "concurrent";
  }
  return "unknown";
}

std::string_view to_string(FailureKind kind) noexcept {
  switch (kind) {
    case FailureKind::Validation:
      return "validation";
    case FailureKind::Inference:
      return "inference";
    case FailureKind::Internal:
      return "internal";
  }
  return "unknown";
}

}  // namespace telescore
