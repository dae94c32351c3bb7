#pragma once
#include <cstddef>
#include <expected>
#include <memory>
#include <string>

#include <telescore/artifact.hpp>
#include <telescore/churn_classifier.hpp>
#include <telescore/clv_regressor.hpp>
#include <telescore/feature_spec.hpp>
#include <telescore/risk_scorer.hpp>

namespace telescore {

// What was loaded, for health/status reporting
struct RegistrySummary {
  std::string artifact_version;
  std::string feature_spec_version;
  std::string ensemble;
  std::size_t n_trees;
  std::size_t n_features;
  std::size_t churn_view_size;
  std::size_t clv_view_size;
  double decision_threshold;
  RiskBands risk_bands;
  ValueSegmentConfig value_segments;
  ValidationMetrics metrics;
};

// Immutable bundle of everything one scoring call needs. Built once at startup and
// shared read-only by every request; no member is mutated after construction.
class ModelRegistry {
public:
  // Throws ModelLoadError.
  [[nodiscard]] static ModelRegistry from_artifact(const ScoringArtifact& artifact);
  [[nodiscard]] static ModelRegistry from_json_string(const std::string& json_str);

  // Picks MessagePack for .msgpack/.mpk/.bin, JSON otherwise. Throws ModelLoadError.
  [[nodiscard]] static std::shared_ptr<const ModelRegistry> load(const std::string& path);

  [[nodiscard]] static std::expected<std::shared_ptr<const ModelRegistry>, std::string> try_load(
      const std::string& path) noexcept;

  ModelRegistry(ModelRegistry&&) = default;
  ModelRegistry& operator=(ModelRegistry&&) = delete;
  ModelRegistry(const ModelRegistry&) = delete;
  ModelRegistry& operator=(const ModelRegistry&) = delete;

  [[nodiscard]] const FeatureSpec& feature_spec() const noexcept { return *feature_spec_; }
  [[nodiscard]] const ChurnClassifier& classifier() const noexcept { return classifier_; }
  [[nodiscard]] const ClvRegressor& regressor() const noexcept { return regressor_; }
  [[nodiscard]] const RiskScorer& risk_scorer() const noexcept { return risk_scorer_; }
  [[nodiscard]] const ValueSegmentConfig& value_segments() const noexcept { return value_segments_; }
  [[nodiscard]] const std::string& artifact_version() const noexcept { return artifact_version_; }

  [[nodiscard]] RegistrySummary summary() const;

private:
  ModelRegistry(std::string artifact_version, std::unique_ptr<const FeatureSpec> spec,
                ChurnClassifier classifier, ClvRegressor regressor, RiskScorer risk_scorer,
                ValueSegmentConfig value_segments, ValidationMetrics metrics);

  std::string artifact_version_;
  std::unique_ptr<const FeatureSpec> feature_spec_;
  ChurnClassifier classifier_;
  ClvRegressor regressor_;
  RiskScorer risk_scorer_;
  ValueSegmentConfig value_segments_;
  ValidationMetrics metrics_;
};

}  // namespace telescore
