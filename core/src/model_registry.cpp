#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <telescore/errors.hpp>
#include <telescore/model_registry.hpp>
#include <telescore/tracy.hpp>
#include <utility>

namespace telescore {

namespace {

  bool is_msgpack_path(const std::string& path) {
    return path.ends_with(".msgpack") || path.ends_with(".mpk") || path.ends_with(".bin");
  }

  RiskScorer make_risk_scorer(const RiskBands& bands) {
    try {
      return RiskScorer(bands);
    } catch (const std::invalid_argument& e) {
      throw ModelLoadError(e.what());
    }
  }

}  // namespace

ModelRegistry::ModelRegistry(std::string artifact_version, std::unique_ptr<const FeatureSpec> spec,
                             ChurnClassifier classifier, ClvRegressor regressor,
                             RiskScorer risk_scorer, ValueSegmentConfig value_segments,
                             ValidationMetrics metrics)
    : artifact_version_(std::move(artifact_version)),
      feature_spec_(std::move(spec)),
      classifier_(std::move(classifier)),
      regressor_(std::move(regressor)),
      risk_scorer_(risk_scorer),
      value_segments_(value_segments),
      metrics_(std::move(metrics)) {}

ModelRegistry ModelRegistry::from_artifact(const ScoringArtifact& artifact) {
  TELESCORE_ZONE;
  artifact.validate();

  auto spec = std::make_unique<const FeatureSpec>(artifact.feature_spec);
  ChurnClassifier classifier(artifact.classifier, *spec);
  ClvRegressor regressor(artifact.regressor, *spec);
  RiskScorer risk_scorer = make_risk_scorer(artifact.risk_bands);

  spdlog::info("Loaded scoring artifact v{} (feature spec '{}', {} {} trees, {}+{} features)",
               artifact.version, spec->version(), classifier.n_trees(),
               to_string(classifier.ensemble()), classifier.view().size(),
               regressor.view().size());

  return ModelRegistry(artifact.version, std::move(spec), std::move(classifier),
                       std::move(regressor), risk_scorer, artifact.value_segments,
                       artifact.metrics);
}

ModelRegistry ModelRegistry::from_json_string(const std::string& json_str) {
  return from_artifact(ScoringArtifact::from_json_string(json_str));
}

std::shared_ptr<const ModelRegistry> ModelRegistry::load(const std::string& path) {
  spdlog::debug("Loading scoring artifact from {}", path);
  auto artifact = is_msgpack_path(path) ? ScoringArtifact::from_msgpack(path)
                                        : ScoringArtifact::from_json(path);
  try {
    return std::make_shared<const ModelRegistry>(from_artifact(artifact));
  } catch (const ModelLoadError& e) {
    throw ModelLoadError(fmt::format("{}: {}", path, e.what()));
  }
}

std::expected<std::shared_ptr<const ModelRegistry>, std::string> ModelRegistry::try_load(
    const std::string& path) noexcept {
  try {
    return load(path);
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

RegistrySummary ModelRegistry::summary() const {
  return RegistrySummary{.artifact_version = artifact_version_,
                         .feature_spec_version = feature_spec_->version(),
                         .ensemble = to_string(classifier_.ensemble()),
                         .n_trees = classifier_.n_trees(),
                         .n_features = feature_spec_->size(),
                         .churn_view_size = classifier_.view().size(),
                         .clv_view_size = regressor_.view().size(),
                         .decision_threshold = classifier_.decision_threshold(),
                         .risk_bands = risk_scorer_.bands(),
                         .value_segments = value_segments_,
                         .metrics = metrics_};
}

}  // namespace telescore
