#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace telescore {

// Version for format evolution
inline constexpr const char* ARTIFACT_VERSION = "1.0";

// Frozen z-scaling parameters for one numeric field
struct ScalingParams {
  double mean = 0.0;
  double stddev = 1.0;
};

// Feature engineering frozen at training time (vocabularies + scaling)
struct FeatureSpecConfig {
  std::string version;
  std::vector<std::string> states;
  std::vector<std::string> area_codes;
  std::map<std::string, ScalingParams> scaling;  // keyed by numeric field name
};

// One node of a fitted decision tree. Leaves have left == right == -1.
struct TreeNode {
  int feature = -1;
  double threshold = 0.0;
  int left = -1;
  int right = -1;
  double value = 0.0;

  [[nodiscard]] bool is_leaf() const noexcept { return left < 0 && right < 0; }
};

struct TreeConfig {
  std::vector<TreeNode> nodes;  // nodes[0] is the root
};

enum class EnsembleKind { RandomForest, GradientBoosting };

struct ClassifierConfig {
  std::string feature_spec_version;
  EnsembleKind ensemble = EnsembleKind::RandomForest;
  std::vector<std::string> features;
  double decision_threshold = 0.5;  // operating point chosen during tuning
  double base_score = 0.0;          // gradient boosting only
  double learning_rate = 1.0;       // gradient boosting only
  std::vector<TreeConfig> trees;
};

struct RegressorConfig {
  std::string feature_spec_version;
  std::vector<std::string> features;
  std::vector<double> coefficients;
  double intercept = 0.0;
};

// Churn probability cut points: Low <= medium_above < Medium <= high_above < High
struct RiskBands {
  double medium_above = 0.2;
  double high_above = 0.4;
};

// CLV a customer must exceed to be treated as high value. Low-risk customers are
// held to the higher nurture bar.
struct ValueSegmentConfig {
  double high_value_clv = 30000.0;
  double nurture_clv = 40000.0;
};

// Validation metrics recorded by the training pipeline (all optional)
struct ValidationMetrics {
  std::optional<double> roc_auc;
  std::optional<double> precision;
  std::optional<double> recall;
  std::optional<double> f1;
  std::optional<double> clv_r2;
  std::optional<double> clv_rmse;
};

// Serialized scoring bundle: both models plus the feature spec they share
struct ScoringArtifact {
  std::string version = ARTIFACT_VERSION;

  FeatureSpecConfig feature_spec;
  ClassifierConfig classifier;
  RegressorConfig regressor;

  RiskBands risk_bands;
  ValueSegmentConfig value_segments;

  ValidationMetrics metrics;

  // Serialization
  [[nodiscard]] static ScoringArtifact from_json(const std::string& path);
  [[nodiscard]] static ScoringArtifact from_json_string(const std::string& json_str);
  [[nodiscard]] static ScoringArtifact from_msgpack(const std::string& path);
  [[nodiscard]] static ScoringArtifact from_msgpack_string(const std::string& data);

  void to_json(const std::string& path) const;
  [[nodiscard]] std::string to_json_string() const;
  void to_msgpack(const std::string& path) const;
  [[nodiscard]] std::string to_msgpack_string() const;

  // Structural checks that need no feature resolution. Throws ModelLoadError.
  void validate() const;

  [[nodiscard]] std::size_t n_trees() const noexcept { return classifier.trees.size(); }
};

[[nodiscard]] const char* to_string(EnsembleKind kind) noexcept;

}  // namespace telescore
