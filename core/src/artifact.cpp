#include <fcntl.h>
#include <fmt/format.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <telescore/artifact.hpp>
#include <telescore/errors.hpp>
#include <telescore/tracy.hpp>
#include <utility>

namespace telescore {

using json = nlohmann::json;

namespace {

  EnsembleKind parse_ensemble(const std::string& name) {
    if (name == "random_forest") return EnsembleKind::RandomForest;
    if (name == "gradient_boosting") return EnsembleKind::GradientBoosting;
    throw ModelLoadError(fmt::format("unknown ensemble kind '{}'", name));
  }

  std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
  }

}  // namespace

const char* to_string(EnsembleKind kind) noexcept {
  switch (kind) {
    case EnsembleKind::RandomForest:
      return "random_forest";
    case EnsembleKind::GradientBoosting:
      return "gradient_boosting";
  }
  return "unknown";
}

// ============================================================================
// JSON Serialization - FeatureSpecConfig
// ============================================================================

void to_json(json& j, const ScalingParams& s) { j = {{"mean", s.mean}, {"std", s.stddev}}; }

void from_json(const json& j, ScalingParams& s) {
  j.at("mean").get_to(s.mean);
  j.at("std").get_to(s.stddev);
}

void to_json(json& j, const FeatureSpecConfig& f) {
  j = {{"version", f.version},
       {"states", f.states},
       {"area_codes", f.area_codes},
       {"scaling", f.scaling}};
}

void from_json(const json& j, FeatureSpecConfig& f) {
  j.at("version").get_to(f.version);
  j.at("states").get_to(f.states);
  j.at("area_codes").get_to(f.area_codes);
  j.at("scaling").get_to(f.scaling);
}

// ============================================================================
// JSON Serialization - Models
// ============================================================================

void to_json(json& j, const TreeNode& n) {
  if (n.is_leaf()) {
    j = {{"value", n.value}};
    return;
  }
  j = {{"feature", n.feature}, {"threshold", n.threshold}, {"left", n.left}, {"right", n.right}};
}

void from_json(const json& j, TreeNode& n) {
  n.feature = j.value("feature", -1);
  n.threshold = j.value("threshold", 0.0);
  n.left = j.value("left", -1);
  n.right = j.value("right", -1);
  // A leaf without a prediction is malformed, never an implicit 0
  n.value = n.is_leaf() ? j.at("value").get<double>() : j.value("value", 0.0);
}

void to_json(json& j, const TreeConfig& t) { j = {{"nodes", t.nodes}}; }

void from_json(const json& j, TreeConfig& t) { j.at("nodes").get_to(t.nodes); }

void to_json(json& j, const ClassifierConfig& c) {
  j = {{"feature_spec_version", c.feature_spec_version},
       {"ensemble", to_string(c.ensemble)},
       {"features", c.features},
       {"decision_threshold", c.decision_threshold},
       {"base_score", c.base_score},
       {"learning_rate", c.learning_rate},
       {"trees", c.trees}};
}

void from_json(const json& j, ClassifierConfig& c) {
  j.at("feature_spec_version").get_to(c.feature_spec_version);
  c.ensemble = parse_ensemble(j.value("ensemble", "random_forest"));
  j.at("features").get_to(c.features);
  j.at("decision_threshold").get_to(c.decision_threshold);
  c.base_score = j.value("base_score", 0.0);
  c.learning_rate = j.value("learning_rate", 1.0);
  j.at("trees").get_to(c.trees);
}

void to_json(json& j, const RegressorConfig& r) {
  j = {{"feature_spec_version", r.feature_spec_version},
       {"features", r.features},
       {"coefficients", r.coefficients},
       {"intercept", r.intercept}};
}

void from_json(const json& j, RegressorConfig& r) {
  j.at("feature_spec_version").get_to(r.feature_spec_version);
  j.at("features").get_to(r.features);
  j.at("coefficients").get_to(r.coefficients);
  j.at("intercept").get_to(r.intercept);
}

// ============================================================================
// JSON Serialization - Scoring configuration
// ============================================================================

void to_json(json& j, const RiskBands& b) {
  j = {{"medium_above", b.medium_above}, {"high_above", b.high_above}};
}

void from_json(const json& j, RiskBands& b) {
  b.medium_above = j.value("medium_above", 0.2);
  b.high_above = j.value("high_above", 0.4);
}

void to_json(json& j, const ValueSegmentConfig& v) {
  j = {{"high_value_clv", v.high_value_clv}, {"nurture_clv", v.nurture_clv}};
}

void from_json(const json& j, ValueSegmentConfig& v) {
  v.high_value_clv = j.value("high_value_clv", 30000.0);
  v.nurture_clv = j.value("nurture_clv", 40000.0);
}

void to_json(json& j, const ValidationMetrics& m) {
  j = json::object();
  if (m.roc_auc) j["roc_auc"] = *m.roc_auc;
  if (m.precision) j["precision"] = *m.precision;
  if (m.recall) j["recall"] = *m.recall;
  if (m.f1) j["f1"] = *m.f1;
  if (m.clv_r2) j["clv_r2"] = *m.clv_r2;
  if (m.clv_rmse) j["clv_rmse"] = *m.clv_rmse;
}

void from_json(const json& j, ValidationMetrics& m) {
  if (j.contains("roc_auc")) m.roc_auc = j["roc_auc"].get<double>();
  if (j.contains("precision")) m.precision = j["precision"].get<double>();
  if (j.contains("recall")) m.recall = j["recall"].get<double>();
  if (j.contains("f1")) m.f1 = j["f1"].get<double>();
  if (j.contains("clv_r2")) m.clv_r2 = j["clv_r2"].get<double>();
  if (j.contains("clv_rmse")) m.clv_rmse = j["clv_rmse"].get<double>();
}

// ============================================================================
// JSON File I/O
// ============================================================================

ScoringArtifact ScoringArtifact::from_json(const std::string& path) {
  TELESCORE_ZONE;
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ModelLoadError(fmt::format("Failed to open artifact file: {}", path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return from_json_string(buffer.str());
}

ScoringArtifact ScoringArtifact::from_json_string(const std::string& json_str) {
  TELESCORE_ZONE;
  try {
    json j = json::parse(json_str);

    ScoringArtifact artifact;

    artifact.version = j.value("version", ARTIFACT_VERSION);

    artifact.feature_spec = j.at("feature_spec").get<FeatureSpecConfig>();
    artifact.classifier = j.at("classifier").get<ClassifierConfig>();
    artifact.regressor = j.at("regressor").get<RegressorConfig>();

    // Scoring configuration (defaults match the deployed service)
    if (j.contains("risk_bands")) {
      artifact.risk_bands = j.at("risk_bands").get<RiskBands>();
    }
    if (j.contains("value_segments")) {
      artifact.value_segments = j.at("value_segments").get<ValueSegmentConfig>();
    }

    if (j.contains("metrics")) {
      artifact.metrics = j.at("metrics").get<ValidationMetrics>();
    }

    return artifact;
  } catch (const json::exception& e) {
    throw ModelLoadError(fmt::format("Malformed artifact JSON: {}", e.what()));
  }
}

std::string ScoringArtifact::to_json_string() const {
  json j;

  j["version"] = version;
  j["feature_spec"] = feature_spec;
  j["classifier"] = classifier;
  j["regressor"] = regressor;
  j["risk_bands"] = risk_bands;
  j["value_segments"] = value_segments;
  j["metrics"] = metrics;

  return j.dump(2);
}

void ScoringArtifact::to_json(const std::string& path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(fmt::format("Failed to open artifact file for writing: {}", path));
  }
  file << to_json_string();
}

// ============================================================================
// MessagePack File I/O (with mmap)
// ============================================================================

namespace {

  using ObjectMap = std::map<std::string, msgpack::object>;

  template <typename T> T get_or(const ObjectMap& map, const char* key, T fallback) {
    auto it = map.find(key);
    return it == map.end() ? fallback : it->second.as<T>();
  }

  void pack_tree(msgpack::packer<msgpack::sbuffer>& pk, const TreeConfig& tree) {
    // Dense node rows: [feature, threshold, left, right, value]
    pk.pack_array(static_cast<uint32_t>(tree.nodes.size()));
    for (const auto& node : tree.nodes) {
      pk.pack_array(5);
      pk.pack(node.feature);
      pk.pack(node.threshold);
      pk.pack(node.left);
      pk.pack(node.right);
      pk.pack(node.value);
    }
  }

  TreeConfig unpack_tree(const msgpack::object& obj) {
    TreeConfig tree;
    auto rows = obj.as<std::vector<msgpack::object>>();
    tree.nodes.reserve(rows.size());
    for (const auto& row_obj : rows) {
      auto row = row_obj.as<std::vector<msgpack::object>>();
      if (row.size() != 5) {
        throw ModelLoadError(
            fmt::format("tree node row must have 5 entries, got {}", row.size()));
      }
      tree.nodes.push_back(TreeNode{.feature = row[0].as<int>(),
                                    .threshold = row[1].as<double>(),
                                    .left = row[2].as<int>(),
                                    .right = row[3].as<int>(),
                                    .value = row[4].as<double>()});
    }
    return tree;
  }

}  // namespace

ScoringArtifact ScoringArtifact::from_msgpack(const std::string& path) {
  TELESCORE_ZONE;

  // Open file
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    throw ModelLoadError(fmt::format("Failed to open msgpack file: {}", path));
  }

  // Get file size
  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    close(fd);
    throw ModelLoadError(fmt::format("Failed to stat msgpack file: {}", path));
  }
  auto file_size = static_cast<size_t>(sb.st_size);
  if (file_size == 0) {
    close(fd);
    throw ModelLoadError(fmt::format("Msgpack file is empty: {}", path));
  }

  // Memory map the file
  void* mapped = mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (mapped == MAP_FAILED) {
    close(fd);
    throw ModelLoadError(fmt::format("Failed to mmap msgpack file: {}", path));
  }

  // Parse from mapped memory
  try {
    auto result = from_msgpack_string(std::string(static_cast<const char*>(mapped), file_size));
    munmap(mapped, file_size);
    close(fd);
    return result;
  } catch (...) {
    munmap(mapped, file_size);
    close(fd);
    throw;
  }
}

ScoringArtifact ScoringArtifact::from_msgpack_string(const std::string& data) {
  TELESCORE_ZONE;

  try {
    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<ObjectMap>();

    ScoringArtifact artifact;

    artifact.version = get_or<std::string>(map, "version", ARTIFACT_VERSION);

    // Feature spec
    auto spec = map.at("feature_spec").as<ObjectMap>();
    artifact.feature_spec.version = spec.at("version").as<std::string>();
    artifact.feature_spec.states = spec.at("states").as<std::vector<std::string>>();
    artifact.feature_spec.area_codes = spec.at("area_codes").as<std::vector<std::string>>();
    for (const auto& [name, obj] : spec.at("scaling").as<ObjectMap>()) {
      auto params = obj.as<ObjectMap>();
      artifact.feature_spec.scaling[name]
          = ScalingParams{.mean = params.at("mean").as<double>(),
                          .stddev = params.at("std").as<double>()};
    }

    // Classifier
    auto clf = map.at("classifier").as<ObjectMap>();
    artifact.classifier.feature_spec_version = clf.at("feature_spec_version").as<std::string>();
    artifact.classifier.ensemble
        = parse_ensemble(get_or<std::string>(clf, "ensemble", "random_forest"));
    artifact.classifier.features = clf.at("features").as<std::vector<std::string>>();
    artifact.classifier.decision_threshold = clf.at("decision_threshold").as<double>();
    artifact.classifier.base_score = get_or(clf, "base_score", 0.0);
    artifact.classifier.learning_rate = get_or(clf, "learning_rate", 1.0);
    auto trees = clf.at("trees").as<std::vector<msgpack::object>>();
    artifact.classifier.trees.reserve(trees.size());
    for (const auto& tree_obj : trees) {
      artifact.classifier.trees.push_back(unpack_tree(tree_obj));
    }

    // Regressor
    auto reg = map.at("regressor").as<ObjectMap>();
    artifact.regressor.feature_spec_version = reg.at("feature_spec_version").as<std::string>();
    artifact.regressor.features = reg.at("features").as<std::vector<std::string>>();
    artifact.regressor.coefficients = reg.at("coefficients").as<std::vector<double>>();
    artifact.regressor.intercept = reg.at("intercept").as<double>();

    // Scoring configuration
    if (map.contains("risk_bands")) {
      auto bands = map.at("risk_bands").as<ObjectMap>();
      artifact.risk_bands.medium_above = get_or(bands, "medium_above", 0.2);
      artifact.risk_bands.high_above = get_or(bands, "high_above", 0.4);
    }
    if (map.contains("value_segments")) {
      auto segments = map.at("value_segments").as<ObjectMap>();
      artifact.value_segments.high_value_clv = get_or(segments, "high_value_clv", 30000.0);
      artifact.value_segments.nurture_clv = get_or(segments, "nurture_clv", 40000.0);
    }

    // Validation metrics (optional)
    if (map.contains("metrics")) {
      auto met = map.at("metrics").as<ObjectMap>();
      auto read = [&](const char* key, std::optional<double>& out) {
        if (met.contains(key)) out = met.at(key).as<double>();
      };
      read("roc_auc", artifact.metrics.roc_auc);
      read("precision", artifact.metrics.precision);
      read("recall", artifact.metrics.recall);
      read("f1", artifact.metrics.f1);
      read("clv_r2", artifact.metrics.clv_r2);
      read("clv_rmse", artifact.metrics.clv_rmse);
    }

    return artifact;
  } catch (const ModelLoadError&) {
    throw;
  } catch (const std::exception& e) {
    throw ModelLoadError(fmt::format("Malformed artifact msgpack: {}", e.what()));
  }
}

std::string ScoringArtifact::to_msgpack_string() const {
  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> pk(&buffer);

  // Top-level map with 7 keys
  pk.pack_map(7);

  pk.pack("version");
  pk.pack(version);

  // Feature spec
  pk.pack("feature_spec");
  pk.pack_map(4);
  pk.pack("version");
  pk.pack(feature_spec.version);
  pk.pack("states");
  pk.pack(feature_spec.states);
  pk.pack("area_codes");
  pk.pack(feature_spec.area_codes);
  pk.pack("scaling");
  pk.pack_map(static_cast<uint32_t>(feature_spec.scaling.size()));
  for (const auto& [name, params] : feature_spec.scaling) {
    pk.pack(name);
    pk.pack_map(2);
    pk.pack("mean");
    pk.pack(params.mean);
    pk.pack("std");
    pk.pack(params.stddev);
  }

  // Classifier
  pk.pack("classifier");
  pk.pack_map(7);
  pk.pack("feature_spec_version");
  pk.pack(classifier.feature_spec_version);
  pk.pack("ensemble");
  pk.pack(std::string(to_string(classifier.ensemble)));
  pk.pack("features");
  pk.pack(classifier.features);
  pk.pack("decision_threshold");
  pk.pack(classifier.decision_threshold);
  pk.pack("base_score");
  pk.pack(classifier.base_score);
  pk.pack("learning_rate");
  pk.pack(classifier.learning_rate);
  pk.pack("trees");
  pk.pack_array(static_cast<uint32_t>(classifier.trees.size()));
  for (const auto& tree : classifier.trees) {
    pack_tree(pk, tree);
  }

  // Regressor
  pk.pack("regressor");
  pk.pack_map(4);
  pk.pack("feature_spec_version");
  pk.pack(regressor.feature_spec_version);
  pk.pack("features");
  pk.pack(regressor.features);
  pk.pack("coefficients");
  pk.pack(regressor.coefficients);
  pk.pack("intercept");
  pk.pack(regressor.intercept);

  // Scoring configuration
  pk.pack("risk_bands");
  pk.pack_map(2);
  pk.pack("medium_above");
  pk.pack(risk_bands.medium_above);
  pk.pack("high_above");
  pk.pack(risk_bands.high_above);

  pk.pack("value_segments");
  pk.pack_map(2);
  pk.pack("high_value_clv");
  pk.pack(value_segments.high_value_clv);
  pk.pack("nurture_clv");
  pk.pack(value_segments.nurture_clv);

  // Validation metrics (count non-null fields)
  pk.pack("metrics");
  const std::pair<const char*, const std::optional<double>*> fields[] = {
      {"roc_auc", &metrics.roc_auc}, {"precision", &metrics.precision},
      {"recall", &metrics.recall},   {"f1", &metrics.f1},
      {"clv_r2", &metrics.clv_r2},   {"clv_rmse", &metrics.clv_rmse},
  };
  uint32_t metrics_count = 0;
  for (const auto& [key, value] : fields) {
    if (*value) ++metrics_count;
  }
  pk.pack_map(metrics_count);
  for (const auto& [key, value] : fields) {
    if (*value) {
      pk.pack(key);
      pk.pack(**value);
    }
  }

  return std::string(buffer.data(), buffer.size());
}

void ScoringArtifact::to_msgpack(const std::string& path) const {
  std::string binary_data = to_msgpack_string();
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error(fmt::format("Failed to open msgpack file for writing: {}", path));
  }
  file.write(binary_data.data(), static_cast<std::streamsize>(binary_data.size()));
}

// ============================================================================
// Validation
// ============================================================================

void ScoringArtifact::validate() const {
  if (major_version(version) != major_version(ARTIFACT_VERSION)) {
    throw ModelLoadError(fmt::format("Unsupported artifact version '{}', expected {}.x", version,
                                     major_version(ARTIFACT_VERSION)));
  }

  if (feature_spec.version.empty()) {
    throw ModelLoadError("feature_spec.version must not be empty");
  }

  if (classifier.trees.empty()) {
    throw ModelLoadError("classifier must contain at least one tree");
  }

  for (size_t t = 0; t < classifier.trees.size(); ++t) {
    if (classifier.trees[t].nodes.empty()) {
      throw ModelLoadError(fmt::format("classifier tree {} has no nodes", t));
    }
  }

  if (regressor.coefficients.size() != regressor.features.size()) {
    throw ModelLoadError(fmt::format("regressor has {} coefficients for {} features",
                                     regressor.coefficients.size(), regressor.features.size()));
  }

  if (!(risk_bands.medium_above > 0.0 && risk_bands.medium_above < risk_bands.high_above
        && risk_bands.high_above < 1.0)) {
    throw ModelLoadError(fmt::format(
        "risk_bands must satisfy 0 < medium_above < high_above < 1, got {} / {}",
        risk_bands.medium_above, risk_bands.high_above));
  }

  if (!std::isfinite(value_segments.high_value_clv) || value_segments.high_value_clv < 0.0) {
    throw ModelLoadError(fmt::format("high_value_clv must be a non-negative amount, got {}",
                                     value_segments.high_value_clv));
  }
  if (!std::isfinite(value_segments.nurture_clv) || value_segments.nurture_clv < 0.0) {
    throw ModelLoadError(fmt::format("nurture_clv must be a non-negative amount, got {}",
                                     value_segments.nurture_clv));
  }
}

}  // namespace telescore
