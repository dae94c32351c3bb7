#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <telescore/churn_classifier.hpp>
#include <telescore/errors.hpp>
#include <telescore/tracy.hpp>
#include <utility>

namespace telescore {

namespace {

  double sigmoid(double z) { return 1.0 / (1.0 + std::exp(-z)); }

}  // namespace

// =============================================================================
// DecisionTree
// =============================================================================

DecisionTree::DecisionTree(std::vector<TreeNode> nodes, std::size_t n_features)
    : nodes_(std::move(nodes)) {
  if (nodes_.empty()) {
    throw ModelLoadError("decision tree has no nodes");
  }

  auto n_nodes = static_cast<int>(nodes_.size());
  for (int i = 0; i < n_nodes; ++i) {
    const auto& node = nodes_[static_cast<std::size_t>(i)];

    if (!std::isfinite(node.value) || !std::isfinite(node.threshold)) {
      throw ModelLoadError(fmt::format("tree node {} has a non-finite value", i));
    }
    if (node.is_leaf()) continue;

    // Children strictly after their parent: traversal always terminates
    if (node.left <= i || node.right <= i || node.left >= n_nodes || node.right >= n_nodes) {
      throw ModelLoadError(fmt::format(
          "tree node {} has invalid children ({}, {}) for {} nodes", i, node.left, node.right,
          n_nodes));
    }
    if (node.feature < 0 || static_cast<std::size_t>(node.feature) >= n_features) {
      throw ModelLoadError(fmt::format("tree node {} splits on feature {} outside a view of {}",
                                       i, node.feature, n_features));
    }
  }
}

double DecisionTree::evaluate(const FeatureVector& x) const {
  std::size_t i = 0;
  while (!nodes_[i].is_leaf()) {
    const auto& node = nodes_[i];
    i = static_cast<std::size_t>(x(node.feature) <= node.threshold ? node.left : node.right);
  }
  return nodes_[i].value;
}

// =============================================================================
// ChurnClassifier
// =============================================================================

ChurnClassifier::ChurnClassifier(const ClassifierConfig& config, const FeatureSpec& spec)
    : ensemble_(config.ensemble),
      decision_threshold_(config.decision_threshold),
      base_score_(config.base_score),
      learning_rate_(config.learning_rate) {
  if (config.feature_spec_version != spec.version()) {
    throw ModelLoadError(fmt::format(
        "classifier was trained against feature spec '{}' but the artifact ships '{}'",
        config.feature_spec_version, spec.version()));
  }

  if (!(decision_threshold_ > 0.0 && decision_threshold_ < 1.0)) {
    throw ModelLoadError(
        fmt::format("decision_threshold must be in (0, 1), got {}", decision_threshold_));
  }

  if (!std::isfinite(base_score_) || !std::isfinite(learning_rate_) || learning_rate_ <= 0.0) {
    throw ModelLoadError(fmt::format("invalid boosting parameters: base_score={}, learning_rate={}",
                                     base_score_, learning_rate_));
  }

  if (config.trees.empty()) {
    throw ModelLoadError("classifier ensemble has no trees");
  }

  view_ = spec.make_view(config.features);

  trees_.reserve(config.trees.size());
  for (std::size_t t = 0; t < config.trees.size(); ++t) {
    try {
      trees_.emplace_back(config.trees[t].nodes, view_.size());
    } catch (const ModelLoadError& e) {
      throw ModelLoadError(fmt::format("classifier tree {}: {}", t, e.what()));
    }

    if (ensemble_ == EnsembleKind::RandomForest) {
      for (const auto& node : trees_.back().nodes()) {
        if (node.is_leaf() && (node.value < 0.0 || node.value > 1.0)) {
          throw ModelLoadError(fmt::format(
              "classifier tree {} has a leaf probability {} outside [0, 1]", t, node.value));
        }
      }
    }
  }
}

double ChurnClassifier::predict(const FeatureVector& x) const {
  TELESCORE_ZONE;
  if (static_cast<std::size_t>(x.size()) != view_.size()) {
    throw std::invalid_argument(fmt::format("classifier expects {} features, got {}",
                                            view_.size(), x.size()));
  }

  double sum = 0.0;
  for (const auto& tree : trees_) {
    sum += tree.evaluate(x);
  }

  double probability = 0.0;
  switch (ensemble_) {
    case EnsembleKind::RandomForest:
      probability = sum / static_cast<double>(trees_.size());
      break;
    case EnsembleKind::GradientBoosting:
      probability = sigmoid(base_score_ + learning_rate_ * sum);
      break;
  }

  if (!std::isfinite(probability)) {
    throw InferenceError("classifier produced a non-finite probability");
  }
  return std::clamp(probability, 0.0, 1.0);
}

}  // namespace telescore
