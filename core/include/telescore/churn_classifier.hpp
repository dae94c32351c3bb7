#pragma once
#include <cstddef>
#include <vector>

#include <telescore/artifact.hpp>
#include <telescore/feature_spec.hpp>

namespace telescore {

// Fitted decision tree over a model view. x[feature] <= threshold goes left.
class DecisionTree {
public:
  // Throws ModelLoadError on empty trees, bad child links or out-of-view features.
  DecisionTree(std::vector<TreeNode> nodes, std::size_t n_features);

  [[nodiscard]] double evaluate(const FeatureVector& x) const;

  [[nodiscard]] std::size_t n_nodes() const noexcept { return nodes_.size(); }
  [[nodiscard]] const std::vector<TreeNode>& nodes() const noexcept { return nodes_; }

private:
  std::vector<TreeNode> nodes_;
};

// Tree-ensemble churn model. Immutable after construction; safe to share across threads.
class ChurnClassifier {
public:
  // Resolves the feature view and validates every tree. Throws ModelLoadError.
  ChurnClassifier(const ClassifierConfig& config, const FeatureSpec& spec);

  // Churn probability in [0, 1] for an input already projected onto view().
  [[nodiscard]] double predict(const FeatureVector& x) const;

  // Binary label at the tuned operating point
  [[nodiscard]] bool is_churn(double probability) const noexcept {
    return probability >= decision_threshold_;
  }

  [[nodiscard]] const FeatureView& view() const noexcept { return view_; }
  [[nodiscard]] EnsembleKind ensemble() const noexcept { return ensemble_; }
  [[nodiscard]] double decision_threshold() const noexcept { return decision_threshold_; }
  [[nodiscard]] std::size_t n_trees() const noexcept { return trees_.size(); }

private:
  FeatureView view_;
  EnsembleKind ensemble_;
  double decision_threshold_;
  double base_score_;
  double learning_rate_;
  std::vector<DecisionTree> trees_;
};

}  // namespace telescore
