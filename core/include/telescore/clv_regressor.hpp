#pragma once
#include <telescore/artifact.hpp>
#include <telescore/feature_spec.hpp>

namespace telescore {

// Linear customer-lifetime-value model over its own feature view
class ClvRegressor {
public:
  // Throws ModelLoadError on version mismatch, unknown features or non-finite weights.
  ClvRegressor(const RegressorConfig& config, const FeatureSpec& spec);

  // Non-negative CLV estimate. Negative raw outputs clamp to exactly 0.
  [[nodiscard]] double predict(const FeatureVector& x) const;

  // Unclamped model output
  [[nodiscard]] double raw_predict(const FeatureVector& x) const;

  [[nodiscard]] const FeatureView& view() const noexcept { return view_; }
  [[nodiscard]] const Eigen::VectorXd& coefficients() const noexcept { return coefficients_; }
  [[nodiscard]] double intercept() const noexcept { return intercept_; }

private:
  FeatureView view_;
  Eigen::VectorXd coefficients_;
  double intercept_;
};

}  // namespace telescore
