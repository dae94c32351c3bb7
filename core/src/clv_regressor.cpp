#include <fmt/format.h>

#include <cmath>
#include <stdexcept>
#include <telescore/clv_regressor.hpp>
#include <telescore/errors.hpp>
#include <telescore/tracy.hpp>

namespace telescore {

ClvRegressor::ClvRegressor(const RegressorConfig& config, const FeatureSpec& spec)
    : intercept_(config.intercept) {
  if (config.feature_spec_version != spec.version()) {
    throw ModelLoadError(fmt::format(
        "regressor was trained against feature spec '{}' but the artifact ships '{}'",
        config.feature_spec_version, spec.version()));
  }

  if (config.coefficients.size() != config.features.size()) {
    throw ModelLoadError(fmt::format("regressor has {} coefficients for {} features",
                                     config.coefficients.size(), config.features.size()));
  }

  if (!std::isfinite(intercept_)) {
    throw ModelLoadError("regressor intercept must be finite");
  }

  view_ = spec.make_view(config.features);

  coefficients_.resize(static_cast<Eigen::Index>(config.coefficients.size()));
  for (std::size_t i = 0; i < config.coefficients.size(); ++i) {
    double c = config.coefficients[i];
    if (!std::isfinite(c)) {
      throw ModelLoadError(
          fmt::format("regressor coefficient for '{}' must be finite", config.features[i]));
    }
    coefficients_(static_cast<Eigen::Index>(i)) = c;
  }
}

double ClvRegressor::raw_predict(const FeatureVector& x) const {
  TELESCORE_ZONE;
  if (x.size() != coefficients_.size()) {
    throw std::invalid_argument(fmt::format("regressor expects {} features, got {}",
                                            coefficients_.size(), x.size()));
  }

  double estimate = intercept_ + coefficients_.dot(x);
  if (!std::isfinite(estimate)) {
    throw InferenceError("regressor produced a non-finite estimate");
  }
  return estimate;
}

double ClvRegressor::predict(const FeatureVector& x) const {
  double estimate = raw_predict(x);
  return estimate < 0.0 ? 0.0 : estimate;
}

}  // namespace telescore
