#pragma once
#include <string_view>

#include <telescore/artifact.hpp>

namespace telescore {

enum class RiskLevel { Low, Medium, High };

enum class ConfidenceLabel { Low, Moderate, High, VeryHigh };

struct RiskAssessment {
  RiskLevel level;
  double confidence;  // [0, 1], 0 at a cut point, 1 at p = 0 or p = 1
  ConfidenceLabel label;
};

[[nodiscard]] std::string_view to_string(RiskLevel level) noexcept;
[[nodiscard]] std::string_view to_string(ConfidenceLabel label) noexcept;

// Bands a churn probability and estimates how far it sits from a band boundary
class RiskScorer {
public:
  // Throws std::invalid_argument unless 0 < medium_above < high_above < 1.
  explicit RiskScorer(RiskBands bands);

  [[nodiscard]] RiskAssessment score(double probability) const;

  [[nodiscard]] RiskLevel band(double probability) const;
  [[nodiscard]] double confidence(double probability) const;

  [[nodiscard]] const RiskBands& bands() const noexcept { return bands_; }

  // Distance from a cut point at which confidence saturates to 1
  [[nodiscard]] double saturation_distance() const noexcept { return saturation_; }

  [[nodiscard]] static ConfidenceLabel label_for(double confidence) noexcept;

private:
  RiskBands bands_;
  double saturation_;
};

}  // namespace telescore
