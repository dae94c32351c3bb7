#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <telescore/risk_scorer.hpp>

namespace telescore {

namespace {

  void check_probability(double probability) {
    if (!(probability >= 0.0 && probability <= 1.0)) {
      throw std::invalid_argument(
          fmt::format("churn probability must be in [0, 1], got {}", probability));
    }
  }

}  // namespace

std::string_view to_string(RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::Low:
      return "Low";
    case RiskLevel::Medium:
      return "Medium";
    case RiskLevel::High:
      return "High";
  }
  return "Unknown";
}

std::string_view to_string(ConfidenceLabel label) noexcept {
  switch (label) {
    case ConfidenceLabel::Low:
      return "Low";
    case ConfidenceLabel::Moderate:
      return "Moderate";
    case ConfidenceLabel::High:
      return "High";
    case ConfidenceLabel::VeryHigh:
      return "Very High";
  }
  return "Unknown";
}

RiskScorer::RiskScorer(RiskBands bands) : bands_(bands) {
  if (!(bands_.medium_above > 0.0 && bands_.medium_above < bands_.high_above
        && bands_.high_above < 1.0)) {
    throw std::invalid_argument(
        fmt::format("risk cut points must satisfy 0 < medium_above < high_above < 1, got {} / {}",
                    bands_.medium_above, bands_.high_above));
  }
  saturation_ = std::min(bands_.medium_above, 1.0 - bands_.high_above);
}

RiskLevel RiskScorer::band(double probability) const {
  check_probability(probability);
  if (probability > bands_.high_above) return RiskLevel::High;
  if (probability > bands_.medium_above) return RiskLevel::Medium;
  return RiskLevel::Low;
}

double RiskScorer::confidence(double probability) const {
  check_probability(probability);
  double distance = std::min(std::abs(probability - bands_.medium_above),
                             std::abs(probability - bands_.high_above));
  return std::min(1.0, distance / saturation_);
}

RiskAssessment RiskScorer::score(double probability) const {
  double c = confidence(probability);
  return RiskAssessment{.level = band(probability), .confidence = c, .label = label_for(c)};
}

ConfidenceLabel RiskScorer::label_for(double confidence) noexcept {
  if (confidence >= 0.75) return ConfidenceLabel::VeryHigh;
  if (confidence >= 0.5) return ConfidenceLabel::High;
  if (confidence >= 0.25) return ConfidenceLabel::Moderate;
  return ConfidenceLabel::Low;
}

}  // namespace telescore
