#pragma once
#include <string_view>

#include <telescore/artifact.hpp>
#include <telescore/risk_scorer.hpp>

namespace telescore {

enum class RecommendedAction { ImmediateRetentionOutreach, ProactiveEngagement, StandardMaintenance };

enum class ValueSegment { Standard, HighValue };

// Total over the three risk levels; depends on nothing else.
[[nodiscard]] constexpr RecommendedAction recommend(RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::High:
      return RecommendedAction::ImmediateRetentionOutreach;
    case RiskLevel::Medium:
      return RecommendedAction::ProactiveEngagement;
    case RiskLevel::Low:
      return RecommendedAction::StandardMaintenance;
  }
  return RecommendedAction::StandardMaintenance;
}

// Strictly above the bar for the action's band
[[nodiscard]] constexpr ValueSegment classify_value(double clv, RecommendedAction action,
                                                    const ValueSegmentConfig& config) noexcept {
  double bar = action == RecommendedAction::StandardMaintenance ? config.nurture_clv
                                                                : config.high_value_clv;
  return clv > bar ? ValueSegment::HighValue : ValueSegment::Standard;
}

[[nodiscard]] std::string_view to_string(RecommendedAction action) noexcept;
[[nodiscard]] std::string_view to_string(ValueSegment segment) noexcept;

// Account-team note for an action, tailored to the customer's value segment
[[nodiscard]] std::string_view playbook(RecommendedAction action, ValueSegment segment) noexcept;

}  // namespace telescore
