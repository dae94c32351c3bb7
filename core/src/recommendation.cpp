#include <telescore/recommendation.hpp>

namespace telescore {

std::string_view to_string(RecommendedAction action) noexcept {
  switch (action) {
    case RecommendedAction::ImmediateRetentionOutreach:
      return "immediate retention outreach";
    case RecommendedAction::ProactiveEngagement:
      return "proactive engagement";
    case RecommendedAction::StandardMaintenance:
      return "standard maintenance";
  }
  return "unknown";
}

std::string_view to_string(ValueSegment segment) noexcept {
  switch (segment) {
    case ValueSegment::Standard:
      return "standard";
    case ValueSegment::HighValue:
      return "high value";
  }
  return "unknown";
}

std::string_view playbook(RecommendedAction action, ValueSegment segment) noexcept {
  bool high_value = segment == ValueSegment::HighValue;
  switch (action) {
    case RecommendedAction::ImmediateRetentionOutreach:
      return high_value ? "Critical: high-value customer at severe risk. Escalate to an account "
                          "executive and offer the premium retention package."
                        : "High priority: customer likely to churn. Assign a dedicated account "
                          "manager and offer targeted incentives within 24 hours.";
    case RecommendedAction::ProactiveEngagement:
      return high_value ? "Proactive: valuable customer showing warning signs. Schedule a "
                          "personal check-in call and present loyalty rewards."
                        : "Monitor: elevated churn risk. Increase engagement through "
                          "personalized offers and service improvements.";
    case RecommendedAction::StandardMaintenance:
      return high_value ? "Nurture: high-value loyal customer. Continue VIP treatment and "
                          "explore upsell opportunities."
                        : "Maintain: healthy relationship. Continue standard engagement and "
                          "periodic satisfaction surveys.";
  }
  return "";
}

}  // namespace telescore
