#pragma once
#include <Eigen/Dense>
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <telescore/artifact.hpp>

namespace telescore {

using FeatureVector = Eigen::VectorXd;

// Numeric columns, in canonical layout order
enum class NumericField : std::size_t {
  AccountLength,
  VoicemailMessages,
  DayMinutes,
  DayCalls,
  DayCharge,
  EveningMinutes,
  EveningCalls,
  EveningCharge,
  NightMinutes,
  NightCalls,
  NightCharge,
  InternationalMinutes,
  InternationalCalls,
  InternationalCharge,
  CustomerServiceCalls,
};

inline constexpr std::size_t NUMERIC_FIELD_COUNT = 15;

inline constexpr std::array<std::string_view, NUMERIC_FIELD_COUNT> NUMERIC_FIELD_NAMES = {
    "account_length",        "voicemail_messages",  "day_minutes",
    "day_calls",             "day_charge",          "evening_minutes",
    "evening_calls",         "evening_charge",      "night_minutes",
    "night_calls",           "night_charge",        "international_minutes",
    "international_calls",   "international_charge", "customer_service_calls",
};

inline constexpr std::string_view INTERNATIONAL_PLAN_COLUMN = "international_plan";
inline constexpr std::string_view VOICEMAIL_PLAN_COLUMN = "voicemail_plan";

[[nodiscard]] constexpr std::string_view name_of(NumericField field) noexcept {
  return NUMERIC_FIELD_NAMES[static_cast<std::size_t>(field)];
}

// Ordered subset of the full feature vector consumed by one model
class FeatureView {
public:
  FeatureView() = default;
  FeatureView(std::vector<std::string> names, std::vector<Eigen::Index> columns);

  [[nodiscard]] std::size_t size() const noexcept { return columns_.size(); }
  [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }
  [[nodiscard]] const std::vector<Eigen::Index>& columns() const noexcept { return columns_; }

  [[nodiscard]] FeatureVector project(const FeatureVector& full) const;

private:
  std::vector<std::string> names_;
  std::vector<Eigen::Index> columns_;
};

// Immutable, versioned feature layout shared by the classifier and the regressor.
//
// Layout: 15 numeric columns (z-scaled), international_plan, voicemail_plan,
// one "state=<code>" column per state, one "area_code=<code>" column per area code.
class FeatureSpec {
public:
  // Throws ModelLoadError on empty/duplicate vocabularies or missing/invalid scaling.
  explicit FeatureSpec(const FeatureSpecConfig& config);

  [[nodiscard]] const std::string& version() const noexcept { return version_; }
  [[nodiscard]] std::size_t size() const noexcept { return columns_.size(); }
  [[nodiscard]] const std::vector<std::string>& column_names() const noexcept { return columns_; }

  [[nodiscard]] std::optional<Eigen::Index> column_index(std::string_view name) const;
  [[nodiscard]] std::optional<Eigen::Index> state_column(std::string_view code) const;
  [[nodiscard]] std::optional<Eigen::Index> area_code_column(std::string_view code) const;

  [[nodiscard]] const ScalingParams& scaling(NumericField field) const noexcept {
    return scaling_[static_cast<std::size_t>(field)];
  }

  [[nodiscard]] std::size_t n_states() const noexcept { return states_.size(); }
  [[nodiscard]] std::size_t n_area_codes() const noexcept { return area_codes_.size(); }

  // Resolve feature names against the layout. Throws ModelLoadError on unknown names.
  [[nodiscard]] FeatureView make_view(std::span<const std::string> names) const;

private:
  std::string version_;
  std::array<ScalingParams, NUMERIC_FIELD_COUNT> scaling_{};
  std::vector<std::string> columns_;
  std::map<std::string, Eigen::Index, std::less<>> column_index_;
  std::map<std::string, Eigen::Index, std::less<>> states_;
  std::map<std::string, Eigen::Index, std::less<>> area_codes_;
};

}  // namespace telescore
