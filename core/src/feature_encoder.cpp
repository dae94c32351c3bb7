#include <fmt/format.h>

#include <array>
#include <cmath>
#include <telescore/errors.hpp>
#include <telescore/feature_encoder.hpp>
#include <telescore/tracy.hpp>

namespace telescore {

namespace {

  double checked_count(int value, NumericField field) {
    if (value < 0) {
      throw ValidationError(std::string(name_of(field)),
                            fmt::format("{} must be non-negative, got {}", name_of(field), value));
    }
    return static_cast<double>(value);
  }

  double checked_amount(double value, NumericField field) {
    if (!std::isfinite(value)) {
      throw ValidationError(std::string(name_of(field)),
                            fmt::format("{} must be finite", name_of(field)));
    }
    if (value < 0.0) {
      throw ValidationError(std::string(name_of(field)),
                            fmt::format("{} must be non-negative, got {}", name_of(field), value));
    }
    return value;
  }

  // Raw numeric values in NumericField order
  std::array<double, NUMERIC_FIELD_COUNT> raw_numeric(const CustomerRecord& r) {
    using F = NumericField;
    return {
        checked_count(r.account_length, F::AccountLength),
        checked_count(r.voicemail_messages, F::VoicemailMessages),
        checked_amount(r.day.minutes, F::DayMinutes),
        checked_count(r.day.calls, F::DayCalls),
        checked_amount(r.day.charge, F::DayCharge),
        checked_amount(r.evening.minutes, F::EveningMinutes),
        checked_count(r.evening.calls, F::EveningCalls),
        checked_amount(r.evening.charge, F::EveningCharge),
        checked_amount(r.night.minutes, F::NightMinutes),
        checked_count(r.night.calls, F::NightCalls),
        checked_amount(r.night.charge, F::NightCharge),
        checked_amount(r.international.minutes, F::InternationalMinutes),
        checked_count(r.international.calls, F::InternationalCalls),
        checked_amount(r.international.charge, F::InternationalCharge),
        checked_count(r.customer_service_calls, F::CustomerServiceCalls),
    };
  }

}  // namespace

FeatureVector FeatureEncoder::encode(const CustomerRecord& record) const {
  TELESCORE_ZONE;
  auto raw = raw_numeric(record);

  if (record.state.empty()) {
    throw ValidationError("state", "state is required");
  }
  auto state_col = spec_.state_column(record.state);
  if (!state_col) {
    throw ValidationError("state",
                          fmt::format("state '{}' is not in the training vocabulary of '{}'",
                                      record.state, spec_.version()));
  }

  if (record.area_code.empty()) {
    throw ValidationError("area_code", "area_code is required");
  }
  auto area_col = spec_.area_code_column(record.area_code);
  if (!area_col) {
    throw ValidationError("area_code",
                          fmt::format("area_code '{}' is not in the training vocabulary of '{}'",
                                      record.area_code, spec_.version()));
  }

  FeatureVector features = FeatureVector::Zero(static_cast<Eigen::Index>(spec_.size()));

  for (std::size_t i = 0; i < NUMERIC_FIELD_COUNT; ++i) {
    const auto& params = spec_.scaling(static_cast<NumericField>(i));
    features(static_cast<Eigen::Index>(i)) = (raw[i] - params.mean) / params.stddev;
  }

  features(static_cast<Eigen::Index>(NUMERIC_FIELD_COUNT))
      = record.international_plan ? 1.0 : 0.0;
  features(static_cast<Eigen::Index>(NUMERIC_FIELD_COUNT + 1)) = record.voicemail_plan ? 1.0 : 0.0;
  features(*state_col) = 1.0;
  features(*area_col) = 1.0;

  return features;
}

ModelInputs FeatureEncoder::encode(const CustomerRecord& record, const FeatureView& churn_view,
                                   const FeatureView& clv_view) const {
  FeatureVector full = encode(record);
  return ModelInputs{.churn = churn_view.project(full), .clv = clv_view.project(full)};
}

}  // namespace telescore
