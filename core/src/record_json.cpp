#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <telescore/errors.hpp>
#include <telescore/record_json.hpp>

namespace telescore {

using json = nlohmann::json;

namespace {

  // Canonical key plus the camelCase key used by the legacy HTTP service
  struct FieldKey {
    std::string_view name;
    std::string_view alias;
  };

  constexpr FieldKey ACCOUNT_LENGTH{"account_length", "accountLength"};
  constexpr FieldKey STATE{"state", "state"};
  constexpr FieldKey AREA_CODE{"area_code", "areaCode"};
  constexpr FieldKey INTERNATIONAL_PLAN{"international_plan", "internationalPlan"};
  constexpr FieldKey VOICEMAIL_PLAN{"voicemail_plan", "voiceMailPlan"};
  constexpr FieldKey VOICEMAIL_MESSAGES{"voicemail_messages", "numberOfVmailMessages"};
  constexpr FieldKey DAY_MINUTES{"day_minutes", "totalDayMinutes"};
  constexpr FieldKey DAY_CALLS{"day_calls", "totalDayCalls"};
  constexpr FieldKey DAY_CHARGE{"day_charge", "totalDayCharge"};
  constexpr FieldKey EVENING_MINUTES{"evening_minutes", "totalEveMinutes"};
  constexpr FieldKey EVENING_CALLS{"evening_calls", "totalEveCalls"};
  constexpr FieldKey EVENING_CHARGE{"evening_charge", "totalEveCharge"};
  constexpr FieldKey NIGHT_MINUTES{"night_minutes", "totalNightMinutes"};
  constexpr FieldKey NIGHT_CALLS{"night_calls", "totalNightCalls"};
  constexpr FieldKey NIGHT_CHARGE{"night_charge", "totalNightCharge"};
  constexpr FieldKey INTL_MINUTES{"international_minutes", "totalIntlMinutes"};
  constexpr FieldKey INTL_CALLS{"international_calls", "totalIntlCalls"};
  constexpr FieldKey INTL_CHARGE{"international_charge", "totalIntlCharge"};
  constexpr FieldKey SERVICE_CALLS{"customer_service_calls", "customerServiceCalls"};

  ValidationError invalid(const FieldKey& key, std::string_view what) {
    return ValidationError(std::string(key.name), fmt::format("field '{}': {}", key.name, what));
  }

  const json& require(const json& j, const FieldKey& key) {
    auto it = j.find(std::string(key.name));
    if (it == j.end()) it = j.find(std::string(key.alias));
    if (it == j.end() || it->is_null()) throw invalid(key, "missing required field");
    return *it;
  }

  int parse_count(const json& j, const FieldKey& key) {
    const json& v = require(j, key);
    if (v.is_number_unsigned()) {
      auto n = v.get<std::uint64_t>();
      if (n > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw invalid(key, "value out of range");
      }
      return static_cast<int>(n);
    }
    if (v.is_number_integer()) {
      auto n = v.get<std::int64_t>();
      if (n < 0) throw invalid(key, fmt::format("must be non-negative, got {}", n));
      if (n > std::numeric_limits<int>::max()) throw invalid(key, "value out of range");
      return static_cast<int>(n);
    }
    if (v.is_number_float()) {
      double d = v.get<double>();
      if (!std::isfinite(d) || d != std::trunc(d)) {
        throw invalid(key, fmt::format("must be an integer, got {}", d));
      }
      if (d < 0) throw invalid(key, fmt::format("must be non-negative, got {}", d));
      if (d > std::numeric_limits<int>::max()) throw invalid(key, "value out of range");
      return static_cast<int>(d);
    }
    throw invalid(key, fmt::format("expected integer, got {}", v.type_name()));
  }

  double parse_amount(const json& j, const FieldKey& key) {
    const json& v = require(j, key);
    if (!v.is_number()) throw invalid(key, fmt::format("expected number, got {}", v.type_name()));
    double d = v.get<double>();
    if (!std::isfinite(d)) throw invalid(key, "must be finite");
    if (d < 0) throw invalid(key, fmt::format("must be non-negative, got {}", d));
    return d;
  }

  bool parse_flag(const json& j, const FieldKey& key) {
    const json& v = require(j, key);
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
      std::string s = v.get<std::string>();
      std::ranges::transform(s, s.begin(),
                             [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (s == "yes") return true;
      if (s == "no") return false;
      throw invalid(key, fmt::format("expected \"yes\" or \"no\", got \"{}\"", v.get<std::string>()));
    }
    throw invalid(key, fmt::format("expected boolean or yes/no, got {}", v.type_name()));
  }

  std::string parse_code(const json& j, const FieldKey& key, bool allow_integer) {
    const json& v = require(j, key);
    if (v.is_string()) {
      auto s = v.get<std::string>();
      if (s.empty()) throw invalid(key, "must not be empty");
      return s;
    }
    if (allow_integer && v.is_number_integer() && v.get<std::int64_t>() >= 0) {
      return std::to_string(v.get<std::int64_t>());
    }
    throw invalid(key, fmt::format("expected string, got {}", v.type_name()));
  }

  CallUsage parse_usage(const json& j, const FieldKey& minutes, const FieldKey& calls,
                        const FieldKey& charge) {
    return CallUsage{.minutes = parse_amount(j, minutes),
                     .calls = parse_count(j, calls),
                     .charge = parse_amount(j, charge)};
  }

  json optional_metric(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
  }

}  // namespace

CustomerRecord parse_customer_record(const json& j) {
  if (!j.is_object()) {
    throw ValidationError("record", fmt::format("expected JSON object, got {}", j.type_name()));
  }

  return CustomerRecord{
      .account_length = parse_count(j, ACCOUNT_LENGTH),
      .state = parse_code(j, STATE, false),
      .area_code = parse_code(j, AREA_CODE, true),
      .international_plan = parse_flag(j, INTERNATIONAL_PLAN),
      .voicemail_plan = parse_flag(j, VOICEMAIL_PLAN),
      .voicemail_messages = parse_count(j, VOICEMAIL_MESSAGES),
      .day = parse_usage(j, DAY_MINUTES, DAY_CALLS, DAY_CHARGE),
      .evening = parse_usage(j, EVENING_MINUTES, EVENING_CALLS, EVENING_CHARGE),
      .night = parse_usage(j, NIGHT_MINUTES, NIGHT_CALLS, NIGHT_CHARGE),
      .international = parse_usage(j, INTL_MINUTES, INTL_CALLS, INTL_CHARGE),
      .customer_service_calls = parse_count(j, SERVICE_CALLS)};
}

CustomerRecord parse_customer_record(const std::string& json_str) {
  json j;
  try {
    j = json::parse(json_str);
  } catch (const json::parse_error& e) {
    throw ValidationError("record", fmt::format("malformed JSON: {}", e.what()));
  }
  return parse_customer_record(j);
}

std::vector<CustomerRecord> parse_customer_records(const json& j) {
  if (j.is_object()) return {parse_customer_record(j)};
  if (!j.is_array()) {
    throw ValidationError("record",
                          fmt::format("expected object or array, got {}", j.type_name()));
  }

  std::vector<CustomerRecord> records;
  records.reserve(j.size());
  for (const auto& item : j) records.push_back(parse_customer_record(item));
  return records;
}

json to_json(const PredictionResult& result) {
  return json{{"churn_probability", result.churn_probability},
              {"churn_predicted", result.churn_predicted},
              {"churn_risk", std::string(to_string(result.risk_level))},
              {"confidence", std::string(to_string(result.confidence_label))},
              {"confidence_score", result.confidence_score},
              {"estimated_clv", result.clv_estimate},
              {"value_segment", std::string(to_string(result.value_segment))},
              {"recommendation", std::string(to_string(result.recommendation))},
              {"playbook", std::string(result.playbook)},
              {"model_version", result.model_version}};
}

json to_json(const ScoringFailure& failure) {
  json j{{"error", std::string(to_string(failure.kind))},
         {"message", failure.message}};
  if (!failure.field.empty()) j["field"] = failure.field;
  return j;
}

json to_json(const RegistrySummary& summary) {
  return json{
      {"status", "healthy"},
      {"artifact_version", summary.artifact_version},
      {"feature_spec_version", summary.feature_spec_version},
      {"churn_model",
       {{"ensemble", summary.ensemble},
        {"n_trees", summary.n_trees},
        {"n_features", summary.churn_view_size},
        {"decision_threshold", summary.decision_threshold}}},
      {"clv_model", {{"n_features", summary.clv_view_size}}},
      {"n_features", summary.n_features},
      {"risk_bands",
       {{"medium_above", summary.risk_bands.medium_above},
        {"high_above", summary.risk_bands.high_above}}},
      {"value_segments",
       {{"high_value_clv", summary.value_segments.high_value_clv},
        {"nurture_clv", summary.value_segments.nurture_clv}}},
      {"metrics",
       {{"roc_auc", optional_metric(summary.metrics.roc_auc)},
        {"precision", optional_metric(summary.metrics.precision)},
        {"recall", optional_metric(summary.metrics.recall)},
        {"f1", optional_metric(summary.metrics.f1)},
        {"clv_r2", optional_metric(summary.metrics.clv_r2)},
        {"clv_rmse", optional_metric(summary.metrics.clv_rmse)}}}};
}

json to_json(const std::vector<ScoreOutcome>& outcomes) {
  json predictions = json::array();
  std::size_t failed = 0;
  for (const auto& outcome : outcomes) {
    if (outcome) {
      predictions.push_back(to_json(*outcome));
    } else {
      predictions.push_back(to_json(outcome.error()));
      ++failed;
    }
  }
  return json{{"predictions", std::move(predictions)},
              {"count", outcomes.size()},
              {"failed", failed}};
}

}  // namespace telescore
