#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include <telescore/customer.hpp>
#include <telescore/model_registry.hpp>
#include <telescore/scoring.hpp>

namespace telescore {

// Parse one customer record. Every field is required; snake_case keys and the
// legacy camelCase keys (accountLength, areaCode, ...) are both accepted.
// Throws ValidationError naming the offending field.
[[nodiscard]] CustomerRecord parse_customer_record(const nlohmann::json& j);
[[nodiscard]] CustomerRecord parse_customer_record(const std::string& json_str);

// Accepts a single object or an array of objects
[[nodiscard]] std::vector<CustomerRecord> parse_customer_records(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const PredictionResult& result);
[[nodiscard]] nlohmann::json to_json(const ScoringFailure& failure);
[[nodiscard]] nlohmann::json to_json(const RegistrySummary& summary);

// {"predictions": [...], "count": n, "failed": k}; failures are inlined as {"error": ...}
[[nodiscard]] nlohmann::json to_json(const std::vector<ScoreOutcome>& outcomes);

}  // namespace telescore
