#include <algorithm>
#include <cstdlib>
#include <exception>
#include <memory>
#include <new>
#include <nlohmann/json.hpp>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "telescore.h"
#include <telescore/errors.hpp>
#include <telescore/model_registry.hpp>
#include <telescore/record_json.hpp>
#include <telescore/scoring.hpp>

using telescore::ModelRegistry;

struct TelescoreEngine {
  std::shared_ptr<const ModelRegistry> registry;
  telescore::ScoringOptions options;
};

namespace {

  void set_error(TelescoreErrorCode* error_out, TelescoreErrorCode code) {
    if (error_out) *error_out = code;
  }

  char* str_duplicate(std::string_view str) {
    char* result = static_cast<char*>(malloc(str.length() + 1));
    if (result) {
      std::ranges::copy(str, result);
      result[str.length()] = '\0';
    }
    return result;
  }

  TelescoreRiskLevel to_c(telescore::RiskLevel level) {
    switch (level) {
      case telescore::RiskLevel::High:
        return TELESCORE_RISK_HIGH;
      case telescore::RiskLevel::Medium:
        return TELESCORE_RISK_MEDIUM;
      case telescore::RiskLevel::Low:
        break;
    }
    return TELESCORE_RISK_LOW;
  }

  TelescoreAction to_c(telescore::RecommendedAction action) {
    switch (action) {
      case telescore::RecommendedAction::ImmediateRetentionOutreach:
        return TELESCORE_ACTION_IMMEDIATE_RETENTION_OUTREACH;
      case telescore::RecommendedAction::ProactiveEngagement:
        return TELESCORE_ACTION_PROACTIVE_ENGAGEMENT;
      case telescore::RecommendedAction::StandardMaintenance:
        break;
    }
    return TELESCORE_ACTION_STANDARD_MAINTENANCE;
  }

  // Clean up prediction contents (but not the struct itself)
  void cleanup_prediction_contents(TelescorePrediction* prediction) {
    if (!prediction) return;
    free(prediction->confidence_label);
    free(prediction->playbook);
    free(prediction->model_version);
    prediction->confidence_label = nullptr;
    prediction->playbook = nullptr;
    prediction->model_version = nullptr;
  }

  // Fill a zeroed struct; returns false (with contents released) on allocation failure
  bool fill_prediction(const telescore::PredictionResult& src, TelescorePrediction* dst) {
    dst->churn_probability = src.churn_probability;
    dst->churn_predicted = src.churn_predicted ? 1 : 0;
    dst->risk_level = to_c(src.risk_level);
    dst->confidence_score = src.confidence_score;
    dst->clv_estimate = src.clv_estimate;
    dst->high_value = src.value_segment == telescore::ValueSegment::HighValue ? 1 : 0;
    dst->recommendation = to_c(src.recommendation);

    dst->confidence_label = str_duplicate(telescore::to_string(src.confidence_label));
    dst->playbook = str_duplicate(src.playbook);
    dst->model_version = str_duplicate(src.model_version);
    if (!dst->confidence_label || !dst->playbook || !dst->model_version) {
      cleanup_prediction_contents(dst);
      return false;
    }
    return true;
  }

  TelescoreEngine* make_engine(std::shared_ptr<const ModelRegistry> registry) {
    return new TelescoreEngine{.registry = std::move(registry), .options = {}};
  }

}  // namespace

// C API implementation
extern "C" {

TelescoreEngine* telescore_engine_create(const char* artifact_path, TelescoreErrorCode* error_out) {
  if (!artifact_path) {
    set_error(error_out, TELESCORE_ERROR_NULL_INPUT);
    return nullptr;
  }

  try {
    auto engine = make_engine(ModelRegistry::load(artifact_path));
    set_error(error_out, TELESCORE_OK);
    return engine;
  } catch (const telescore::ModelLoadError&) {
    set_error(error_out, TELESCORE_ERROR_MODEL_LOAD);
  } catch (const std::bad_alloc&) {
    set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
  } catch (const std::exception&) {
    set_error(error_out, TELESCORE_ERROR_INTERNAL);
  }
  return nullptr;
}

TelescoreEngine* telescore_engine_create_from_json(const char* json_str,
                                                   TelescoreErrorCode* error_out) {
  if (!json_str) {
    set_error(error_out, TELESCORE_ERROR_NULL_INPUT);
    return nullptr;
  }

  try {
    auto registry
        = std::make_shared<const ModelRegistry>(ModelRegistry::from_json_string(json_str));
    auto engine = make_engine(std::move(registry));
    set_error(error_out, TELESCORE_OK);
    return engine;
  } catch (const telescore::ModelLoadError&) {
    set_error(error_out, TELESCORE_ERROR_MODEL_LOAD);
  } catch (const std::bad_alloc&) {
    set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
  } catch (const std::exception&) {
    set_error(error_out, TELESCORE_ERROR_INTERNAL);
  }
  return nullptr;
}

void telescore_engine_destroy(TelescoreEngine* engine) { delete engine; }

TelescorePrediction* telescore_engine_score_json(TelescoreEngine* engine, const char* record_json,
                                                 TelescoreErrorCode* error_out) {
  if (!engine) {
    set_error(error_out, TELESCORE_ERROR_NULL_ENGINE);
    return nullptr;
  }
  if (!record_json) {
    set_error(error_out, TELESCORE_ERROR_NULL_INPUT);
    return nullptr;
  }

  try {
    auto record = telescore::parse_customer_record(std::string(record_json));
    auto response = telescore::score_customer(*engine->registry, record, engine->options);

    auto* result = static_cast<TelescorePrediction*>(calloc(1, sizeof(TelescorePrediction)));
    if (!result || !fill_prediction(response, result)) {
      free(result);
      set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }

    set_error(error_out, TELESCORE_OK);
    return result;
  } catch (const telescore::ValidationError&) {
    set_error(error_out, TELESCORE_ERROR_VALIDATION);
  } catch (const std::bad_alloc&) {
    set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
  } catch (const std::exception&) {
    set_error(error_out, TELESCORE_ERROR_INTERNAL);
  }
  return nullptr;
}

TelescoreBatchPrediction* telescore_engine_score_batch_json(TelescoreEngine* engine,
                                                            const char* records_json,
                                                            TelescoreErrorCode* error_out) {
  if (!engine) {
    set_error(error_out, TELESCORE_ERROR_NULL_ENGINE);
    return nullptr;
  }
  if (!records_json) {
    set_error(error_out, TELESCORE_ERROR_NULL_INPUT);
    return nullptr;
  }

  try {
    auto parsed = nlohmann::json::parse(records_json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
      set_error(error_out, TELESCORE_ERROR_VALIDATION);
      return nullptr;
    }

    // Parse per record so one malformed entry fails alone
    std::vector<telescore::CustomerRecord> records(parsed.size());
    std::vector<TelescoreErrorCode> parse_status(parsed.size(), TELESCORE_OK);
    for (std::size_t i = 0; i < parsed.size(); ++i) {
      try {
        records[i] = telescore::parse_customer_record(parsed[i]);
      } catch (const telescore::ValidationError&) {
        parse_status[i] = TELESCORE_ERROR_VALIDATION;
      }
    }

    // Owned until handed to the caller; freed on every early exit or throw
    std::unique_ptr<TelescoreBatchPrediction, decltype(&telescore_batch_prediction_free)> batch(
        static_cast<TelescoreBatchPrediction*>(calloc(1, sizeof(TelescoreBatchPrediction))),
        &telescore_batch_prediction_free);
    if (!batch) {
      set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }

    batch->count = records.size();
    if (records.empty()) {
      set_error(error_out, TELESCORE_OK);
      return batch.release();
    }

    batch->results
        = static_cast<TelescorePrediction*>(calloc(records.size(), sizeof(TelescorePrediction)));
    batch->status = static_cast<TelescoreErrorCode*>(malloc(sizeof(TelescoreErrorCode) * records.size()));
    if (!batch->results || !batch->status) {
      set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }
    std::ranges::copy(parse_status, batch->status);

    // Only records that parsed are scored; indices map back to the input array
    std::vector<std::size_t> valid_idx;
    std::vector<telescore::CustomerRecord> valid;
    for (std::size_t i = 0; i < records.size(); ++i) {
      if (parse_status[i] == TELESCORE_OK) {
        valid_idx.push_back(i);
        valid.push_back(std::move(records[i]));
      }
    }

    auto outcomes = telescore::score_batch(*engine->registry, valid, engine->options);
    for (std::size_t k = 0; k < outcomes.size(); ++k) {
      std::size_t i = valid_idx[k];
      if (!outcomes[k]) {
        batch->status[i] = outcomes[k].error().kind == telescore::FailureKind::Validation
                               ? TELESCORE_ERROR_VALIDATION
                               : TELESCORE_ERROR_INTERNAL;
        continue;
      }
      if (!fill_prediction(*outcomes[k], &batch->results[i])) {
        set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
        return nullptr;
      }
    }

    set_error(error_out, TELESCORE_OK);
    return batch.release();
  } catch (const std::bad_alloc&) {
    set_error(error_out, TELESCORE_ERROR_ALLOCATION_FAILED);
  } catch (const std::exception&) {
    set_error(error_out, TELESCORE_ERROR_INTERNAL);
  }
  return nullptr;
}

void telescore_prediction_free(TelescorePrediction* prediction) {
  if (!prediction) return;
  cleanup_prediction_contents(prediction);
  free(prediction);
}

void telescore_batch_prediction_free(TelescoreBatchPrediction* result) {
  if (!result) return;

  if (result->results) {
    auto results_span = std::span(result->results, result->count);
    std::ranges::for_each(results_span,
                          [](TelescorePrediction& p) { cleanup_prediction_contents(&p); });
    free(result->results);
  }
  free(result->status);
  free(result);
}

char* telescore_engine_feature_spec_version(TelescoreEngine* engine) {
  if (!engine) {
    return nullptr;
  }
  return str_duplicate(engine->registry->feature_spec().version());
}

void telescore_string_free(char* str) { free(str); }

}  // extern "C"
