#ifndef TELESCORE_H
#define TELESCORE_H

#include <stddef.h>

/* Cross-platform DLL export/import macros */
#if defined(_WIN32) || defined(_WIN64)
#  ifdef TELESCORE_C_EXPORTS
#    define TELESCORE_API __declspec(dllexport)
#  else
#    define TELESCORE_API __declspec(dllimport)
#  endif
#else
#  if __GNUC__ >= 4
#    define TELESCORE_API __attribute__((visibility("default")))
#  else
#    define TELESCORE_API
#  endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Opaque handle to a loaded scoring engine (model registry)
 */
typedef struct TelescoreEngine TelescoreEngine;

/**
 * Churn risk band
 */
typedef enum {
  TELESCORE_RISK_LOW = 0,
  TELESCORE_RISK_MEDIUM = 1,
  TELESCORE_RISK_HIGH = 2
} TelescoreRiskLevel;

/**
 * Recommended retention action
 */
typedef enum {
  TELESCORE_ACTION_IMMEDIATE_RETENTION_OUTREACH = 0,
  TELESCORE_ACTION_PROACTIVE_ENGAGEMENT = 1,
  TELESCORE_ACTION_STANDARD_MAINTENANCE = 2
} TelescoreAction;

/**
 * Error codes for telescore operations
 */
typedef enum {
  TELESCORE_OK = 0,
  TELESCORE_ERROR_NULL_ENGINE,
  TELESCORE_ERROR_NULL_INPUT,
  TELESCORE_ERROR_VALIDATION,
  TELESCORE_ERROR_MODEL_LOAD,
  TELESCORE_ERROR_ALLOCATION_FAILED,
  TELESCORE_ERROR_INTERNAL
} TelescoreErrorCode;

/**
 * Scoring result for one customer
 */
typedef struct {
  double churn_probability;      /**< Churn probability in [0, 1] */
  int churn_predicted;           /**< 1 if at or above the tuned decision threshold */
  TelescoreRiskLevel risk_level; /**< Risk band */
  double confidence_score;       /**< Distance-based confidence in [0, 1] */
  char* confidence_label;        /**< "Low", "Moderate", "High" or "Very High" */
  double clv_estimate;           /**< Non-negative lifetime value estimate */
  int high_value;                /**< 1 if the customer is in the high-value segment */
  TelescoreAction recommendation; /**< Recommended action */
  char* playbook;                /**< Account-team note for the action */
  char* model_version;           /**< Feature spec version used */
} TelescorePrediction;

/**
 * Batch scoring result. Failed records have status != TELESCORE_OK and a zeroed
 * prediction.
 */
typedef struct {
  TelescorePrediction* results; /**< Array of predictions */
  TelescoreErrorCode* status;   /**< Per-record status */
  size_t count;                 /**< Number of records */
} TelescoreBatchPrediction;

/**
 * Create an engine from an artifact file (JSON, or MessagePack for .msgpack/.mpk/.bin)
 * @param artifact_path Path to the scoring artifact
 * @param error_out Optional error code output (can be NULL)
 * @return Engine handle, or NULL on error
 */
TELESCORE_API TelescoreEngine* telescore_engine_create(const char* artifact_path,
                                                       TelescoreErrorCode* error_out);

/**
 * Create an engine from a JSON artifact string
 * @param json_str JSON string containing the artifact
 * @param error_out Optional error code output (can be NULL)
 * @return Engine handle, or NULL on error
 */
TELESCORE_API TelescoreEngine* telescore_engine_create_from_json(const char* json_str,
                                                                 TelescoreErrorCode* error_out);

/**
 * Destroy an engine and free its resources
 * @param engine Engine handle
 */
TELESCORE_API void telescore_engine_destroy(TelescoreEngine* engine);

/**
 * Score one customer record given as a JSON object
 * @param engine Engine handle
 * @param record_json Customer record JSON
 * @param error_out Optional error code output (can be NULL)
 * @return Prediction (caller must free with telescore_prediction_free), or NULL on error
 */
TELESCORE_API TelescorePrediction* telescore_engine_score_json(TelescoreEngine* engine,
                                                               const char* record_json,
                                                               TelescoreErrorCode* error_out);

/**
 * Score a JSON array of customer records. Records are scored independently.
 * @param engine Engine handle
 * @param records_json JSON array of customer records
 * @param error_out Optional error code output (can be NULL)
 * @return Batch result (caller must free with telescore_batch_prediction_free), or NULL if
 *         the array itself could not be parsed
 */
TELESCORE_API TelescoreBatchPrediction* telescore_engine_score_batch_json(
    TelescoreEngine* engine, const char* records_json, TelescoreErrorCode* error_out);

/**
 * Free a prediction
 * @param prediction Prediction to free
 */
TELESCORE_API void telescore_prediction_free(TelescorePrediction* prediction);

/**
 * Free a batch result
 * @param result Batch result to free
 */
TELESCORE_API void telescore_batch_prediction_free(TelescoreBatchPrediction* result);

/**
 * Get the feature spec version the engine was built with
 * @param engine Engine handle
 * @return Version string (caller must free with telescore_string_free), or NULL
 */
TELESCORE_API char* telescore_engine_feature_spec_version(TelescoreEngine* engine);

/**
 * Free a string returned by the API
 * @param str String to free
 */
TELESCORE_API void telescore_string_free(char* str);

#ifdef __cplusplus
}
#endif

#endif /* TELESCORE_H */
