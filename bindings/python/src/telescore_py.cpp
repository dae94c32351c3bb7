#include <nanobind/nanobind.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <memory>
#include <new>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <telescore/errors.hpp>
#include <telescore/model_registry.hpp>
#include <telescore/record_json.hpp>
#include <telescore/scoring.hpp>

namespace nb = nanobind;
using namespace nb::literals;
using namespace telescore;

namespace {

  ScoringOptions options_for(bool concurrent) {
    return ScoringOptions{.inference = concurrent ? InferenceMode::Concurrent
                                                  : InferenceMode::Sequential};
  }

}  // namespace

NB_MODULE(telescore_ext, m) {
  m.doc() = "telescore - customer churn and lifetime value scoring";

  nb::register_exception_translator([](const std::exception_ptr& p, void*) {
    try {
      std::rethrow_exception(p);
    } catch (const ValidationError& e) {
      PyErr_SetString(PyExc_ValueError, e.what());
    } catch (const ModelLoadError& e) {
      PyErr_SetString(PyExc_RuntimeError, e.what());
    } catch (const InferenceError& e) {
      PyErr_SetString(PyExc_ArithmeticError, e.what());
    }
  });

  nb::enum_<RiskLevel>(m, "RiskLevel")
      .value("Low", RiskLevel::Low)
      .value("Medium", RiskLevel::Medium)
      .value("High", RiskLevel::High);

  nb::enum_<RecommendedAction>(m, "RecommendedAction")
      .value("ImmediateRetentionOutreach", RecommendedAction::ImmediateRetentionOutreach)
      .value("ProactiveEngagement", RecommendedAction::ProactiveEngagement)
      .value("StandardMaintenance", RecommendedAction::StandardMaintenance);

  nb::enum_<FailureKind>(m, "FailureKind")
      .value("Validation", FailureKind::Validation)
      .value("Inference", FailureKind::Inference)
      .value("Internal", FailureKind::Internal);

  nb::class_<CallUsage>(m, "CallUsage", "Minutes, calls and charge for one billing period")
      .def(nb::init<>())
      .def("__init__",
           [](CallUsage* u, double minutes, int calls, double charge) {
             new (u) CallUsage{.minutes = minutes, .calls = calls, .charge = charge};
           },
           "minutes"_a, "calls"_a, "charge"_a)
      .def_rw("minutes", &CallUsage::minutes)
      .def_rw("calls", &CallUsage::calls)
      .def_rw("charge", &CallUsage::charge);

  nb::class_<CustomerRecord>(m, "CustomerRecord", "Raw customer attributes")
      .def(nb::init<>())
      .def_static("from_json",
          [](const std::string& json_str) { return parse_customer_record(json_str); },
          "json_str"_a,
          "Parse a record from JSON (snake_case or legacy camelCase keys)\n\n"
          "Raises:\n"
          "    ValueError: If a field is missing or malformed")
      .def_rw("account_length", &CustomerRecord::account_length)
      .def_rw("state", &CustomerRecord::state)
      .def_rw("area_code", &CustomerRecord::area_code)
      .def_rw("international_plan", &CustomerRecord::international_plan)
      .def_rw("voicemail_plan", &CustomerRecord::voicemail_plan)
      .def_rw("voicemail_messages", &CustomerRecord::voicemail_messages)
      .def_rw("day", &CustomerRecord::day)
      .def_rw("evening", &CustomerRecord::evening)
      .def_rw("night", &CustomerRecord::night)
      .def_rw("international", &CustomerRecord::international)
      .def_rw("customer_service_calls", &CustomerRecord::customer_service_calls);

  nb::class_<PredictionResult>(m, "PredictionResult", "Scoring result for one customer")
      .def_ro("churn_probability", &PredictionResult::churn_probability)
      .def_ro("churn_predicted", &PredictionResult::churn_predicted)
      .def_ro("risk_level", &PredictionResult::risk_level)
      .def_ro("confidence_score", &PredictionResult::confidence_score)
      .def_prop_ro("confidence", [](const PredictionResult& r) {
          return std::string(to_string(r.confidence_label));
      })
      .def_ro("clv_estimate", &PredictionResult::clv_estimate)
      .def_prop_ro("high_value", [](const PredictionResult& r) {
          return r.value_segment == ValueSegment::HighValue;
      })
      .def_ro("recommendation", &PredictionResult::recommendation)
      .def_prop_ro("recommendation_text", [](const PredictionResult& r) {
          return std::string(to_string(r.recommendation));
      })
      .def_prop_ro("playbook", [](const PredictionResult& r) { return std::string(r.playbook); })
      .def_ro("model_version", &PredictionResult::model_version)
      .def("to_json", [](const PredictionResult& r) { return to_json(r).dump(); },
          "Serialize to the JSON output payload")
      .def("__repr__", [](const PredictionResult& r) {
          return "<PredictionResult churn=" + std::to_string(r.churn_probability) + " risk="
                 + std::string(to_string(r.risk_level)) + ">";
      });

  nb::class_<ScoringFailure>(m, "ScoringFailure", "Why one record in a batch was not scored")
      .def_ro("kind", &ScoringFailure::kind)
      .def_ro("field", &ScoringFailure::field)
      .def_ro("message", &ScoringFailure::message)
      .def("to_json", [](const ScoringFailure& f) { return to_json(f).dump(); },
          "Serialize to the JSON failure payload")
      .def("__repr__", [](const ScoringFailure& f) {
          return "<ScoringFailure " + std::string(to_string(f.kind))
                 + (f.field.empty() ? "" : " field=" + f.field) + ">";
      });

  nb::class_<ModelRegistry>(m, "ModelRegistry",
      "Immutable bundle of the feature spec, churn classifier and CLV regressor")
      .def_static("load",
          [](const std::string& path) {
              return std::const_pointer_cast<ModelRegistry>(ModelRegistry::load(path));
          },
          "path"_a,
          "Load a scoring artifact (JSON, or MessagePack for .msgpack/.mpk/.bin)\n\n"
          "Raises:\n"
          "    RuntimeError: If the artifact is missing, corrupt or inconsistent")
      .def_static("from_json_string",
          [](const std::string& json_str) {
              return std::make_shared<ModelRegistry>(ModelRegistry::from_json_string(json_str));
          },
          "json_str"_a,
          "Build a registry from an artifact JSON string")
      .def("summary", [](const ModelRegistry& r) { return to_json(r.summary()).dump(); },
          "Registry summary as a JSON string")
      .def_prop_ro("feature_spec_version",
          [](const ModelRegistry& r) { return r.feature_spec().version(); })
      .def_prop_ro("artifact_version", &ModelRegistry::artifact_version);

  m.def("score_customer",
      [](const ModelRegistry& registry, const CustomerRecord& record, bool concurrent) {
          nb::gil_scoped_release release;
          return score_customer(registry, record, options_for(concurrent));
      },
      "registry"_a, "record"_a, "concurrent"_a = false,
      "Score one customer\n\n"
      "Raises:\n"
      "    ValueError: If the record fails validation");

  m.def("score_batch",
      [](const ModelRegistry& registry, const std::vector<CustomerRecord>& records,
         bool concurrent) {
          std::vector<ScoreOutcome> outcomes;
          {
              nb::gil_scoped_release release;
              outcomes = score_batch(registry, records, options_for(concurrent));
          }
          std::vector<std::variant<PredictionResult, ScoringFailure>> results;
          results.reserve(outcomes.size());
          for (auto& outcome : outcomes) {
              if (outcome) {
                  results.emplace_back(std::in_place_index<0>, std::move(*outcome));
              } else {
                  results.emplace_back(std::in_place_index<1>, std::move(outcome.error()));
              }
          }
          return results;
      },
      "registry"_a, "records"_a, "concurrent"_a = false,
      "Score many customers independently\n\n"
      "Returns one entry per record, in order: a PredictionResult, or a\n"
      "ScoringFailure naming the offending field and the reason");
}
