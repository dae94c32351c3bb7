#pragma once
#include <string>

#include <telescore/scoring.hpp>

namespace telescore {

// Process-level settings shared by the CLI and the bindings
struct RuntimeConfig {
  std::string artifact_path = "models/telescore_artifact.json";
  std::string log_level = "info";
  InferenceMode inference = InferenceMode::Sequential;
  bool pretty = false;  // indent JSON output

  // Reads TELESCORE_ARTIFACT, TELESCORE_LOG_LEVEL, TELESCORE_INFERENCE and
  // TELESCORE_PRETTY. Unset variables keep their defaults; malformed values throw
  // std::runtime_error.
  static RuntimeConfig load_from_env();

  void validate() const;

  [[nodiscard]] ScoringOptions scoring_options() const noexcept { return {.inference = inference}; }
};

[[nodiscard]] InferenceMode parse_inference_mode(const std::string& value);

}  // namespace telescore
