#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <telescore/config.hpp>

namespace telescore {

namespace {

  std::string get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_val;
  }

  bool get_env_bool(const char* name, bool default_val) {
    const char* value = std::getenv(name);
    if (!value) return default_val;

    std::string_view v(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::runtime_error(fmt::format("Invalid boolean value for env var {}: {}", name, value));
  }

  constexpr std::array<std::string_view, 7> LOG_LEVELS = {"trace", "debug", "info",    "warn",
                                                          "error", "critical", "off"};

}  // namespace

InferenceMode parse_inference_mode(const std::string& value) {
  if (value == "sequential") return InferenceMode::Sequential;
  if (value == "concurrent") return InferenceMode::Concurrent;
  throw std::runtime_error(
      fmt::format("Invalid inference mode '{}' (expected sequential|concurrent)", value));
}

RuntimeConfig RuntimeConfig::load_from_env() {
  RuntimeConfig config;

  config.artifact_path = get_env("TELESCORE_ARTIFACT", config.artifact_path);
  config.log_level = get_env("TELESCORE_LOG_LEVEL", config.log_level);

  if (const char* mode = std::getenv("TELESCORE_INFERENCE")) {
    config.inference = parse_inference_mode(mode);
  }
  config.pretty = get_env_bool("TELESCORE_PRETTY", config.pretty);

  return config;
}

void RuntimeConfig::validate() const {
  if (artifact_path.empty()) {
    throw std::runtime_error("TELESCORE_ARTIFACT cannot be empty");
  }

  if (std::ranges::find(LOG_LEVELS, log_level) == LOG_LEVELS.end()) {
    throw std::runtime_error(fmt::format("TELESCORE_LOG_LEVEL '{}' is not a valid level", log_level));
  }

  spdlog::debug("Configuration validated (artifact={}, inference={})", artifact_path,
                to_string(inference));
}

}  // namespace telescore
