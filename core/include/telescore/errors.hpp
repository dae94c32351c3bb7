#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace telescore {

// Malformed, missing or out-of-vocabulary input. Recoverable per request.
class ValidationError : public std::invalid_argument {
public:
  ValidationError(std::string field, const std::string& message)
      : std::invalid_argument(message), field_(std::move(field)) {}

  [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
  std::string field_;
};

// Artifact missing, corrupt or version-mismatched. Fatal at startup.
class ModelLoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A model produced a non-finite output.
class InferenceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

}  // namespace telescore
