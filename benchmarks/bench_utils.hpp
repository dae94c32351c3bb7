#pragma once
#include <filesystem>
#include <string>

namespace bench_utils {

// Fixtures are shared with the test suite
inline std::string GetFixturePath(const std::string& name) {
  namespace fs = std::filesystem;
  return (fs::path(__FILE__).parent_path().parent_path() / "core" / "tests" / "fixtures" / name)
      .string();
}

}  // namespace bench_utils
