#pragma once
#include <string>

namespace telescore {

// Installs a colour stderr logger named after the process as the spdlog default.
// Throws std::runtime_error on an unknown level name.
void init_logging(const std::string& process_name, const std::string& level = "info");

}  // namespace telescore
