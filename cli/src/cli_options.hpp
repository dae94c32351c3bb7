#pragma once
#include <exception>
#include <string>

#include <telescore/config.hpp>

namespace telescore::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_LOAD_FAILURE = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_SCORING_FAILURE = 3;

constexpr const char* USAGE
    = "Usage: telescore [options] info\n"
      "       telescore [options] score FILE|-\n";

struct Invocation {
  RuntimeConfig config;
  std::string command;
  std::string input;
  bool show_help = false;
  std::string help_text;
};

// Flags override `base` (normally read from the environment); a flag that is
// absent leaves the base value alone. Throws on unknown options, bad values or an
// unknown command.
[[nodiscard]] Invocation parse_command_line(int argc, const char* const argv[],
                                            RuntimeConfig base);

// Exit status for an exception escaping a command after the artifact loaded
[[nodiscard]] int exit_code_for(const std::exception& e) noexcept;

}  // namespace telescore::cli
