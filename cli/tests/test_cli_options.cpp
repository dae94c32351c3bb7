#include <gtest/gtest.h>

#include <boost/program_options/errors.hpp>
#include <stdexcept>
#include <telescore/errors.hpp>
#include <utility>
#include <vector>

#include "cli_options.hpp"

using namespace telescore;
using namespace telescore::cli;

namespace {

  Invocation parse(std::vector<const char*> args, RuntimeConfig base = {}) {
    args.insert(args.begin(), "telescore");
    return parse_command_line(static_cast<int>(args.size()), args.data(), std::move(base));
  }

}  // namespace

// =============================================================================
// Option Parsing
// =============================================================================

TEST(CliOptionsTest, InfoWithDefaults) {
  auto inv = parse({"info"});

  EXPECT_FALSE(inv.show_help);
  EXPECT_EQ(inv.command, "info");
  EXPECT_TRUE(inv.input.empty());
  EXPECT_EQ(inv.config.artifact_path, "models/telescore_artifact.json");
  EXPECT_EQ(inv.config.inference, InferenceMode::Sequential);
  EXPECT_FALSE(inv.config.pretty);
}

TEST(CliOptionsTest, ScoreWithFlags) {
  auto inv = parse({"--artifact", "/srv/churn.msgpack", "--inference", "concurrent", "--pretty",
                    "score", "customers.json"});

  EXPECT_EQ(inv.command, "score");
  EXPECT_EQ(inv.input, "customers.json");
  EXPECT_EQ(inv.config.artifact_path, "/srv/churn.msgpack");
  EXPECT_EQ(inv.config.inference, InferenceMode::Concurrent);
  EXPECT_TRUE(inv.config.pretty);
}

TEST(CliOptionsTest, EnvironmentValuesSurviveAbsentFlags) {
  RuntimeConfig base;
  base.artifact_path = "/env/artifact.json";
  base.log_level = "debug";
  base.inference = InferenceMode::Concurrent;
  base.pretty = true;

  auto inv = parse({"score", "-"}, base);

  EXPECT_EQ(inv.config.artifact_path, "/env/artifact.json");
  EXPECT_EQ(inv.config.log_level, "debug");
  EXPECT_EQ(inv.config.inference, InferenceMode::Concurrent);
  EXPECT_TRUE(inv.config.pretty);
}

TEST(CliOptionsTest, FlagsOverrideEnvironment) {
  RuntimeConfig base;
  base.artifact_path = "/env/artifact.json";
  base.inference = InferenceMode::Concurrent;

  auto inv = parse({"-a", "/cli/artifact.json", "--inference", "sequential", "info"}, base);

  EXPECT_EQ(inv.config.artifact_path, "/cli/artifact.json");
  EXPECT_EQ(inv.config.inference, InferenceMode::Sequential);
}

TEST(CliOptionsTest, Help) {
  auto inv = parse({"--help"});

  EXPECT_TRUE(inv.show_help);
  EXPECT_NE(inv.help_text.find("--pretty"), std::string::npos);
  EXPECT_NE(inv.help_text.find("Usage:"), std::string::npos);
}

TEST(CliOptionsTest, UsageErrors) {
  EXPECT_THROW((void)parse({}), std::invalid_argument);
  EXPECT_THROW((void)parse({"train"}), std::invalid_argument);
  EXPECT_THROW((void)parse({"score"}), std::invalid_argument);
  EXPECT_THROW((void)parse({"--inference", "parallel", "info"}), std::exception);
  EXPECT_THROW((void)parse({"--log-level", "loud", "info"}), std::exception);
  EXPECT_THROW((void)parse({"--verbose", "info"}), boost::program_options::error);
}

// =============================================================================
// Exit Codes
// =============================================================================

TEST(CliExitCodeTest, DistinctPerFailureClass) {
  EXPECT_EQ(exit_code_for(ValidationError("state", "unknown state 'ZZ'")), EXIT_USAGE);
  EXPECT_EQ(exit_code_for(ModelLoadError("truncated artifact")), EXIT_LOAD_FAILURE);
  EXPECT_EQ(exit_code_for(InferenceError("non-finite CLV estimate")), EXIT_SCORING_FAILURE);
  EXPECT_EQ(exit_code_for(std::runtime_error("unexpected")), EXIT_SCORING_FAILURE);

  EXPECT_NE(EXIT_SCORING_FAILURE, EXIT_LOAD_FAILURE);
  EXPECT_NE(EXIT_SCORING_FAILURE, EXIT_USAGE);
}
