#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <telescore/config.hpp>
#include <telescore/logging.hpp>

using namespace telescore;

class RuntimeConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const char* name : {"TELESCORE_ARTIFACT", "TELESCORE_LOG_LEVEL", "TELESCORE_INFERENCE",
                             "TELESCORE_PRETTY"}) {
      unsetenv(name);
    }
  }
};

TEST_F(RuntimeConfigTest, Defaults) {
  auto config = RuntimeConfig::load_from_env();

  EXPECT_EQ(config.artifact_path, "models/telescore_artifact.json");
  EXPECT_EQ(config.log_level, "info");
  EXPECT_EQ(config.inference, InferenceMode::Sequential);
  EXPECT_FALSE(config.pretty);
  EXPECT_NO_THROW(config.validate());
}

TEST_F(RuntimeConfigTest, ReadsEnvironment) {
  setenv("TELESCORE_ARTIFACT", "/srv/models/churn.msgpack", 1);
  setenv("TELESCORE_LOG_LEVEL", "debug", 1);
  setenv("TELESCORE_INFERENCE", "concurrent", 1);
  setenv("TELESCORE_PRETTY", "yes", 1);

  auto config = RuntimeConfig::load_from_env();

  EXPECT_EQ(config.artifact_path, "/srv/models/churn.msgpack");
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.inference, InferenceMode::Concurrent);
  EXPECT_EQ(config.scoring_options().inference, InferenceMode::Concurrent);
  EXPECT_TRUE(config.pretty);
}

TEST_F(RuntimeConfigTest, InvalidBooleanThrows) {
  setenv("TELESCORE_PRETTY", "sometimes", 1);
  EXPECT_THROW((void)RuntimeConfig::load_from_env(), std::runtime_error);
}

TEST_F(RuntimeConfigTest, InvalidInferenceModeThrows) {
  setenv("TELESCORE_INFERENCE", "parallel", 1);
  EXPECT_THROW((void)RuntimeConfig::load_from_env(), std::runtime_error);
}

TEST_F(RuntimeConfigTest, ValidateRejectsBadValues) {
  RuntimeConfig config;
  config.log_level = "verbose";
  EXPECT_THROW(config.validate(), std::runtime_error);

  config = RuntimeConfig{};
  config.artifact_path.clear();
  EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(InferenceModeTest, ParseAndFormat) {
  EXPECT_EQ(parse_inference_mode("sequential"), InferenceMode::Sequential);
  EXPECT_EQ(parse_inference_mode("concurrent"), InferenceMode::Concurrent);
  EXPECT_THROW((void)parse_inference_mode("Concurrent"), std::runtime_error);
  EXPECT_EQ(to_string(InferenceMode::Concurrent), "concurrent");
}

TEST(LoggingTest, RejectsUnknownLevel) {
  EXPECT_THROW(init_logging("telescore-test", "loud"), std::runtime_error);
  EXPECT_NO_THROW(init_logging("telescore-test", "warn"));
}
