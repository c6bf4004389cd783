#include "runcase/Config.hpp"
#include "runcase/Env.hpp"

#include <algorithm>
#include <cstdlib>

#include <gtest/gtest.h>

namespace runcase::test {

using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
  void TearDown() override {
    for (auto const* name : {"RUNCASE_TIMEOUT_MS", "RUNCASE_SPAWN_TIMEOUT_MS", "RUNCASE_ONLINE_JUDGE", "RUNCASE_VERBOSE"}) {
      unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  EngineConfig config;
  EXPECT_EQ(config.timeout_, 3000ms);
  EXPECT_EQ(config.spawn_timeout_, 10000ms);
  EXPECT_FALSE(config.online_judge_);
  ASSERT_EQ(config.extra_env_.size(), 2);
  EXPECT_EQ(config.extra_env_[0], (std::pair<std::string, std::string>{"DEBUG", "true"}));
  EXPECT_EQ(config.extra_env_[1], (std::pair<std::string, std::string>{"CPH", "true"}));
}

TEST_F(ConfigTest, ParseMillis) {
  EXPECT_EQ(parse_millis("250").value(), 250ms);
  EXPECT_FALSE(parse_millis("").has_value());
  EXPECT_FALSE(parse_millis("12ms").has_value());
  EXPECT_FALSE(parse_millis("abc").has_value());
}

TEST_F(ConfigTest, ParseFlag) {
  EXPECT_TRUE(parse_flag("1").value());
  EXPECT_TRUE(parse_flag("true").value());
  EXPECT_FALSE(parse_flag("0").value());
  EXPECT_FALSE(parse_flag("off").value());
  EXPECT_FALSE(parse_flag("maybe").has_value());
}

TEST_F(ConfigTest, EnvironmentOverridesBase) {
  setenv("RUNCASE_TIMEOUT_MS", "500", 1);
  setenv("RUNCASE_ONLINE_JUDGE", "yes", 1);

  auto config = load_config_from_env();
  ASSERT_TRUE(config.has_value()) << config.error();
  EXPECT_EQ(config->timeout_, 500ms);
  EXPECT_TRUE(config->online_judge_);
  EXPECT_EQ(config->spawn_timeout_, 10000ms);
}

TEST_F(ConfigTest, InvalidEnvironmentValueNamesVariable) {
  setenv("RUNCASE_SPAWN_TIMEOUT_MS", "soon", 1);

  auto config = load_config_from_env();
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().find("RUNCASE_SPAWN_TIMEOUT_MS"), std::string::npos);
}

TEST_F(ConfigTest, ValidateLiftsSpawnTimeout) {
  EngineConfig config;
  config.timeout_       = 5000ms;
  config.spawn_timeout_ = 1000ms;

  auto valid = validate_config(config);
  ASSERT_TRUE(valid.has_value());
  EXPECT_EQ(valid->spawn_timeout_, 5000ms);
}

TEST_F(ConfigTest, ValidateRejectsNonPositiveTimeout) {
  EngineConfig config;
  config.timeout_ = 0ms;
  EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, ValidateRejectsTimeoutAboveCeiling) {
  EngineConfig config;
  config.timeout_ = std::chrono::milliseconds{9300000000000};

  auto valid = validate_config(config);
  ASSERT_FALSE(valid.has_value());
  EXPECT_NE(valid.error().find("must not exceed"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsSpawnTimeoutAboveCeiling) {
  EngineConfig config;
  config.spawn_timeout_ = constant::MAX_TIMEOUT + 1ms;
  EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, ValidateAcceptsCeiling) {
  EngineConfig config;
  config.timeout_       = constant::MAX_TIMEOUT;
  config.spawn_timeout_ = constant::MAX_TIMEOUT;
  EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, HugeEnvironmentTimeoutFailsValidation) {
  setenv("RUNCASE_TIMEOUT_MS", "9300000000000", 1);

  auto config = load_config_from_env();
  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(validate_config(*config).has_value());
}

TEST(Env, MergedOverridesInheritedValue) {
  setenv("DEBUG", "false", 1);
  auto env = core::env::merged({{"DEBUG", "true"}});
  unsetenv("DEBUG");

  EXPECT_EQ(std::ranges::count(env, std::string{"DEBUG=true"}), 1);
  EXPECT_EQ(std::ranges::count(env, std::string{"DEBUG=false"}), 0);
}

TEST(Env, GetMissingVariable) {
  unsetenv("RUNCASE_DOES_NOT_EXIST");
  EXPECT_FALSE(core::env::get("RUNCASE_DOES_NOT_EXIST").has_value());
}

} // namespace runcase::test
