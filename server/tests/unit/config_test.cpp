#include <cstdlib>

#include <gtest/gtest.h>

#include "mystery/config.hpp"

namespace {
const char* kKeys[] = {"SERVER_PORT", "STORE_BACKEND", "STORIES_DIR", "LLM_MODEL", "LLM_TEMPERATURE",
                       "WS_QUEUE_LIMIT_MESSAGES", "NARRATE_ON_PHASE_CHANGE"};

struct ConfigEnvFixture : public ::testing::Test {
  void SetUp() override { Clear(); }
  void TearDown() override { Clear(); }
  static void Clear() {
    for (const char* key : kKeys) {
      unsetenv(key);
    }
  }
};
}  // namespace

TEST_F(ConfigEnvFixture, DefaultsApplyWithoutEnvironment) {
  auto cfg = mystery::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.store_backend, "mariadb");
  EXPECT_EQ(cfg.stories_dir, "server/stories");
  EXPECT_DOUBLE_EQ(cfg.llm_temperature, 0.7);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 64u);
  EXPECT_TRUE(cfg.narrate_on_phase_change);
}

TEST_F(ConfigEnvFixture, EnvironmentOverridesDefaults) {
  setenv("SERVER_PORT", "9090", 1);
  setenv("STORE_BACKEND", "memory", 1);
  setenv("STORIES_DIR", "/srv/stories", 1);
  setenv("LLM_MODEL", "gemini-1.5-pro", 1);
  setenv("LLM_TEMPERATURE", "0.2", 1);
  setenv("WS_QUEUE_LIMIT_MESSAGES", "8", 1);
  setenv("NARRATE_ON_PHASE_CHANGE", "false", 1);

  auto cfg = mystery::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_EQ(cfg.store_backend, "memory");
  EXPECT_EQ(cfg.stories_dir, "/srv/stories");
  EXPECT_EQ(cfg.llm_model, "gemini-1.5-pro");
  EXPECT_DOUBLE_EQ(cfg.llm_temperature, 0.2);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 8u);
  EXPECT_FALSE(cfg.narrate_on_phase_change);
}
