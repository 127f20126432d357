#include "sandbox/environment.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/workspace.hpp"

namespace {

using ::testing::Contains;
using ::testing::Key;
using ::testing::Not;
using ::testing::Pair;

using sandbox::EnvironmentScrubber;
using sandbox::EnvMap;
using sandbox::SandboxSession;
using sandbox::SessionOptions;

class EnvironmentTest : public ::testing::Test {
 protected:
  EnvironmentTest() : session_("run", "/tmp/evalbox_x", SessionOptions()) {}
  SandboxSession session_;
};

// NOLINTNEXTLINE
TEST_F(EnvironmentTest, StartsFromNothing) {
  EnvMap parent = {{"SHELL", "/bin/bash"},
                   {"LD_PRELOAD", "/evil.so"},
                   {"PYTHONSTARTUP", "/x.py"},
                   {"TZ", "UTC"}};
  EnvMap env = EnvironmentScrubber().Build(session_, parent);
  EXPECT_THAT(env, Not(Contains(Key("SHELL"))));
  EXPECT_THAT(env, Not(Contains(Key("LD_PRELOAD"))));
  EXPECT_THAT(env, Not(Contains(Key("PYTHONSTARTUP"))));
  EXPECT_THAT(env, Contains(Pair("TZ", "UTC")));
}

// NOLINTNEXTLINE
TEST_F(EnvironmentTest, SandboxVariables) {
  EnvMap env = EnvironmentScrubber().Build(session_, EnvMap());
  EXPECT_THAT(env, Contains(Pair("HOME", "/tmp/evalbox_x/box/home")));
  EXPECT_THAT(env, Contains(Pair("TMPDIR", "/tmp/evalbox_x/box/temp")));
  EXPECT_THAT(env, Contains(Pair("TEMP", "/tmp/evalbox_x/box/temp")));
  EXPECT_THAT(env, Contains(Pair("PYTHONDONTWRITEBYTECODE", "1")));
  EXPECT_THAT(env, Contains(Pair("PYTHONPATH",
                                 "/tmp/evalbox_x/guard:/tmp/evalbox_x/box")));
  EXPECT_THAT(env, Contains(Pair("EVALBOX_SANDBOX_ROOT", "/tmp/evalbox_x/box")));
  EXPECT_THAT(env, Contains(Pair("EVALBOX_ALLOW_NETWORK", "0")));
  EXPECT_THAT(env, Contains(Key("PATH")));
}

// NOLINTNEXTLINE
TEST_F(EnvironmentTest, NetworkMarker) {
  SessionOptions options;
  options.allow_network = true;
  SandboxSession session("run", "/tmp/evalbox_y", options);
  EnvMap env = EnvironmentScrubber().Build(session, EnvMap());
  EXPECT_THAT(env, Contains(Pair("EVALBOX_ALLOW_NETWORK", "1")));
}

// NOLINTNEXTLINE
TEST_F(EnvironmentTest, SecretsNeverReachTheChild) {
  setenv("OPENAI_API_KEY", "sk-secret", 1);
  setenv("MY_DATABASE_URL", "postgres://u:p@h/db", 1);
  EnvMap env = EnvironmentScrubber().Build(session_);
  for (const auto& kv : env) {
    EXPECT_FALSE(EnvironmentScrubber::IsSensitive(kv.first)) << kv.first;
    EXPECT_EQ(kv.second.find("sk-secret"), std::string::npos);
  }
  unsetenv("OPENAI_API_KEY");
  unsetenv("MY_DATABASE_URL");
}

// NOLINTNEXTLINE
TEST(EnvironmentScrubber, IsSensitive) {
  EXPECT_TRUE(EnvironmentScrubber::IsSensitive("github_token"));
  EXPECT_TRUE(EnvironmentScrubber::IsSensitive("AWS_REGION"));
  EXPECT_TRUE(EnvironmentScrubber::IsSensitive("Anthropic_Thing"));
  EXPECT_FALSE(EnvironmentScrubber::IsSensitive("HOME"));
  EXPECT_FALSE(EnvironmentScrubber::IsSensitive("PYTHONPATH"));
}

// NOLINTNEXTLINE
TEST(EnvironmentScrubber, ToEnvp) {
  EnvMap env = {{"A", "1"}, {"B", "x=y"}};
  EXPECT_THAT(EnvironmentScrubber::ToEnvp(env),
              ::testing::ElementsAre("A=1", "B=x=y"));
}

}  // namespace
