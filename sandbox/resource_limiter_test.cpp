#include "sandbox/resource_limiter.hpp"

#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {

using ::testing::ElementsAre;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/evalbox_testdir";

class ResourceLimiterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::MakeDirs(test_tmpdir);
    workspace_.reset(new SandboxWorkspace(test_tmpdir));
    SessionOptions options;
    options.memory_limit_mb = 256;
    options.timeout_s = 5;
    options.max_file_size_mb = 2;
    options.max_open_files = 32;
    session_.reset(new ScopedSession(*workspace_, "limiter", options));
  }

  std::unique_ptr<SandboxWorkspace> workspace_;
  std::unique_ptr<ScopedSession> session_;
};

// NOLINTNEXTLINE
TEST(ResourceLimiterRegistry, BestIsPosix) {
  std::unique_ptr<ResourceLimiter> limiter = ResourceLimiter::Create();
  ASSERT_TRUE(limiter != nullptr);
  EXPECT_STREQ(limiter->Name(), "posix-rlimit");
  EXPECT_EQ(limiter->GetGuarantee(), Guarantee::kFull);
  EXPECT_THAT(ResourceLimiter::Available(),
              ElementsAre("posix-rlimit", "watchdog"));
}

// NOLINTNEXTLINE
TEST(ResourceLimiterRegistry, ByName) {
  std::unique_ptr<ResourceLimiter> watchdog =
      ResourceLimiter::Create("watchdog");
  ASSERT_TRUE(watchdog != nullptr);
  EXPECT_EQ(watchdog->GetGuarantee(), Guarantee::kReduced);
  EXPECT_STREQ(GuaranteeName(watchdog->GetGuarantee()), "REDUCED");
  EXPECT_FALSE(ResourceLimiter::Create("job-object"));
  EXPECT_FALSE(ResourceLimiter::Create("nonexistent"));
}

// NOLINTNEXTLINE
TEST_F(ResourceLimiterTest, Configure) {
  std::unique_ptr<ResourceLimiter> limiter = ResourceLimiter::Create();
  std::string error;
  ASSERT_TRUE(limiter->Configure(**session_, 5, &error)) << error;
  EXPECT_EQ(limiter->MemoryLimitKb(), 256 * 1024);
  EXPECT_EQ(limiter->CpuLimitS(), 6);
}

// NOLINTNEXTLINE
TEST_F(ResourceLimiterTest, CpuLimitFollowsTheRunTimeout) {
  std::unique_ptr<ResourceLimiter> limiter = ResourceLimiter::Create();
  std::string error;
  ASSERT_TRUE(limiter->Configure(**session_, 20, &error)) << error;
  EXPECT_EQ(limiter->CpuLimitS(), 21);
  EXPECT_FALSE(limiter->Configure(**session_, 0, &error));
}

// NOLINTNEXTLINE
TEST_F(ResourceLimiterTest, PosixLimitsInChild) {
  std::unique_ptr<ResourceLimiter> limiter =
      ResourceLimiter::Create("posix-rlimit");
  ASSERT_TRUE(limiter != nullptr);
  std::string error;
  ASSERT_TRUE(limiter->Configure(**session_, 5, &error)) << error;

  pid_t pid = fork();
  if (pid == 0) {
    char buf[util::kStrErrorBufSize] = {};
    if (!limiter->ApplyToChild(buf, sizeof(buf))) _Exit(10);
    struct rlimit rlim;
    getrlimit(RLIMIT_AS, &rlim);
    if (rlim.rlim_cur != 256ull * 1024 * 1024) _Exit(1);
    getrlimit(RLIMIT_CPU, &rlim);
    if (rlim.rlim_cur != 6 || rlim.rlim_max != 7) _Exit(2);
    getrlimit(RLIMIT_FSIZE, &rlim);
    if (rlim.rlim_cur != 2ull * 1024 * 1024) _Exit(3);
    getrlimit(RLIMIT_NOFILE, &rlim);
    if (rlim.rlim_cur > 32) _Exit(4);
    getrlimit(RLIMIT_CORE, &rlim);
    if (rlim.rlim_cur != 0) _Exit(5);
    _Exit(0);
  }
  ASSERT_GT(pid, 0);
  int status = 0;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

// NOLINTNEXTLINE
TEST_F(ResourceLimiterTest, WatchdogAppliesNothing) {
  std::unique_ptr<ResourceLimiter> limiter =
      ResourceLimiter::Create("watchdog");
  std::string error;
  ASSERT_TRUE(limiter->Configure(**session_, 5, &error));
  char buf[util::kStrErrorBufSize] = {};
  EXPECT_TRUE(limiter->ApplyToChild(buf, sizeof(buf)));
  EXPECT_FALSE(limiter->ViolationReported());
}

}  // namespace
