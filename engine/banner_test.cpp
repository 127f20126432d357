#include "engine/banner.hpp"

#include <stdlib.h>

#include "absl/strings/str_split.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::Contains;
using ::testing::Each;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::SizeIs;

using engine::BannerStatus;
using engine::RenderBanner;

BannerStatus Status() {
  BannerStatus status;
  status.limiter = "posix-rlimit + seccomp";
  status.audit = "READY";
  return status;
}

std::vector<std::string> Lines(const std::string& banner) {
  return absl::StrSplit(banner, '\n', absl::SkipEmpty());
}

// NOLINTNEXTLINE
TEST(Banner, Ascii) {
  std::vector<std::string> lines = Lines(RenderBanner(Status(), false));
  ASSERT_THAT(lines, SizeIs(13));
  EXPECT_EQ(lines[0], "+--------------------------------------+");
  EXPECT_EQ(lines[1], "|       evalbox Security Status        |");
  EXPECT_EQ(lines[2], lines[0]);
  EXPECT_EQ(lines[3], "|Sandboxing:     ENABLED               |");
  EXPECT_EQ(lines[4], "|Network:        BLOCKED               |");
  EXPECT_EQ(lines[5], "|Subprocess:     BLOCKED               |");
  EXPECT_EQ(lines[6], "|Filesystem:     CONFINED              |");
  EXPECT_EQ(lines[7], "|Env Clean:      CLEANED               |");
  EXPECT_EQ(lines[8], "|ResourceLimits: ENFORCED              |");
  EXPECT_EQ(lines[9], "|Trusted Model:  NO                    |");
  EXPECT_EQ(lines[10], "|Limiter:        posix-rlimit + seccomp|");
  EXPECT_EQ(lines[11], "|Audit:          READY                 |");
  EXPECT_EQ(lines[12], lines[0]);
  EXPECT_THAT(lines, Each(SizeIs(40)));
}

// NOLINTNEXTLINE
TEST(Banner, Unsafe) {
  BannerStatus status = Status();
  status.network_allowed = true;
  status.resource_limits = false;
  status.trusted_model = true;
  status.audit = "READY (OVERRIDDEN)";
  std::vector<std::string> lines = Lines(RenderBanner(status, false));
  EXPECT_THAT(lines, Contains("|Network:        ALLOWED               |"));
  EXPECT_THAT(lines, Contains("|ResourceLimits: REDUCED               |"));
  EXPECT_THAT(lines, Contains("|Trusted Model:  YES                   |"));
  EXPECT_THAT(lines, Contains("|Audit:          READY (OVERRIDDEN)    |"));
}

// NOLINTNEXTLINE
TEST(Banner, BoxDrawing) {
  std::string banner = RenderBanner(Status(), true);
  std::vector<std::string> lines = Lines(banner);
  ASSERT_THAT(lines, SizeIs(13));
  EXPECT_THAT(lines[0], ::testing::StartsWith("╔═"));
  EXPECT_THAT(lines[0], ::testing::EndsWith("═╗"));
  EXPECT_THAT(lines[2], ::testing::StartsWith("╠"));
  EXPECT_THAT(lines[12], ::testing::StartsWith("╚"));
  EXPECT_EQ(lines[3], "║Sandboxing:     ENABLED               ║");
  EXPECT_THAT(banner, Not(HasSubstr("+")));
}

// NOLINTNEXTLINE
TEST(Banner, UnicodeTerminal) {
  setenv("LC_ALL", "C", 1);
  EXPECT_FALSE(engine::UnicodeTerminal());
  setenv("LC_ALL", "en_US.UTF-8", 1);
  EXPECT_TRUE(engine::UnicodeTerminal());
  unsetenv("LC_ALL");
  unsetenv("LC_CTYPE");
  setenv("LANG", "C.utf8", 1);
  EXPECT_TRUE(engine::UnicodeTerminal());
}

// NOLINTNEXTLINE
TEST(Banner, FromEngine) {
  if (util::ResolveInterpreter("python3").empty()) {
    GTEST_SKIP() << "python3 not available";
  }
  engine::EngineOptions options;
  options.temp_directory = "/tmp/evalbox_testdir";
  util::File::MakeDirs(options.temp_directory);
  options.session.allow_network = true;
  engine::Engine eng(options, sandbox::GuardManifest::Default().Remove(
                                  sandbox::Capability::kFileAccess));
  BannerStatus status = BannerStatus::FromEngine(eng, /*trusted_model=*/true);
  EXPECT_FALSE(status.sandboxing);
  EXPECT_TRUE(status.network_allowed);
  EXPECT_TRUE(status.subprocess_blocked);
  EXPECT_FALSE(status.filesystem_confined);
  EXPECT_TRUE(status.trusted_model);
  EXPECT_THAT(status.limiter, HasSubstr(eng.LimiterName()));
  EXPECT_EQ(status.audit, "AUDIT_PENDING");
}

}  // namespace
