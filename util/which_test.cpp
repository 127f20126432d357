#include "util/which.hpp"

#include <cstdlib>
#include <fstream>

#include <sys/stat.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/evalbox_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), S_IRWXU);
}

class WhichTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    if (path) old_path_ = path;
  }
  void TearDown() override { setenv("PATH", old_path_.c_str(), 1); }

 private:
  std::string old_path_;
};

// NOLINTNEXTLINE
TEST_F(WhichTest, FirstMatchWins) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createExecutable(tmpdir1.Path() + "/evalbox_cmd");
  createExecutable(tmpdir2.Path() + "/evalbox_cmd");
  createExecutable(tmpdir2.Path() + "/evalbox_cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("evalbox_cmd"), tmpdir1.Path() + "/evalbox_cmd");
  EXPECT_EQ(util::which("evalbox_cmd2"), tmpdir2.Path() + "/evalbox_cmd2");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, NotExecutableIsSkipped) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  { std::ofstream os(tmpdir.Path() + "/evalbox_plain"); }
  setenv("PATH", tmpdir.Path().c_str(), 1);
  EXPECT_EQ(util::which("evalbox_plain", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, EmptyPath) {
  unsetenv("PATH");
  EXPECT_EQ(util::which("evalbox_missing_cmd", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, AbsolutePathIsKept) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  createExecutable(tmpdir.Path() + "/tool");
  EXPECT_EQ(util::which(tmpdir.Path() + "/tool"), tmpdir.Path() + "/tool");
  EXPECT_EQ(util::which(tmpdir.Path() + "/nope"), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, UsesCache) {
  std::string path;
  {
    util::TempDir tmpdir(test_tmpdir + "/which");
    createExecutable(tmpdir.Path() + "/evalbox_cached");
    setenv("PATH", tmpdir.Path().c_str(), 1);
    path = util::which("evalbox_cached");
    EXPECT_EQ(path, tmpdir.Path() + "/evalbox_cached");
  }
  EXPECT_EQ(util::which("evalbox_cached"), path);
  EXPECT_EQ(util::which("evalbox_cached", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, ResolveInterpreter) {
  if (util::which("python3").empty()) GTEST_SKIP() << "python3 not found";
  std::string real = util::ResolveInterpreter("python3");
  ASSERT_FALSE(real.empty());
  EXPECT_EQ(real[0], '/');
  // A binary, not a launcher script.
  EXPECT_NE(util::File::ReadAll(real, 2), "#!");
  EXPECT_EQ(util::ResolveInterpreter("evalbox_missing_cmd"), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, ResolveBrokenInterpreter) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  std::string tool = tmpdir.Path() + "/fake_python";
  util::File::WriteAll(tool, "#!/bin/sh\nexit 3\n");
  chmod(tool.c_str(), S_IRWXU);
  EXPECT_EQ(util::ResolveInterpreter(tool), "");
}

}  // namespace
