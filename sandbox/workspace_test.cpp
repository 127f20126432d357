#include "sandbox/workspace.hpp"

#include <dirent.h>
#include <sys/stat.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/environment.hpp"
#include "sandbox/errors.hpp"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/evalbox_testdir";

class WorkspaceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::MakeDirs(test_tmpdir);
    base_.reset(new util::TempDir(test_tmpdir, "workspace_"));
    inputs_.reset(new util::TempDir(test_tmpdir, "inputs_"));
    util::File::WriteAll(util::File::JoinPath(inputs_->Path(), "data.txt"),
                         "1 2 3\n");
    util::File::WriteAll(
        util::File::JoinPath(inputs_->Path(), "lib/helpers.py"),
        "def f():\n    return 42\n");
  }

  std::string Input(const std::string& name) const {
    return util::File::JoinPath(inputs_->Path(), name);
  }

  std::unique_ptr<util::TempDir> base_;
  std::unique_ptr<util::TempDir> inputs_;
};

size_t CountEntries(const std::string& path) {
  size_t count = 0;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return 0;
  while (struct dirent* ent = readdir(dir)) {
    std::string name = ent->d_name;
    if (name != "." && name != "..") count++;
  }
  closedir(dir);
  return count;
}

bool IsWritable(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return false;
  return st.st_mode & (S_IWUSR | S_IWGRP | S_IWOTH);
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, NonAsciiRunId) {
  SandboxWorkspace workspace(base_->Path());
  std::unique_ptr<SandboxSession> session =
      workspace.Create("r\xc3\xa9sum\xc3\xa9", SessionOptions());
  EXPECT_EQ(session->RunId(), "r__sum__");
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, Layout) {
  SandboxWorkspace workspace(base_->Path());
  std::unique_ptr<SandboxSession> session =
      workspace.Create("test run!", SessionOptions());
  EXPECT_EQ(session->RunId(), "test_run_");
  EXPECT_EQ(session->State(), SessionState::kReady);
  EXPECT_THAT(session->Dir(),
              StartsWith(base_->Path() + "/evalbox_test_run__"));
  EXPECT_EQ(session->Root(), session->Dir() + "/box");
  EXPECT_TRUE(util::File::Exists(session->HomeDir()));
  EXPECT_TRUE(util::File::Exists(session->TempDir()));
  EXPECT_TRUE(util::File::Exists(session->GuardDir()));

  const EnvMap& env = session->Environment();
  EXPECT_EQ(env.at("HOME"), session->HomeDir());
  EXPECT_EQ(env.at("TMPDIR"), session->TempDir());
  EXPECT_EQ(env.at(EnvironmentScrubber::kSandboxRootVar), session->Root());
  SandboxWorkspace::Teardown(session.get());
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, DistinctDirectories) {
  SandboxWorkspace workspace(base_->Path());
  ScopedSession a(workspace, "same", SessionOptions());
  ScopedSession b(workspace, "same", SessionOptions());
  EXPECT_NE(a->Dir(), b->Dir());
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, InputsAreReadOnlyCopies) {
  SandboxWorkspace workspace(
      base_->Path(),
      {{Input("data.txt"), "data.txt"}, {Input("lib"), "pkg/lib"}});
  ScopedSession session(workspace, "inputs", SessionOptions());
  std::string data = util::File::JoinPath(session->Root(), "data.txt");
  std::string helper =
      util::File::JoinPath(session->Root(), "pkg/lib/helpers.py");
  EXPECT_EQ(util::File::ReadAll(data), "1 2 3\n");
  EXPECT_EQ(util::File::ReadAll(helper), "def f():\n    return 42\n");
  EXPECT_FALSE(IsWritable(data));
  EXPECT_FALSE(IsWritable(helper));

  // Changing the original does not change the copy.
  util::File::WriteAll(Input("data.txt"), "changed\n");
  EXPECT_EQ(util::File::ReadAll(data), "1 2 3\n");
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, InvalidDestinationLeavesNothing) {
  SandboxWorkspace workspace(base_->Path(),
                             {{Input("data.txt"), "../outside.txt"}});
  EXPECT_THROW(workspace.Create("bad", SessionOptions()), WorkspaceError);
  EXPECT_EQ(CountEntries(base_->Path()), 0);
  EXPECT_FALSE(util::File::Exists(
      util::File::JoinPath(base_->Path(), "outside.txt")));
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, MissingInputLeavesNothing) {
  SandboxWorkspace workspace(base_->Path(),
                             {{Input("nope.txt"), "nope.txt"}});
  try {
    workspace.Create("missing", SessionOptions());
    FAIL() << "Expected WorkspaceError";
  } catch (const WorkspaceError& exc) {
    EXPECT_EQ(exc.code().value(), ENOENT);
    EXPECT_THAT(exc.what(), HasSubstr("nope.txt"));
  }
  EXPECT_EQ(CountEntries(base_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, UnusableBaseDir) {
  // A regular file where a directory is needed.
  SandboxWorkspace workspace(util::File::JoinPath(Input("data.txt"), "sub"));
  EXPECT_THROW(workspace.Create("x", SessionOptions()), WorkspaceError);
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, TeardownIsIdempotent) {
  SandboxWorkspace workspace(base_->Path(), {{Input("lib"), "lib"}});
  std::unique_ptr<SandboxSession> session =
      workspace.Create("teardown", SessionOptions());
  util::File::WriteAll(util::File::JoinPath(session->HomeDir(), "out"), "x");
  SandboxWorkspace::Teardown(session.get());
  EXPECT_EQ(session->State(), SessionState::kTornDown);
  EXPECT_FALSE(util::File::Exists(session->Dir()));
  SandboxWorkspace::Teardown(session.get());
  SandboxWorkspace::Teardown(nullptr);
  EXPECT_EQ(session->State(), SessionState::kTornDown);
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, TeardownAlreadyRemoved) {
  SandboxWorkspace workspace(base_->Path());
  std::unique_ptr<SandboxSession> session =
      workspace.Create("gone", SessionOptions());
  util::File::RemoveTree(session->Dir());
  SandboxWorkspace::Teardown(session.get());
  EXPECT_EQ(session->State(), SessionState::kTornDown);
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, KeepSandbox) {
  SandboxWorkspace workspace(base_->Path());
  SessionOptions options;
  options.keep = true;
  std::string dir;
  {
    ScopedSession session(workspace, "keep", options);
    dir = session->Dir();
  }
  EXPECT_TRUE(util::File::Exists(dir));
  util::File::RemoveTree(dir);
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, ScopedSessionTearsDownOnException) {
  SandboxWorkspace workspace(base_->Path());
  std::string dir;
  try {
    ScopedSession session(workspace, "throwing", SessionOptions());
    dir = session->Dir();
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  ASSERT_FALSE(dir.empty());
  EXPECT_FALSE(util::File::Exists(dir));
}

// NOLINTNEXTLINE
TEST_F(WorkspaceTest, InvalidOptions) {
  SandboxWorkspace workspace(base_->Path());
  SessionOptions options;
  options.memory_limit_mb = 300;
  EXPECT_THROW(workspace.Create("mem", options), ConfigurationError);
  options = SessionOptions();
  options.timeout_s = 0;
  EXPECT_THROW(workspace.Create("timeout", options), ConfigurationError);
  options.timeout_s = kMaxTimeoutS + 1;
  EXPECT_THROW(workspace.Create("timeout", options), ConfigurationError);
  EXPECT_EQ(CountEntries(base_->Path()), 0);
}

// NOLINTNEXTLINE
TEST(SessionOptionsTest, AllowedValues) {
  SessionOptions options;
  for (int32_t mem : kAllowedMemoryLimitsMb) {
    options.memory_limit_mb = mem;
    EXPECT_NO_THROW(options.Validate());
  }
  options.memory_limit_mb = 512;
  options.max_open_files = 3;
  EXPECT_THROW(options.Validate(), ConfigurationError);
}

// NOLINTNEXTLINE
TEST(SessionStateTest, Names) {
  EXPECT_STREQ(SessionStateName(SessionState::kReady), "READY");
  EXPECT_STREQ(SessionStateName(SessionState::kTornDown), "TORN_DOWN");
}

}  // namespace
