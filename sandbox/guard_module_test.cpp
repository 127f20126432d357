#include "sandbox/guard_module.hpp"

#include <sys/stat.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/workspace.hpp"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/evalbox_testdir";

// NOLINTNEXTLINE
TEST(GuardManifest, DefaultBlocksEverything) {
  GuardManifest manifest = GuardManifest::Default();
  for (Capability capability : AllCapabilities()) {
    EXPECT_TRUE(manifest.Blocks(capability)) << CapabilityName(capability);
  }
  EXPECT_EQ(manifest.Blocked().size(), AllCapabilities().size());
}

// NOLINTNEXTLINE
TEST(GuardManifest, DeniedModules) {
  GuardManifest manifest = GuardManifest::Default();
  auto denied = manifest.DeniedModules();
  EXPECT_EQ(denied.at("pickle"), Capability::kDeserialization);
  EXPECT_EQ(denied.at("marshal"), Capability::kDeserialization);
  EXPECT_EQ(denied.at("ctypes"), Capability::kNativeMemory);
  EXPECT_EQ(denied.count("json"), 0);

  manifest.Remove(Capability::kNativeMemory);
  denied = manifest.DeniedModules();
  EXPECT_EQ(denied.count("ctypes"), 0);
  EXPECT_EQ(denied.count("pickle"), 1);
}

// NOLINTNEXTLINE
TEST(GuardModule, Labels) {
  EXPECT_EQ(GuardLabel(Capability::kNetwork), "EVALBOX-GUARD[network]");
  EXPECT_EQ(GuardLabel(Capability::kDynamicCode),
            "EVALBOX-GUARD[dynamic-code]");
}

// NOLINTNEXTLINE
TEST(GuardModule, SourceCoversAllCapabilities) {
  GuardModule guard(GuardManifest::Default());
  const std::string& src = guard.Source();
  EXPECT_THAT(src, StartsWith("# Generated by evalbox."));
  EXPECT_THAT(src, HasSubstr("_BLOCKED = frozenset([\"dynamic-code\""));
  EXPECT_THAT(src, HasSubstr("\"ctypes\": \"native-memory\""));
  EXPECT_THAT(src, HasSubstr("builtins.eval"));
  EXPECT_THAT(src, HasSubstr("subprocess.Popen.__init__ = popen_init"));
  EXPECT_THAT(src, HasSubstr("socket.socket.__init__ = socket_init"));
  EXPECT_THAT(src, HasSubstr("builtins.open = guarded_open"));
  EXPECT_THAT(src, HasSubstr("importlib.reload = reload"));
  EXPECT_THAT(src, HasSubstr("_sys.addaudithook(audit)"));
  EXPECT_THAT(src, HasSubstr("del _evalbox_install"));
}

// NOLINTNEXTLINE
TEST(GuardModule, AnnotationEvaluatorsAreNotTrusted) {
  GuardModule guard(GuardManifest::Default());
  const std::string& src = guard.Source();
  EXPECT_THAT(src, HasSubstr("_TRUSTED_EVAL_CALLERS = (\"collections/"
                             "__init__.py\", \"dataclasses.py\", "
                             "\"unittest/mock.py\",)"));
  EXPECT_THAT(src, Not(HasSubstr("typing.py")));
  EXPECT_THAT(src, Not(HasSubstr("inspect.py")));
  EXPECT_THAT(src, HasSubstr("dataclasses._process_class = process_class"));
}

// NOLINTNEXTLINE
TEST(GuardModule, RemovedCapabilityIsOmitted) {
  GuardModule guard(
      GuardManifest::Default().Remove(Capability::kProcessSpawn));
  const std::string& src = guard.Source();
  EXPECT_THAT(src, Not(HasSubstr("subprocess.Popen.__init__ = popen_init")));
  EXPECT_THAT(src, HasSubstr("_BLOCKED = frozenset([\"dynamic-code\", "
                             "\"deserialization\", \"native-memory\", "
                             "\"file-access\", \"network\", "
                             "\"guard-tamper\"])"));
  EXPECT_THAT(src, HasSubstr("builtins.eval"));
}

// NOLINTNEXTLINE
TEST(GuardModule, SourceIsDeterministic) {
  EXPECT_EQ(GuardModule(GuardManifest::Default()).Source(),
            GuardModule(GuardManifest::Default()).Source());
  EXPECT_NE(GuardModule(GuardManifest::Default()).Source(),
            GuardModule(GuardManifest::Default().Remove(Capability::kNetwork))
                .Source());
}

// NOLINTNEXTLINE
TEST(GuardModule, InstallWritesReadOnlyModule) {
  SandboxWorkspace workspace(test_tmpdir);
  ScopedSession session(workspace, "guard", SessionOptions());
  GuardModule guard(GuardManifest::Default());
  guard.Install(*session);
  std::string path =
      util::File::JoinPath(session->GuardDir(), GuardModule::kFileName);
  EXPECT_EQ(util::File::ReadAll(path), guard.Source());
  struct stat st {};
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, S_IRUSR);
  // Installing again replaces the read-only file.
  guard.Install(*session);
}

}  // namespace
