#include "audit/security_auditor.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using namespace audit;
using namespace sandbox;

const std::string test_tmpdir = "/tmp/evalbox_testdir";

class SecurityAuditorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    python_ = util::ResolveInterpreter("python3");
    if (python_.empty()) GTEST_SKIP() << "python3 not available";
    util::File::MakeDirs(test_tmpdir);
    base_.reset(new util::TempDir(test_tmpdir, "audit"));
    workspace_.reset(new SandboxWorkspace(base_->Path()));
  }

  AuditReport Audit(const GuardManifest& manifest) {
    GuardModule guard(manifest);
    executor::ProcessExecutor executor(&guard);
    SessionOptions options;
    options.memory_limit_mb = 256;
    SecurityAuditor auditor(workspace_.get(), &executor, python_, options);
    return auditor.RunAudit();
  }

  std::string python_;
  std::unique_ptr<util::TempDir> base_;
  std::unique_ptr<SandboxWorkspace> workspace_;
};

// NOLINTNEXTLINE
TEST_F(SecurityAuditorTest, AllCanariesBlocked) {
  AuditReport report = Audit(GuardManifest::Default());
  EXPECT_TRUE(report.overall_pass) << report.Describe();
  EXPECT_EQ(report.checks.size(), AllCapabilities().size());
  EXPECT_THAT(report.Failed(), IsEmpty());
  for (const CanaryCheck& check : report.checks) {
    EXPECT_TRUE(check.passed) << check.name << ": " << check.actual;
  }
  EXPECT_EQ(report.Describe(), "7/7 canaries blocked");
  EXPECT_FALSE(report.limiter.empty());
  // Every session is gone.
  EXPECT_THAT(util::File::ListFiles(base_->Path()), IsEmpty());
}

// Removing one guard fails exactly the canary of that capability.
// NOLINTNEXTLINE
TEST_F(SecurityAuditorTest, FaultInjection) {
  for (Capability capability : AllCapabilities()) {
    AuditReport report =
        Audit(GuardManifest::Default().Remove(capability));
    EXPECT_FALSE(report.overall_pass) << CapabilityName(capability);
    EXPECT_THAT(report.Failed(), ElementsAre(CapabilityName(capability)));
    EXPECT_THAT(report.Describe(), HasSubstr(CapabilityName(capability)));
  }
}

// NOLINTNEXTLINE
TEST(AuditFailure, CarriesTheReport) {
  AuditReport report;
  CanaryCheck check;
  check.name = "network";
  check.passed = false;
  report.checks.push_back(check);
  AuditFailure failure(report);
  EXPECT_THAT(failure.what(), HasSubstr("network"));
  EXPECT_THAT(failure.Report().Failed(), ElementsAre("network"));
  EXPECT_EQ(AuditReport().Describe(), "no canary was run");
}

}  // namespace
