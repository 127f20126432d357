#include "audit/security_auditor.hpp"

#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {
const constexpr char* kCanaryFile = "canary.py";
// Canaries are tiny. The longest one waits at most one second for a
// connection.
const constexpr int32_t kCanaryTimeoutS = 10;
}  // namespace

namespace audit {

std::vector<std::string> AuditReport::Failed() const {
  std::vector<std::string> failed;
  for (const CanaryCheck& check : checks) {
    if (!check.passed) failed.push_back(check.name);
  }
  return failed;
}

std::string AuditReport::Describe() const {
  std::vector<std::string> failed = Failed();
  if (failed.empty() && !checks.empty()) {
    return std::to_string(checks.size()) + "/" +
           std::to_string(checks.size()) + " canaries blocked";
  }
  if (checks.empty()) return "no canary was run";
  return "canaries not blocked: " + absl::StrJoin(failed, ", ");
}

AuditFailure::AuditFailure(AuditReport report)
    : std::runtime_error("Security audit failed: " + report.Describe()),
      report_(std::move(report)) {}

SecurityAuditor::SecurityAuditor(const sandbox::SandboxWorkspace* workspace,
                                 executor::ProcessExecutor* executor,
                                 std::string python,
                                 sandbox::SessionOptions options)
    : workspace_(workspace),
      executor_(executor),
      python_(std::move(python)),
      options_(options) {
  options_.allow_network = false;
  options_.keep = false;
  if (options_.timeout_s > kCanaryTimeoutS) options_.timeout_s = kCanaryTimeoutS;
}

CanaryCheck SecurityAuditor::RunCanary(const Canary& canary) const {
  sandbox::ScopedSession session(
      *workspace_, std::string("audit-") + canary.Name(), options_);
  util::File::WriteAll(util::File::JoinPath(session->Root(), kCanaryFile),
                       canary.Program());
  executor::ExecutionResult result =
      executor_->Run(session.get(), {python_, kCanaryFile});
  bool side_effect = !canary.side_effect.empty() &&
                     util::File::Exists(util::File::JoinPath(
                         session->Root(), canary.side_effect));
  CanaryCheck check = Evaluate(canary, result, side_effect);
  if (check.passed) {
    LOG(INFO) << "Canary " << check.name << " passed: " << check.actual;
  } else {
    LOG(ERROR) << "Canary " << check.name << " FAILED: expected "
               << check.expected << ", got " << check.actual;
  }
  return check;
}

AuditReport SecurityAuditor::RunAudit() const {
  AuditReport report;
  std::unique_ptr<sandbox::ResourceLimiter> limiter = executor_->NewLimiter();
  if (limiter) report.limiter = limiter->Name();
  for (const Canary& canary : Canaries()) {
    report.checks.push_back(RunCanary(canary));
  }
  report.overall_pass = report.Failed().empty() && !report.checks.empty();
  if (report.overall_pass) {
    LOG(INFO) << "Security audit passed: " << report.Describe();
  } else {
    LOG(ERROR) << "Security audit failed: " << report.Describe();
  }
  return report;
}

}  // namespace audit
