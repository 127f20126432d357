#ifndef AUDIT_SECURITY_AUDITOR_HPP
#define AUDIT_SECURITY_AUDITOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "audit/canaries.hpp"
#include "executor/process_executor.hpp"
#include "sandbox/workspace.hpp"

namespace audit {

struct AuditReport {
  std::vector<CanaryCheck> checks;
  bool overall_pass = false;
  // Limiter the canaries ran under.
  std::string limiter;

  // Names of the canaries that failed.
  std::vector<std::string> Failed() const;

  // "7/7 canaries blocked" or the list of the failed ones.
  std::string Describe() const;
};

// Raised when something needs a passed audit and does not have one.
class AuditFailure : public std::runtime_error {
 public:
  explicit AuditFailure(AuditReport report);
  const AuditReport& Report() const { return report_; }

 private:
  AuditReport report_;
};

// Attacks a live sandbox with the canaries and checks that every one of them
// is stopped.
class SecurityAuditor {
 public:
  // The canaries run through executor in sessions of workspace, with the
  // given interpreter. Only the limits of options are used: the network is
  // never allowed during an audit.
  SecurityAuditor(const sandbox::SandboxWorkspace* workspace,
                  executor::ProcessExecutor* executor, std::string python,
                  sandbox::SessionOptions options);

  // Runs every canary in its own disposable session. Engine faults during
  // a canary (ConfigurationError, WorkspaceError) propagate.
  AuditReport RunAudit() const;

  // Runs a single canary.
  CanaryCheck RunCanary(const Canary& canary) const;

 private:
  const sandbox::SandboxWorkspace* workspace_;
  executor::ProcessExecutor* executor_;
  std::string python_;
  sandbox::SessionOptions options_;
};

}  // namespace audit

#endif
