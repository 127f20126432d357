#ifndef ENGINE_ENGINE_HPP
#define ENGINE_ENGINE_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "audit/security_auditor.hpp"
#include "executor/process_executor.hpp"
#include "sandbox/guard_module.hpp"
#include "sandbox/resource_limiter.hpp"
#include "sandbox/workspace.hpp"

namespace engine {

// AUDIT_PENDING -> AUDIT_PASSED -> READY, or
// AUDIT_PENDING -> AUDIT_FAILED -> ABORTED. ABORTED is left only through
// Engine::Override.
enum class EngineState {
  kAuditPending,
  kAuditPassed,
  kReady,
  kAuditFailed,
  kAborted
};

const char* EngineStateName(EngineState state);

struct EngineOptions {
  // Directory under which the sandboxes are created.
  std::string temp_directory = "/tmp";
  // Interpreter command, resolved to the real binary by the engine.
  std::string python = "python3";
  // Resource limiter name, empty for the best available.
  std::string limiter;
  sandbox::SessionOptions session;
  // Maximum number of concurrent sessions in RunBatch.
  int32_t workers = 1;

  static EngineOptions FromFlags();

  // Throws ConfigurationError.
  void Validate() const;
};

// A submission: the files copied (read-only) into the sandbox and the script
// to run, relative to the sandbox root.
struct Submission {
  std::string name;
  std::vector<sandbox::SandboxWorkspace::Input> files;
  std::string entry_point;
};

// Outcome of one submission of a batch: either a result or the engine fault
// that prevented it.
struct BatchResult {
  std::unique_ptr<executor::ExecutionResult> result;
  std::string error;
};

class Engine {
 public:
  // Throws ConfigurationError if the options are invalid, the interpreter
  // cannot be found or no resource limiter is usable.
  explicit Engine(EngineOptions options, sandbox::GuardManifest manifest =
                                             sandbox::GuardManifest::Default());

  // Runs the security audit, unless a report for the current guard and
  // limiter is already cached. Returns true if submissions may run. Must be
  // checked by the caller before running anything.
  bool EnsureAudited();

  // Accepts a failed audit and moves from ABORTED to READY. The accepted
  // reduced guarantee is logged at ERROR together with reason. Returns false
  // (and changes nothing) in any other state.
  bool Override(const std::string& reason);

  // Replaces the guard configuration. The cached audit is dropped and the
  // engine goes back to AUDIT_PENDING. Not to be called while runs are in
  // progress.
  void SetManifest(sandbox::GuardManifest manifest);

  // Runs a submission in a fresh session, torn down before returning. Throws
  // AuditFailure if the engine is not READY, ConfigurationError and
  // WorkspaceError on engine faults.
  executor::ExecutionResult Run(const Submission& submission);

  // Runs the submissions with at most options.workers concurrent sessions.
  // Results are in the same order as the submissions. An engine fault fails
  // only the submission it happened in.
  std::vector<BatchResult> RunBatch(const std::vector<Submission>& submissions);

  EngineState State() const;
  bool Overridden() const;
  // The cached audit report, or nullptr.
  const audit::AuditReport* Report() const;

  const std::string& Python() const { return python_; }
  const std::string& LimiterName() const { return limiter_name_; }
  sandbox::Guarantee GetGuarantee() const { return guarantee_; }
  bool SyscallFilterActive() const { return syscall_filter_; }
  const EngineOptions& Options() const { return options_; }
  const sandbox::GuardManifest& Manifest() const { return guard_->Manifest(); }

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

 private:
  std::string AuditKey() const;
  void SetState(EngineState state);

  EngineOptions options_;
  std::string python_;
  std::string limiter_name_;
  sandbox::Guarantee guarantee_;
  bool syscall_filter_ = false;

  std::unique_ptr<sandbox::GuardModule> guard_;
  std::unique_ptr<executor::ProcessExecutor> executor_;

  mutable std::mutex state_mutex_;
  EngineState state_ = EngineState::kAuditPending;
  bool overridden_ = false;
  std::unique_ptr<audit::AuditReport> report_;
  std::string report_key_;
};

}  // namespace engine

#endif
