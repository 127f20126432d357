#include "engine/engine.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

#include "glog/logging.h"
#include "sandbox/errors.hpp"
#include "sandbox/path_guard.hpp"
#include "sandbox/syscall_filter.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace engine {

const char* EngineStateName(EngineState state) {
  switch (state) {
    case EngineState::kAuditPending:
      return "AUDIT_PENDING";
    case EngineState::kAuditPassed:
      return "AUDIT_PASSED";
    case EngineState::kReady:
      return "READY";
    case EngineState::kAuditFailed:
      return "AUDIT_FAILED";
    case EngineState::kAborted:
      return "ABORTED";
  }
  return "UNKNOWN";
}

EngineOptions EngineOptions::FromFlags() {
  EngineOptions options;
  options.temp_directory = FLAGS_temp_directory;
  options.python = FLAGS_python;
  options.limiter = FLAGS_limiter;
  options.session = sandbox::SessionOptions::FromFlags();
  options.workers = FLAGS_workers;
  return options;
}

void EngineOptions::Validate() const {
  session.Validate();
  if (workers < 1) {
    throw sandbox::ConfigurationError("Invalid number of workers " +
                                      std::to_string(workers));
  }
  if (temp_directory.empty()) {
    throw sandbox::ConfigurationError("Empty temporary directory");
  }
  if (python.empty()) throw sandbox::ConfigurationError("Empty interpreter");
}

Engine::Engine(EngineOptions options, sandbox::GuardManifest manifest)
    : options_(std::move(options)) {
  options_.Validate();
  python_ = util::ResolveInterpreter(options_.python);
  if (python_.empty()) {
    throw sandbox::ConfigurationError("Cannot find the interpreter " +
                                      options_.python);
  }
  guard_.reset(new sandbox::GuardModule(std::move(manifest)));
  executor_.reset(new executor::ProcessExecutor(guard_.get(), options_.limiter));
  std::unique_ptr<sandbox::ResourceLimiter> limiter = executor_->NewLimiter();
  if (!limiter) {
    throw sandbox::ConfigurationError(
        options_.limiter.empty()
            ? std::string("No resource limiter is usable on this system")
            : "Resource limiter " + options_.limiter + " is not usable");
  }
  limiter_name_ = limiter->Name();
  guarantee_ = limiter->GetGuarantee();
  syscall_filter_ = options_.session.syscall_filter &&
                    sandbox::SyscallFilter::Supported();

  LOG(INFO) << "Using interpreter " << python_ << " and resource limiter "
            << limiter_name_;
  if (guarantee_ == sandbox::Guarantee::kReduced) {
    LOG(WARNING) << "Resource limiter " << limiter_name_
                 << " only provides a REDUCED guarantee: wall-clock watchdog "
                    "and tree-kill, no hard memory cap";
  }
  if (options_.session.syscall_filter && !syscall_filter_) {
    LOG(WARNING) << "The syscall filter is not supported here; process "
                    "spawning and network access are only blocked by the "
                    "guard module";
  } else if (!syscall_filter_) {
    LOG(WARNING) << "The syscall filter is disabled";
  }
}

std::string Engine::AuditKey() const {
  return limiter_name_ + "\n" + guard_->Source();
}

void Engine::SetState(EngineState state) {
  VLOG(1) << "Engine: " << EngineStateName(state_) << " -> "
          << EngineStateName(state);
  state_ = state;
}

bool Engine::EnsureAudited() {
  std::lock_guard<std::mutex> lck(state_mutex_);
  if (state_ == EngineState::kReady) return true;
  if (state_ == EngineState::kAborted) return false;

  std::string key = AuditKey();
  if (!report_ || report_key_ != key) {
    sandbox::SandboxWorkspace workspace(options_.temp_directory);
    audit::SecurityAuditor auditor(&workspace, executor_.get(), python_,
                                   options_.session);
    report_.reset(new audit::AuditReport(auditor.RunAudit()));
    report_key_ = key;
  } else {
    VLOG(1) << "Using the cached audit report";
  }

  if (report_->overall_pass) {
    SetState(EngineState::kAuditPassed);
    SetState(EngineState::kReady);
    LOG(INFO) << "Security audit passed, submissions can run";
    return true;
  }
  SetState(EngineState::kAuditFailed);
  SetState(EngineState::kAborted);
  LOG(ERROR) << "Security audit failed, refusing to run submissions: "
             << report_->Describe();
  return false;
}

bool Engine::Override(const std::string& reason) {
  std::lock_guard<std::mutex> lck(state_mutex_);
  if (state_ != EngineState::kAborted) {
    LOG(WARNING) << "Ignoring audit override in state "
                 << EngineStateName(state_);
    return false;
  }
  LOG(ERROR) << "OPERATOR OVERRIDE of a failed security audit (" << reason
             << "). Accepted reduced guarantee: "
             << (report_ ? report_->Describe() : "no audit report")
             << "; submissions may reach these capabilities.";
  overridden_ = true;
  SetState(EngineState::kReady);
  return true;
}

void Engine::SetManifest(sandbox::GuardManifest manifest) {
  std::lock_guard<std::mutex> lck(state_mutex_);
  std::unique_ptr<sandbox::GuardModule> guard(
      new sandbox::GuardModule(std::move(manifest)));
  executor_.reset(new executor::ProcessExecutor(guard.get(), options_.limiter));
  guard_ = std::move(guard);
  if (report_ && report_key_ != AuditKey()) {
    VLOG(1) << "Guard configuration changed, dropping the audit report";
    report_.reset();
    report_key_.clear();
  }
  overridden_ = false;
  SetState(EngineState::kAuditPending);
}

EngineState Engine::State() const {
  std::lock_guard<std::mutex> lck(state_mutex_);
  return state_;
}

bool Engine::Overridden() const {
  std::lock_guard<std::mutex> lck(state_mutex_);
  return overridden_;
}

const audit::AuditReport* Engine::Report() const {
  std::lock_guard<std::mutex> lck(state_mutex_);
  return report_.get();
}

executor::ExecutionResult Engine::Run(const Submission& submission) {
  {
    std::lock_guard<std::mutex> lck(state_mutex_);
    if (state_ != EngineState::kReady) {
      throw audit::AuditFailure(report_ ? *report_ : audit::AuditReport());
    }
  }
  sandbox::SandboxWorkspace workspace(options_.temp_directory,
                                      submission.files);
  sandbox::ScopedSession session(workspace, submission.name, options_.session);
  sandbox::PathGuard path_guard(session->Root());
  if (submission.entry_point.empty() ||
      !path_guard.IsAllowed(submission.entry_point,
                            sandbox::PathGuard::Access::kRead)) {
    throw sandbox::ConfigurationError("Invalid entry point " +
                                      submission.entry_point);
  }
  return executor_->Run(session.get(), {python_, submission.entry_point});
}

std::vector<BatchResult> Engine::RunBatch(
    const std::vector<Submission>& submissions) {
  std::vector<BatchResult> results(submissions.size());
  std::atomic<size_t> next{0};
  auto worker = [this, &submissions, &results, &next]() {
    for (size_t i = next++; i < submissions.size(); i = next++) {
      try {
        results[i].result.reset(
            new executor::ExecutionResult(Run(submissions[i])));
      } catch (const std::exception& exc) {
        LOG(ERROR) << "Submission " << submissions[i].name
                   << " failed: " << exc.what();
        results[i].error = exc.what();
      }
    }
  };
  size_t num_workers =
      std::min<size_t>(options_.workers, submissions.size());
  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_workers; i++) threads.emplace_back(worker);
  for (std::thread& thread : threads) thread.join();
  return results;
}

}  // namespace engine
