#include "executor/process_executor.hpp"

#include <signal.h>

#include <stdexcept>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "sandbox/environment.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/syscall_filter.hpp"
#include "util/file.hpp"

namespace {
// Errors the interpreter reports when a cap makes a call fail instead of
// killing the process. Python ignores SIGXFSZ.
const constexpr char* kFileTooLarge = "[Errno 27] File too large";
const constexpr char* kTooManyOpenFiles = "[Errno 24] Too many open files";
const constexpr char* kMemoryError = "MemoryError";
const constexpr char* kTraceback = "Traceback (most recent call last):";

// The exception that ended the run, read from the last line of the
// traceback. Empty if the child did not die of an uncaught exception.
struct FinalException {
  explicit FinalException(const std::string& err) {
    if (!absl::StrContains(err, kTraceback)) return;
    std::vector<absl::string_view> lines =
        absl::StrSplit(err, '\n', absl::SkipWhitespace());
    if (lines.empty()) return;
    line = std::string(lines.back());
    std::vector<std::string> parts =
        absl::StrSplit(line, absl::MaxSplits(": ", 1));
    type = parts[0];
    if (parts.size() > 1) message = parts[1];
  }

  std::string line;
  std::string type;
  std::string message;
};

std::string ReadOutput(const std::string& path, int64_t limit) {
  try {
    return util::File::ReadAll(path, limit);
  } catch (const util::file_not_found&) {
    // The child died before creating it.
    return "";
  } catch (const std::system_error& exc) {
    throw sandbox::WorkspaceError(exc, "Cannot read the output of the child");
  }
}
}  // namespace

namespace executor {

ProcessExecutor::ProcessExecutor(const sandbox::GuardModule* guard,
                                 std::string limiter_name)
    : guard_(guard), limiter_name_(std::move(limiter_name)) {}

std::unique_ptr<sandbox::ResourceLimiter> ProcessExecutor::NewLimiter() const {
  if (limiter_name_.empty()) return sandbox::ResourceLimiter::Create();
  return sandbox::ResourceLimiter::Create(limiter_name_);
}

ExecutionResult ProcessExecutor::Run(sandbox::SandboxSession* session,
                                     const std::vector<std::string>& command,
                                     int32_t timeout_s) {
  if (command.empty() || command[0].empty()) {
    throw sandbox::ConfigurationError("Empty command");
  }
  if (timeout_s < 1 || timeout_s > sandbox::kMaxTimeoutS) {
    throw sandbox::ConfigurationError("Invalid timeout " +
                                      std::to_string(timeout_s));
  }
  if (session->State() != sandbox::SessionState::kReady) {
    throw std::logic_error(
        "Session " + session->RunId() + " is " +
        sandbox::SessionStateName(session->State()) + ", not READY");
  }
  guard_->Install(*session);

  std::unique_ptr<sandbox::ResourceLimiter> limiter = NewLimiter();
  if (!limiter) {
    throw sandbox::ConfigurationError("No usable resource limiter " +
                                      limiter_name_);
  }
  std::string error_msg;
  if (!limiter->Configure(*session, timeout_s, &error_msg)) {
    throw sandbox::ConfigurationError(error_msg);
  }

  LaunchSpec spec;
  spec.args = command;
  spec.env = sandbox::EnvironmentScrubber::ToEnvp(session->Environment());
  spec.root = session->Root();
  spec.stdout_file = session->StdoutPath();
  spec.stderr_file = session->StderrPath();
  spec.wall_limit_millis = int64_t{timeout_s} * 1000;
  spec.memory_limit_kb = limiter->MemoryLimitKb();
  spec.marker = std::string(sandbox::EnvironmentScrubber::kSandboxRootVar) +
                "=" + session->Root();
  spec.syscall_filter = session->Options().syscall_filter &&
                        sandbox::SyscallFilter::Supported();
  spec.allow_network = session->AllowNetwork();

  VLOG(1) << "Running " << command[0] << " in " << session->Root()
          << " with limiter " << limiter->Name();
  session->SetState(sandbox::SessionState::kRunning);
  ExecutionInfo info;
  bool started = ExecuteChild(spec, limiter.get(), &info, &error_msg);
  session->SetState(sandbox::SessionState::kFinished);
  if (!started) {
    LOG(WARNING) << "Cannot start " << command[0] << ": " << error_msg;
    return ExecutionResult::SpawnFailure(error_msg, info.wall_time_millis);
  }
  ExecutionResult result = MakeResult(*session, info, limiter.get());
  VLOG(1) << "Run " << session->RunId() << ": " << result.Describe();
  return result;
}

ExecutionResult ProcessExecutor::MakeResult(
    const sandbox::SandboxSession& session, const ExecutionInfo& info,
    sandbox::ResourceLimiter* limiter) const {
  ExecutionResult::Fields fields;
  fields.duration_millis = info.wall_time_millis;
  fields.cpu_time_millis = info.cpu_time_millis + info.sys_time_millis;
  fields.memory_usage_kb = info.memory_usage_kb;
  fields.signal = info.signal;
  fields.timed_out = info.timed_out;
  fields.spawn_error = info.spawn_error;
  if (!info.spawn_error.empty()) {
    fields.exit_code = kSpawnFailureExitCode;
  } else if (info.signal != 0) {
    fields.exit_code = 128 + info.signal;
  } else {
    fields.exit_code = info.status_code;
  }

  int64_t output_limit =
      int64_t{session.Options().max_file_size_mb} * 1024 * 1024;
  fields.stdout_data = ReadOutput(session.StdoutPath(), output_limit);
  fields.stderr_data = ReadOutput(session.StderrPath(), output_limit);
  if (!fields.spawn_error.empty()) {
    return ExecutionResult(std::move(fields));
  }

  // A run that exited normally never reached a cap.
  if (fields.exit_code == 0) return ExecutionResult(std::move(fields));

  int64_t cpu_limit_millis = limiter->CpuLimitS() * 1000;
  FinalException final_exception(fields.stderr_data);
  std::string& violation = fields.violation;
#ifndef _WIN32
  if (info.signal == SIGXCPU ||
      (info.signal == SIGKILL && !info.timed_out &&
       fields.cpu_time_millis >= cpu_limit_millis)) {
    violation = "cpu time";
  } else if (info.signal == SIGXFSZ) {
    violation = "file size";
  }
#endif
  if (violation.empty()) {
    if (info.memory_killed ||
        (info.status_code == sandbox::kMemoryLimitExitCode &&
         final_exception.line == sandbox::kMemoryLimitMarker) ||
        final_exception.type == kMemoryError) {
      violation = "memory";
    } else if (absl::StartsWith(final_exception.message, kFileTooLarge)) {
      violation = "file size";
    } else if (absl::StartsWith(final_exception.message, kTooManyOpenFiles)) {
      violation = "open files";
    } else if (limiter->ViolationReported()) {
      violation = std::string(limiter->Name()) + " limits";
    } else if (!info.timed_out && limiter->MemoryLimitKb() > 0 &&
               info.memory_usage_kb >= limiter->MemoryLimitKb()) {
      violation = "memory";
    }
  }
  fields.resource_violation = !violation.empty();
  return ExecutionResult(std::move(fields));
}

}  // namespace executor
