#ifndef EXECUTOR_PROCESS_EXECUTOR_HPP
#define EXECUTOR_PROCESS_EXECUTOR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "executor/execution_result.hpp"
#include "sandbox/guard_module.hpp"
#include "sandbox/resource_limiter.hpp"
#include "sandbox/workspace.hpp"

namespace executor {

// Everything the platform layer needs to start the child.
struct LaunchSpec {
  // args[0] is the path of the executable.
  std::vector<std::string> args;
  // "NAME=value" entries, the whole environment of the child.
  std::vector<std::string> env;
  // Working directory.
  std::string root;
  std::string stdout_file;
  std::string stderr_file;
  int64_t wall_limit_millis = 0;
  // The child is killed when it uses more than this. 0 means no limit.
  int64_t memory_limit_kb = 0;
  // Environment entry that identifies the processes of this sandbox.
  std::string marker;
  bool syscall_filter = false;
  bool allow_network = false;
};

// What the platform layer observed.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool timed_out = false;
  // Killed by the executor for using more than memory_limit_kb.
  bool memory_killed = false;
  // Set if the child failed between fork and exec.
  std::string spawn_error;
};

// Starts the child described by spec under limiter, waits for it and kills
// its whole process tree, whatever the way it ended. Returns false and sets
// error_msg if the child could not be created at all; nothing is left running
// in that case. Implemented once per platform.
bool ExecuteChild(const LaunchSpec& spec, sandbox::ResourceLimiter* limiter,
                  ExecutionInfo* info, std::string* error_msg);

// Runs commands inside prepared sandbox sessions. Anything that happens inside
// the sandbox (crashes, timeouts, guard trips, caps) ends up in the returned
// ExecutionResult; only faults of the engine itself are thrown. Run can be
// called concurrently for different sessions.
class ProcessExecutor {
 public:
  // limiter_name selects a specific limiter, empty means the best one.
  explicit ProcessExecutor(const sandbox::GuardModule* guard,
                           std::string limiter_name = "");

  // Installs the guard module in the session, then runs command (command[0]
  // must be the path of the interpreter) with the session environment,
  // inside the session root, for at most timeout_s seconds. Throws
  // ConfigurationError if the arguments are invalid or the limiter can not
  // be configured, and WorkspaceError if the session can not be prepared or
  // read back.
  ExecutionResult Run(sandbox::SandboxSession* session,
                      const std::vector<std::string>& command,
                      int32_t timeout_s);

  // Same as above, with the timeout of the session.
  ExecutionResult Run(sandbox::SandboxSession* session,
                      const std::vector<std::string>& command) {
    return Run(session, command, session->TimeoutS());
  }

  // A fresh instance of the limiter used for every run, or nullptr.
  std::unique_ptr<sandbox::ResourceLimiter> NewLimiter() const;

 private:
  ExecutionResult MakeResult(const sandbox::SandboxSession& session,
                             const ExecutionInfo& info,
                             sandbox::ResourceLimiter* limiter) const;

  const sandbox::GuardModule* guard_;
  std::string limiter_name_;
};

}  // namespace executor

#endif
