#ifndef EXECUTOR_EXECUTION_RESULT_HPP
#define EXECUTOR_EXECUTION_RESULT_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace executor {

// Exit code reported when the child could not be started.
static const constexpr int32_t kSpawnFailureExitCode = 127;

// Outcome of one sandboxed run. Built once by the executor and never changed
// afterwards.
class ExecutionResult {
 public:
  struct Fields {
    // Exit status of the child, or 128 + signal if it was killed.
    int32_t exit_code = 0;
    int32_t signal = 0;
    std::string stdout_data;
    std::string stderr_data;
    int64_t duration_millis = 0;
    int64_t cpu_time_millis = 0;
    int64_t memory_usage_kb = 0;
    bool timed_out = false;
    bool resource_violation = false;
    // Which cap was reached, if resource_violation is set.
    std::string violation;
    // Why the child could not be started, if it could not.
    std::string spawn_error;
  };

  explicit ExecutionResult(Fields fields) : fields_(std::move(fields)) {}

  static ExecutionResult SpawnFailure(const std::string& error,
                                      int64_t duration_millis);

  int32_t ExitCode() const { return fields_.exit_code; }
  int32_t Signal() const { return fields_.signal; }
  const std::string& Stdout() const { return fields_.stdout_data; }
  const std::string& Stderr() const { return fields_.stderr_data; }
  int64_t DurationMillis() const { return fields_.duration_millis; }
  double DurationSeconds() const { return fields_.duration_millis / 1000.0; }
  int64_t CpuTimeMillis() const { return fields_.cpu_time_millis; }
  int64_t MemoryUsageKb() const { return fields_.memory_usage_kb; }
  bool TimedOut() const { return fields_.timed_out; }
  bool ResourceViolation() const { return fields_.resource_violation; }
  const std::string& Violation() const { return fields_.violation; }
  const std::string& SpawnError() const { return fields_.spawn_error; }

  // Exit code zero, no timeout, no violation.
  bool Success() const;

  // One line summary, e.g. "exit 1 in 0.04s" or "timed out after 2.00s".
  std::string Describe() const;

 private:
  const Fields fields_;
};

}  // namespace executor

#endif
