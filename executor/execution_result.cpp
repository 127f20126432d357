#include "executor/execution_result.hpp"

#include "absl/strings/str_format.h"

namespace executor {

ExecutionResult ExecutionResult::SpawnFailure(const std::string& error,
                                              int64_t duration_millis) {
  Fields fields;
  fields.exit_code = kSpawnFailureExitCode;
  fields.duration_millis = duration_millis;
  fields.spawn_error = error;
  return ExecutionResult(std::move(fields));
}

bool ExecutionResult::Success() const {
  return fields_.exit_code == 0 && !fields_.timed_out &&
         !fields_.resource_violation && fields_.spawn_error.empty();
}

std::string ExecutionResult::Describe() const {
  if (!fields_.spawn_error.empty()) {
    return "could not start: " + fields_.spawn_error;
  }
  if (fields_.timed_out) {
    return absl::StrFormat("timed out after %.2fs", DurationSeconds());
  }
  std::string summary =
      absl::StrFormat("exit %d in %.2fs", fields_.exit_code, DurationSeconds());
  if (fields_.signal != 0) {
    summary += absl::StrFormat(" (signal %d)", fields_.signal);
  }
  if (fields_.resource_violation) {
    summary += ", resource limit reached: " + fields_.violation;
  }
  return summary;
}

}  // namespace executor
