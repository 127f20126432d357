#include "executor/process_executor.hpp"

#include <chrono>
#include <thread>

#include <windows.h>
#include <psapi.h>

#include "absl/strings/str_join.h"
#include "glog/logging.h"

namespace {

const constexpr auto kPollInterval = std::chrono::milliseconds(10);

std::string LastErrorMessage(const std::string& step) {
  DWORD err = GetLastError();
  char buf[512] = {};
  FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                 nullptr, err, 0, buf, sizeof(buf), nullptr);
  return step + ": " + buf;
}

// Quotes arg following the rules of CommandLineToArgvW.
std::string QuoteArg(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
    return arg;
  }
  std::string quoted = "\"";
  size_t backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      backslashes++;
      continue;
    }
    if (c == '"') quoted.append(backslashes * 2 + 1, '\\');
    else quoted.append(backslashes, '\\');
    backslashes = 0;
    quoted.push_back(c);
  }
  quoted.append(backslashes * 2, '\\');
  quoted.push_back('"');
  return quoted;
}

int64_t FileTimeMillis(const FILETIME& time) {
  ULARGE_INTEGER value;
  value.LowPart = time.dwLowDateTime;
  value.HighPart = time.dwHighDateTime;
  // 100ns units.
  return value.QuadPart / 10000;
}

HANDLE OpenOutput(const std::string& path, SECURITY_ATTRIBUTES* attrs) {
  return CreateFileA(path.c_str(), GENERIC_WRITE, FILE_SHARE_READ, attrs,
                     CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
}

}  // namespace

namespace executor {

bool ExecuteChild(const LaunchSpec& spec, sandbox::ResourceLimiter* limiter,
                  ExecutionInfo* info, std::string* error_msg) {
  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  SECURITY_ATTRIBUTES attrs = {};
  attrs.nLength = sizeof(attrs);
  attrs.bInheritHandle = TRUE;
  HANDLE stdin_handle = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ,
                                    &attrs, OPEN_EXISTING, 0, nullptr);
  HANDLE stdout_handle = OpenOutput(spec.stdout_file, &attrs);
  HANDLE stderr_handle = OpenOutput(spec.stderr_file, &attrs);
  auto close_stdio = [&]() {
    for (HANDLE handle : {stdin_handle, stdout_handle, stderr_handle}) {
      if (handle != INVALID_HANDLE_VALUE) CloseHandle(handle);
    }
  };
  if (stdin_handle == INVALID_HANDLE_VALUE ||
      stdout_handle == INVALID_HANDLE_VALUE ||
      stderr_handle == INVALID_HANDLE_VALUE) {
    *error_msg = LastErrorMessage("CreateFile");
    close_stdio();
    return false;
  }

  std::vector<std::string> quoted;
  for (const std::string& arg : spec.args) quoted.push_back(QuoteArg(arg));
  std::string command_line = absl::StrJoin(quoted, " ");
  // Double-NUL terminated block of NAME=value entries.
  std::string env_block;
  for (const std::string& var : spec.env) {
    env_block += var;
    env_block.push_back('\0');
  }
  env_block.push_back('\0');

  STARTUPINFOA startup = {};
  startup.cb = sizeof(startup);
  startup.dwFlags = STARTF_USESTDHANDLES;
  startup.hStdInput = stdin_handle;
  startup.hStdOutput = stdout_handle;
  startup.hStdError = stderr_handle;
  PROCESS_INFORMATION process = {};
  // Suspended, so that the limits are in place before the first instruction.
  if (!CreateProcessA(spec.args[0].c_str(), &command_line[0], nullptr, nullptr,
                      TRUE, CREATE_SUSPENDED | CREATE_NEW_PROCESS_GROUP,
                      &env_block[0], spec.root.c_str(), &startup, &process)) {
    *error_msg = LastErrorMessage("CreateProcess");
    close_stdio();
    return false;
  }
  close_stdio();

  sandbox::ChildProcess child;
  child.pid = process.dwProcessId;
  child.handle = process.hProcess;
  std::string limiter_error;
  if (!limiter->ApplyToProcess(child, &limiter_error)) {
    info->spawn_error = "limits: " + limiter_error;
    TerminateProcess(process.hProcess, kSpawnFailureExitCode);
  } else if (ResumeThread(process.hThread) == static_cast<DWORD>(-1)) {
    info->spawn_error = LastErrorMessage("ResumeThread");
    TerminateProcess(process.hProcess, kSpawnFailureExitCode);
  }
  CloseHandle(process.hThread);

  bool has_exited = false;
  while (info->spawn_error.empty() &&
         elapsed_millis() < spec.wall_limit_millis) {
    PROCESS_MEMORY_COUNTERS counters = {};
    if (GetProcessMemoryInfo(process.hProcess, &counters, sizeof(counters))) {
      int64_t peak_kb = counters.PeakPagefileUsage / 1024;
      if (peak_kb > info->memory_usage_kb) info->memory_usage_kb = peak_kb;
    }
    if (spec.memory_limit_kb && info->memory_usage_kb > spec.memory_limit_kb) {
      info->memory_killed = true;
      break;
    }
    DWORD wait = WaitForSingleObject(
        process.hProcess, static_cast<DWORD>(kPollInterval.count()));
    if (wait == WAIT_OBJECT_0) {
      has_exited = true;
      break;
    }
    if (wait == WAIT_FAILED) {
      LOG(ERROR) << LastErrorMessage("WaitForSingleObject");
      break;
    }
  }
  if (info->spawn_error.empty() && !has_exited && !info->memory_killed) {
    info->timed_out = true;
  }

  limiter->KillTree(child, spec.marker);
  WaitForSingleObject(process.hProcess, INFINITE);

  DWORD exit_code = 0;
  GetExitCodeProcess(process.hProcess, &exit_code);
  info->status_code = static_cast<int32_t>(exit_code);
  FILETIME creation, exit, kernel, user;
  if (GetProcessTimes(process.hProcess, &creation, &exit, &kernel, &user)) {
    info->cpu_time_millis = FileTimeMillis(user);
    info->sys_time_millis = FileTimeMillis(kernel);
  }
  info->wall_time_millis = elapsed_millis();
  CloseHandle(process.hProcess);
  return true;
}

}  // namespace executor
