#include "executor/process_executor.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"
#include "sandbox/syscall_filter.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {

// Descriptors above this are not inherited by the child either way: they are
// all close-on-exec or closed one by one up to here.
const constexpr int kMaxInheritedFd = 65536;

const constexpr auto kPollInterval = std::chrono::milliseconds(10);
const constexpr auto kMemoryPollInterval = std::chrono::milliseconds(1);

// Virtual memory size of the process, from the first field of statm.
int GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  static const int64_t page_kb = sysconf(_SC_PAGESIZE) / 1024;
  std::string statm;
  try {
    statm = util::File::ReadAll("/proc/" + std::to_string(pid) + "/statm");
  } catch (const std::system_error& exc) {
    return exc.code().value();
  }
  long long pages = 0;
  if (sscanf(statm.c_str(), "%lld", &pages) != 1) return EINVAL;
  *memory_usage_kb = pages * page_kb;
  return 0;
}

// One run of a child. Adapted from a classic fork-exec sandbox: errors in the
// child are sent to the parent through a close-on-exec pipe as a length and a
// message.
class UnixChild {
 public:
  UnixChild(const executor::LaunchSpec& spec,
            sandbox::ResourceLimiter* limiter)
      : spec_(spec), limiter_(limiter) {}

  bool Execute(executor::ExecutionInfo* info, std::string* error_msg) {
    if (!Setup(error_msg)) return false;
    if (!DoFork(error_msg)) return false;
    return Wait(info, error_msg);
  }

 private:
  // Executed before creating the child process. Prepares everything the
  // child needs, so that it does not have to allocate memory.
  bool Setup(std::string* error_msg);

  // Creates the child process and saves its PID in child_pid_.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing its process tree if it
  // exceeds the wall time or memory limit, then sweeps whatever it left
  // behind.
  bool Wait(executor::ExecutionInfo* info, std::string* error_msg);

  void ClosePipe() {
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
  }

  const executor::LaunchSpec& spec_;
  sandbox::ResourceLimiter* limiter_;
  std::unique_ptr<sandbox::SyscallFilter> filter_;
  std::vector<char*> args_;
  std::vector<char*> envp_;
  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
};

bool UnixChild::Setup(std::string* error_msg) {
#ifdef __linux__
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = util::ErrnoMessage("pipe2", errno);
    return false;
  }
#else
  if (pipe(pipe_fds_) == -1) {
    *error_msg = util::ErrnoMessage("pipe", errno);
    return false;
  }
  if (fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC) == -1) {
    *error_msg = util::ErrnoMessage("fcntl", errno);
    ClosePipe();
    return false;
  }
#endif
  for (const std::string& arg : spec_.args) {
    args_.push_back(const_cast<char*>(arg.c_str()));
  }
  args_.push_back(nullptr);
  for (const std::string& var : spec_.env) {
    envp_.push_back(const_cast<char*>(var.c_str()));
  }
  envp_.push_back(nullptr);
  if (spec_.syscall_filter) {
    filter_.reset(new sandbox::SyscallFilter(spec_.allow_network));
    filter_->AllowExec(args_[0]);
  }
  return true;
}

bool UnixChild::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = util::ErrnoMessage("fork", errno);
    ClosePipe();
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void UnixChild::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[util::kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, util::kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      write(pipe_fds_[1], buf, len);
    }
    close(pipe_fds_[1]);
    _Exit(executor::kSpawnFailureExitCode);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[util::kStrErrorBufSize] = {};
    die2(prefix, util::StrError(err, buf, util::kStrErrorBufSize));
  };

  // New session and process group: no Ctrl-C from the terminal, and the
  // whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = open("/dev/null", O_RDONLY);
  if (stdin_fd == -1) die("open /dev/null", errno);
  int stdout_fd = creat(spec_.stdout_file.c_str(), S_IRUSR | S_IWUSR);
  if (stdout_fd == -1) die("creat stdout", errno);
  int stderr_fd = creat(spec_.stderr_file.c_str(), S_IRUSR | S_IWUSR);
  if (stderr_fd == -1) die("creat stderr", errno);

  if (chdir(spec_.root.c_str()) == -1) die("chdir", errno);

  // Handle I/O redirection.
#define DUP(field, fd)                             \
  if (dup2(field##_fd, fd) == -1) {                \
    die("redir " #field, errno);                   \
  }                                                \
  if (field##_fd != fd) close(field##_fd);
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Nothing else of the parent reaches the child.
#ifdef SYS_close_range
  if (syscall(SYS_close_range, 3, ~0U, /*CLOSE_RANGE_CLOEXEC=*/1U << 2) == -1)
#endif
  {
    for (int fd = 3; fd < kMaxInheritedFd; fd++) {
      if (fd != pipe_fds_[1]) close(fd);
    }
  }

  char buf[util::kStrErrorBufSize] = {};
  if (!limiter_->ApplyToChild(buf, util::kStrErrorBufSize)) {
    die2("limits", buf);
  }
  if (filter_ && !filter_->Install(buf, util::kStrErrorBufSize)) {
    die2("filter", buf);
  }

  int count = 0;
  do {
    execve(args_[0], args_.data(), envp_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(executor::kSpawnFailureExitCode);
}

bool UnixChild::Wait(executor::ExecutionInfo* info, std::string* error_msg) {
  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) < 0) {
      snprintf(error, PIPE_BUF, "unknown error in the child");
    }
    info->spawn_error = error;
  }
  close(pipe_fds_[0]);

  std::atomic<int64_t> memory_usage{0};
  std::atomic<bool> done{false};
  std::thread memory_watcher(
      [&memory_usage, &done](pid_t pid) {
        while (!done) {
          int64_t mem;
          if (GetProcessMemoryUsage(pid, &mem) == 0) {
            if (mem > memory_usage) memory_usage = mem;
          }
          std::this_thread::sleep_for(kMemoryPollInterval);
        }
      },
      child_pid_);

  // The child is left unreaped (WNOWAIT) until its tree has been swept, so
  // that its pid and process group can not be reused in the meantime.
  bool has_exited = !info->spawn_error.empty();
  while (!has_exited && elapsed_millis() < spec_.wall_limit_millis) {
    if (spec_.memory_limit_kb && memory_usage > spec_.memory_limit_kb) {
      info->memory_killed = true;
      break;
    }
    siginfo_t status = {};
    int ret = waitid(P_PID, child_pid_, &status, WEXITED | WNOHANG | WNOWAIT);
    if (ret == -1 && errno != EINTR) {
      *error_msg = util::ErrnoMessage("waitid", errno);
      break;
    }
    if (ret == 0 && status.si_pid == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  if (!has_exited && !info->memory_killed) info->timed_out = true;

  sandbox::ChildProcess child;
  child.pid = child_pid_;
  limiter_->KillTree(child, spec_.marker);

  int child_status = 0;
  struct rusage rusage = {};
  int ret = 0;
  while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
         errno == EINTR) {
  }
  done = true;
  memory_watcher.join();
  if (ret != child_pid_) {
    *error_msg = util::ErrnoMessage("wait4", errno);
    return false;
  }

  info->memory_usage_kb = memory_usage;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  return true;
}

}  // namespace

namespace executor {

bool ExecuteChild(const LaunchSpec& spec, sandbox::ResourceLimiter* limiter,
                  ExecutionInfo* info, std::string* error_msg) {
  UnixChild child(spec, limiter);
  return child.Execute(info, error_msg);
}

}  // namespace executor
