#include "sandbox/syscall_filter.hpp"

#include <errno.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <functional>

#include "gtest/gtest.h"
#include "util/misc.hpp"

namespace {

using sandbox::SyscallFilter;

// Runs body in a forked child with the filter installed and returns its exit
// code. The child exits with 100 if the filter can not be installed.
int RunFiltered(SyscallFilter* filter, const std::function<int()>& body) {
  pid_t pid = fork();
  if (pid == 0) {
    char error[util::kStrErrorBufSize] = {};
    if (!filter->Install(error, sizeof(error))) _Exit(100);
    _Exit(body());
  }
  int status = 0;
  EXPECT_EQ(waitpid(pid, &status, 0), pid);
  EXPECT_TRUE(WIFEXITED(status));
  return WEXITSTATUS(status);
}

class SyscallFilterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!SyscallFilter::Supported()) GTEST_SKIP() << "seccomp not available";
  }
};

// NOLINTNEXTLINE
TEST_F(SyscallFilterTest, ForkIsDenied) {
  SyscallFilter filter(false);
  EXPECT_EQ(RunFiltered(&filter,
                        []() {
                          pid_t child = fork();
                          if (child == 0) _Exit(0);
                          return child == -1 && errno == EPERM ? 0 : 1;
                        }),
            0);
}

// NOLINTNEXTLINE
TEST_F(SyscallFilterTest, OnlyTheAllowedExec) {
  static const char kTrue[] = "/bin/true";
  static char kOther[] = "/bin/true";
  SyscallFilter filter(false);
  filter.AllowExec(kTrue);
  EXPECT_EQ(RunFiltered(&filter,
                        []() {
                          char* args[] = {kOther, nullptr};
                          execv(kOther, args);
                          return errno == EPERM ? 0 : 1;
                        }),
            0);
  EXPECT_EQ(RunFiltered(&filter,
                        []() {
                          char* args[] = {const_cast<char*>(kTrue), nullptr};
                          execv(kTrue, args);
                          return 2;
                        }),
            0);
}

// NOLINTNEXTLINE
TEST_F(SyscallFilterTest, InetSocketsAreDenied) {
  SyscallFilter filter(false);
  EXPECT_EQ(RunFiltered(&filter,
                        []() {
                          int fd = socket(AF_INET, SOCK_STREAM, 0);
                          if (fd != -1 || errno != EACCES) return 1;
                          fd = socket(AF_INET6, SOCK_DGRAM, 0);
                          if (fd != -1 || errno != EACCES) return 2;
                          fd = socket(AF_UNIX, SOCK_STREAM, 0);
                          if (fd == -1) return 3;
                          close(fd);
                          return 0;
                        }),
            0);
}

// NOLINTNEXTLINE
TEST_F(SyscallFilterTest, NetworkAllowed) {
  SyscallFilter filter(true);
  EXPECT_EQ(RunFiltered(&filter,
                        []() {
                          int fd = socket(AF_INET, SOCK_STREAM, 0);
                          if (fd == -1) return errno == EACCES ? 1 : 0;
                          close(fd);
                          return 0;
                        }),
            0);
}

// NOLINTNEXTLINE
TEST_F(SyscallFilterTest, SignalsStayInside) {
  SyscallFilter filter(false);
  EXPECT_EQ(RunFiltered(&filter,
                        []() {
                          if (kill(getppid(), 0) != -1 || errno != EPERM)
                            return 1;
                          if (kill(getpid(), 0) != 0) return 2;
                          if (kill(0, 0) != 0) return 3;
                          return 0;
                        }),
            0);
}

// NOLINTNEXTLINE
TEST_F(SyscallFilterTest, ProgramShape) {
  SyscallFilter filter(false);
  SyscallFilter with_network(true);
  EXPECT_GT(filter.Program().size(), with_network.Program().size());
  // BPF programs are limited to 4096 instructions.
  EXPECT_LT(filter.Program().size(), 4096u);
}

}  // namespace
