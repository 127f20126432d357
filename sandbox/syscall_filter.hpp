#ifndef SANDBOX_SYSCALL_FILTER_HPP
#define SANDBOX_SYSCALL_FILTER_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace sandbox {

// seccomp-BPF program installed in the child between fork and exec. Once
// installed it survives every exec and can not be removed. Denied calls fail
// with an errno instead of killing the process, so that the interpreter can
// report them:
//  - fork, vfork and clone without CLONE_THREAD: EPERM; clone3: ENOSYS, so
//    that the C library falls back to clone for threads;
//  - execve of anything but the pointer given to AllowExec, execveat: EPERM;
//  - ptrace, cross-process memory access, io_uring and kernel surface
//    (bpf, mount, unshare, module loading, keyrings...): EPERM;
//  - signals to anything but the child itself or its process group: EPERM;
//  - AF_INET, AF_INET6 and AF_PACKET sockets, unless the network is
//    allowed: EACCES.
class SyscallFilter {
 public:
  // Layout-compatible with struct sock_filter.
  struct Instruction {
    uint16_t code;
    uint8_t jt;
    uint8_t jf;
    uint32_t k;
  };

  explicit SyscallFilter(bool allow_network);

  // True if the filter can be installed on this system.
  static bool Supported();

  // Sets the filename pointer the single allowed execve must use. The child
  // is a copy of the parent, so a pointer taken before fork is valid there.
  void AllowExec(const char* filename);

  // Installs the filter on the calling process. Executed in the child: this
  // function does not allocate, and error_msg must not be longer than buflen
  // characters.
  bool Install(char* error_msg, size_t buflen);

  const std::vector<Instruction>& Program() const { return program_; }

 private:
  void Emit(uint16_t code, uint32_t k, uint8_t jt = 0, uint8_t jf = 0);
  void DenySyscall(int64_t nr, int err);

  std::vector<Instruction> program_;
  size_t exec_low_slot_ = 0;
  size_t exec_high_slot_ = 0;
  // Slots compared against the pid of the child, and whether the negated pid
  // goes there.
  std::vector<std::pair<size_t, bool>> pid_slots_;
};

}  // namespace sandbox

#endif
