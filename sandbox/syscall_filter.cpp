#include "sandbox/syscall_filter.hpp"

#if defined(__linux__) && (defined(__x86_64__) || defined(__aarch64__))
#define EVALBOX_HAVE_SECCOMP 1
#endif

#include <errno.h>
#include <string.h>

#ifdef EVALBOX_HAVE_SECCOMP
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <stddef.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <unistd.h>
#endif

#include "util/misc.hpp"

#ifdef EVALBOX_HAVE_SECCOMP
namespace {

#if defined(__x86_64__)
const constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#else
const constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#endif

const constexpr uint16_t kLoad = BPF_LD | BPF_W | BPF_ABS;
const constexpr uint16_t kJeq = BPF_JMP | BPF_JEQ | BPF_K;
const constexpr uint16_t kRet = BPF_RET | BPF_K;
const constexpr uint32_t kAllow = SECCOMP_RET_ALLOW;

constexpr uint32_t Errno(int err) {
  return SECCOMP_RET_ERRNO | (err & SECCOMP_RET_DATA);
}

// Both supported architectures are little endian.
constexpr uint32_t ArgLow(int i) {
  return offsetof(struct seccomp_data, args) + 8 * i;
}
constexpr uint32_t ArgHigh(int i) { return ArgLow(i) + 4; }

const int64_t kDeniedSyscalls[] = {
#ifdef __NR_fork
    __NR_fork,
#endif
#ifdef __NR_vfork
    __NR_vfork,
#endif
    __NR_execveat,
    __NR_ptrace,
    __NR_process_vm_readv,
    __NR_process_vm_writev,
    __NR_tkill,
    __NR_rt_sigqueueinfo,
    __NR_rt_tgsigqueueinfo,
#ifdef __NR_pidfd_send_signal
    __NR_pidfd_send_signal,
#endif
#ifdef __NR_pidfd_getfd
    __NR_pidfd_getfd,
#endif
#ifdef __NR_io_uring_setup
    __NR_io_uring_setup,
    __NR_io_uring_enter,
    __NR_io_uring_register,
#endif
    __NR_bpf,
    __NR_perf_event_open,
#ifdef __NR_userfaultfd
    __NR_userfaultfd,
#endif
    __NR_keyctl,
    __NR_add_key,
    __NR_request_key,
    __NR_unshare,
    __NR_setns,
    __NR_mount,
    __NR_umount2,
    __NR_pivot_root,
    __NR_chroot,
    __NR_kexec_load,
    __NR_init_module,
    __NR_finit_module,
    __NR_delete_module,
};

static_assert(sizeof(sandbox::SyscallFilter::Instruction) ==
                  sizeof(struct sock_filter),
              "Instruction must match struct sock_filter");

}  // namespace
#endif

namespace sandbox {

#ifdef EVALBOX_HAVE_SECCOMP
void SyscallFilter::Emit(uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) {
  program_.push_back(Instruction{code, jt, jf, k});
}

void SyscallFilter::DenySyscall(int64_t nr, int err) {
  Emit(kJeq, nr, 0, 1);
  Emit(kRet, Errno(err));
}
#endif

SyscallFilter::SyscallFilter(bool allow_network) {
#ifdef EVALBOX_HAVE_SECCOMP
  Emit(kLoad, offsetof(struct seccomp_data, arch));
  Emit(kJeq, kAuditArch, 1, 0);
  Emit(kRet, Errno(ENOSYS));
  Emit(kLoad, offsetof(struct seccomp_data, nr));
#ifdef __x86_64__
  // x32 ABI.
  Emit(BPF_JMP | BPF_JGE | BPF_K, 0x40000000, 0, 1);
  Emit(kRet, Errno(ENOSYS));
#endif

  for (int64_t nr : kDeniedSyscalls) DenySyscall(nr, EPERM);
#ifdef __NR_clone3
  DenySyscall(__NR_clone3, ENOSYS);
#endif

  // Threads only.
  Emit(kJeq, __NR_clone, 0, 4);
  Emit(kLoad, ArgLow(0));
  Emit(BPF_JMP | BPF_JSET | BPF_K, CLONE_THREAD, 0, 1);
  Emit(kRet, kAllow);
  Emit(kRet, Errno(EPERM));

  Emit(kJeq, __NR_execve, 0, 6);
  Emit(kLoad, ArgLow(0));
  exec_low_slot_ = program_.size();
  Emit(kJeq, 0, 0, 2);
  Emit(kLoad, ArgHigh(0));
  exec_high_slot_ = program_.size();
  Emit(kJeq, 0, 1, 0);
  Emit(kRet, Errno(EPERM));
  Emit(kRet, kAllow);

  // kill(0), kill(self) and kill(-self): the child leads its own group.
  Emit(kJeq, __NR_kill, 0, 6);
  Emit(kLoad, ArgLow(0));
  Emit(kJeq, 0, 3, 0);
  pid_slots_.emplace_back(program_.size(), false);
  Emit(kJeq, 0, 2, 0);
  pid_slots_.emplace_back(program_.size(), true);
  Emit(kJeq, 0, 1, 0);
  Emit(kRet, Errno(EPERM));
  Emit(kRet, kAllow);

  Emit(kJeq, __NR_tgkill, 0, 4);
  Emit(kLoad, ArgLow(0));
  pid_slots_.emplace_back(program_.size(), false);
  Emit(kJeq, 0, 1, 0);
  Emit(kRet, Errno(EPERM));
  Emit(kRet, kAllow);

  if (!allow_network) {
    Emit(kJeq, __NR_socket, 0, 6);
    Emit(kLoad, ArgLow(0));
    Emit(kJeq, AF_INET, 3, 0);
    Emit(kJeq, AF_INET6, 2, 0);
    Emit(kJeq, AF_PACKET, 1, 0);
    Emit(kRet, kAllow);
    Emit(kRet, Errno(EACCES));
  }

  Emit(kRet, kAllow);
#endif
}

bool SyscallFilter::Supported() {
#ifdef EVALBOX_HAVE_SECCOMP
  return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) != -1;
#else
  return false;
#endif
}

void SyscallFilter::AllowExec(const char* filename) {
#ifdef EVALBOX_HAVE_SECCOMP
  uint64_t address = reinterpret_cast<uintptr_t>(filename);
  program_[exec_low_slot_].k = static_cast<uint32_t>(address);
  program_[exec_high_slot_].k = static_cast<uint32_t>(address >> 32);
#endif
}

bool SyscallFilter::Install(char* error_msg, size_t buflen) {
#ifdef EVALBOX_HAVE_SECCOMP
  uint32_t pid = static_cast<uint32_t>(getpid());
  for (const std::pair<size_t, bool>& slot : pid_slots_) {
    program_[slot.first].k = slot.second ? -pid : pid;
  }
  struct sock_fprog prog;
  prog.len = static_cast<unsigned short>(program_.size());
  prog.filter = reinterpret_cast<struct sock_filter*>(program_.data());
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    util::FormatErrno("prctl NO_NEW_PRIVS", errno, error_msg, buflen);
    return false;
  }
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == -1) {
    util::FormatErrno("seccomp", errno, error_msg, buflen);
    return false;
  }
  return true;
#else
  util::FormatErrno("seccomp", ENOSYS, error_msg, buflen);
  return false;
#endif
}

}  // namespace sandbox
