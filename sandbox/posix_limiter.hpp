#ifndef SANDBOX_POSIX_LIMITER_HPP
#define SANDBOX_POSIX_LIMITER_HPP
#include "sandbox/resource_limiter.hpp"

namespace sandbox {

// Caps CPU time, address space, file size and open descriptors of the child
// with setrlimit. The CPU cap is soft at timeout+1 seconds (SIGXCPU) and hard
// one second later (SIGKILL). Core dumps are disabled.
class PosixLimiter : public ResourceLimiter {
 public:
  static ResourceLimiter* Create() { return new PosixLimiter(); }
  static int Score() { return 2; }

  const char* Name() const override { return "posix-rlimit"; }
  Guarantee GetGuarantee() const override { return Guarantee::kFull; }
  bool ApplyToChild(char* error_msg, size_t buflen) override;

 protected:
  PosixLimiter() = default;
};

}  // namespace sandbox
#endif
