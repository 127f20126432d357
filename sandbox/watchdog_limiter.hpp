#ifndef SANDBOX_WATCHDOG_LIMITER_HPP
#define SANDBOX_WATCHDOG_LIMITER_HPP
#include "sandbox/resource_limiter.hpp"

namespace sandbox {

// Fallback used when no kernel mechanism is available. Nothing is applied to
// the child: the executor's wall-clock watchdog and memory polling are the
// only enforcement, so the guarantee is reduced.
class WatchdogLimiter : public ResourceLimiter {
 public:
  static ResourceLimiter* Create() { return new WatchdogLimiter(); }
  static int Score() { return 1; }

  const char* Name() const override { return "watchdog"; }
  Guarantee GetGuarantee() const override { return Guarantee::kReduced; }

 protected:
  WatchdogLimiter() = default;
};

}  // namespace sandbox
#endif
