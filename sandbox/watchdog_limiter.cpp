#include "sandbox/watchdog_limiter.hpp"

namespace sandbox {
namespace {
ResourceLimiter::Register<WatchdogLimiter> r;
}  // namespace
}  // namespace sandbox
