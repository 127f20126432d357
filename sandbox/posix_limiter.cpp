#include "sandbox/posix_limiter.hpp"

#include <errno.h>
#include <sys/resource.h>

#include "util/misc.hpp"

namespace {
// Lowers the limit to the requested values. Values above the current hard
// limit are clamped, since raising it needs privileges. The resource type is
// an enum on glibc and an int elsewhere.
template <typename Resource>
int SetLimit(Resource resource, rlim_t soft, rlim_t hard) {
  struct rlimit rlim;
  if (getrlimit(resource, &rlim) == -1) return -1;
  if (rlim.rlim_max != RLIM_INFINITY) {
    if (hard > rlim.rlim_max) hard = rlim.rlim_max;
    if (soft > rlim.rlim_max) soft = rlim.rlim_max;
  }
  rlim.rlim_cur = soft;
  rlim.rlim_max = hard;
  return setrlimit(resource, &rlim);
}
}  // namespace

namespace sandbox {

bool PosixLimiter::ApplyToChild(char* error_msg, size_t buflen) {
#define SET_RLIM(res, soft, hard)                                    \
  if (SetLimit(RLIMIT_##res, soft, hard) == -1) {                    \
    util::FormatErrno("setrlimit " #res, errno, error_msg, buflen); \
    return false;                                                    \
  }

  SET_RLIM(CPU, cpu_limit_s_, cpu_limit_s_ + 1);
  SET_RLIM(AS, memory_limit_bytes_, memory_limit_bytes_);
  SET_RLIM(FSIZE, max_file_size_bytes_, max_file_size_bytes_);
  SET_RLIM(NOFILE, max_open_files_, max_open_files_);
  SET_RLIM(CORE, 0, 0);
#undef SET_RLIM
  return true;
}

namespace {
ResourceLimiter::Register<PosixLimiter> r;
}  // namespace

}  // namespace sandbox
