#include "util/misc.hpp"

#include <string.h>

namespace util {

char* StrError(int err, char* buf, size_t buf_size) {
#if defined(_WIN32)
  strerror_s(buf, buf_size, err);
  return buf;
#elif defined(_GNU_SOURCE)
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

void FormatErrno(const char* prefix, int err, char* buf, size_t buf_size) {
  if (buf_size == 0) return;
  char msg[kStrErrorBufSize] = {};
  buf[0] = 0;
  strncat(buf, prefix, buf_size - 1);
  strncat(buf, ": ", buf_size - 1 - strlen(buf));
  strncat(buf, StrError(err, msg, kStrErrorBufSize),
          buf_size - 1 - strlen(buf));
}

std::string ErrnoMessage(const std::string& prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return prefix + ": " + StrError(err, buf, kStrErrorBufSize);
}

}  // namespace util
