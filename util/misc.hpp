#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <stddef.h>

#include <string>

namespace util {

static const constexpr size_t kStrErrorBufSize = 2048;

// Thread-safe strerror that returns the message for both the GNU and the XSI
// flavour of strerror_r. Does not allocate, so it can be used between fork
// and exec.
char* StrError(int err, char* buf, size_t buf_size);

// Writes "<prefix>: <message of err>" into buf, truncated to buf_size - 1
// characters. Does not allocate.
void FormatErrno(const char* prefix, int err, char* buf, size_t buf_size);

// Returns "<prefix>: <message of err>".
std::string ErrnoMessage(const std::string& prefix, int err);

}  // namespace util
#endif
