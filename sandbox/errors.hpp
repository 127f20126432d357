#ifndef SANDBOX_ERRORS_HPP
#define SANDBOX_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace sandbox {

// Invalid limit value, or a platform feature that cannot be provided. Raised
// before any sandbox is created.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& msg)
      : std::invalid_argument(msg) {}
};

// Creation or population of a sandbox directory failed. Fatal for the run it
// belongs to.
class WorkspaceError : public std::system_error {
 public:
  WorkspaceError(int err, const std::string& msg)
      : std::system_error(err, std::system_category(), msg) {}
  WorkspaceError(const std::system_error& cause, const std::string& msg)
      : std::system_error(cause.code(), msg + ": " + cause.what()) {}
};

}  // namespace sandbox

#endif
