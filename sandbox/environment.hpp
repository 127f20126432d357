#ifndef SANDBOX_ENVIRONMENT_HPP
#define SANDBOX_ENVIRONMENT_HPP

#include <string>
#include <vector>

#include "sandbox/workspace.hpp"

namespace sandbox {

// Builds the environment of the child process from scratch. Nothing is
// inherited from the caller except a short list of platform variables, and
// even those are dropped if their name looks like it carries a secret.
class EnvironmentScrubber {
 public:
  static const constexpr char* kSandboxRootVar = "EVALBOX_SANDBOX_ROOT";
  static const constexpr char* kAllowNetworkVar = "EVALBOX_ALLOW_NETWORK";

  // Uses the current process environment as the source of pass-through
  // variables.
  EnvMap Build(const SandboxSession& session) const;

  // Same as above, with an explicit parent environment.
  EnvMap Build(const SandboxSession& session, const EnvMap& parent) const;

  // The process environment is never modified, so there is nothing to undo.
  void Restore() {}

  // True if the variable name contains one of the sensitive patterns.
  static bool IsSensitive(const std::string& name);

  // Converts the map to the "NAME=value" form expected by execve.
  static std::vector<std::string> ToEnvp(const EnvMap& env);

  // Snapshot of the current process environment.
  static EnvMap CurrentEnvironment();
};

}  // namespace sandbox

#endif
