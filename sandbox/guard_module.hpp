#ifndef SANDBOX_GUARD_MODULE_HPP
#define SANDBOX_GUARD_MODULE_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "sandbox/workspace.hpp"

namespace sandbox {

// Capabilities the guard module can block.
enum class Capability {
  kDynamicCode,
  kProcessSpawn,
  kDeserialization,
  kNativeMemory,
  kFileAccess,
  kNetwork,
  kGuardTamper
};

// Stable, human-readable name of a capability, used in the guard labels.
const char* CapabilityName(Capability capability);

// All capabilities, in a fixed order.
const std::vector<Capability>& AllCapabilities();

// Label carried by every error raised by the guard for the capability, e.g.
// "EVALBOX-GUARD[network]".
std::string GuardLabel(Capability capability);

static const constexpr char* kGuardLabelPrefix = "EVALBOX-GUARD";

// Exit code and stderr marker of a child that ran out of memory.
static const constexpr int kMemoryLimitExitCode = 86;
static const constexpr char* kMemoryLimitMarker = "EVALBOX-LIMIT[memory]";

// Exit code of a child whose guard could not be installed.
static const constexpr int kGuardSetupExitCode = 87;

// The closed set of capabilities blocked in the child.
class GuardManifest {
 public:
  // Blocks every capability.
  static GuardManifest Default();

  // Stops blocking a capability. Only meant for fault injection.
  GuardManifest& Remove(Capability capability);

  bool Blocks(Capability capability) const {
    return blocked_.count(capability) != 0;
  }
  const std::set<Capability>& Blocked() const { return blocked_; }

  // Maps every module whose import is denied to the capability it belongs to.
  std::map<std::string, Capability> DeniedModules() const;

  // Comma-separated list of the blocked capabilities.
  std::string Describe() const;

 private:
  GuardManifest() = default;
  std::set<Capability> blocked_;
};

// Generates the module that the interpreter imports automatically at startup
// (sitecustomize), before the submission is reachable.
class GuardModule {
 public:
  static const constexpr char* kFileName = "sitecustomize.py";

  explicit GuardModule(GuardManifest manifest);

  // Source of the guard module.
  const std::string& Source() const { return source_; }

  // Writes the module into the guard directory of the session and makes it
  // read-only. Throws WorkspaceError.
  void Install(const SandboxSession& session) const;

  const GuardManifest& Manifest() const { return manifest_; }

 private:
  std::string Generate() const;

  GuardManifest manifest_;
  std::string source_;
};

}  // namespace sandbox

#endif
