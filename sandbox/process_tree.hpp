#ifndef SANDBOX_PROCESS_TREE_HPP
#define SANDBOX_PROCESS_TREE_HPP

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace sandbox {

struct ProcessInfo {
  int64_t pid = 0;
  int64_t ppid = 0;
  // Process group, 0 where the platform has none.
  int64_t pgid = 0;
  bool zombie = false;
};

// Discovery and termination of the processes that belong to a sandbox.
// Members of a sandbox are the child itself, its descendants, the members of
// its process group (the child calls setsid, so daemonized grandchildren
// that were reparented stay there unless they call setsid themselves) and
// every process whose environment contains the sandbox marker.
class ProcessTree {
 public:
  // All the processes currently visible. Empty where the platform gives no
  // way to enumerate them.
  static std::vector<ProcessInfo> Snapshot();

  // root and its live descendants in the given snapshot.
  static std::set<int64_t> Descendants(const std::vector<ProcessInfo>& procs,
                                       int64_t root);

  // True if the environment of pid contains the exact "NAME=value" entry.
  // False if the environment cannot be read.
  static bool HasMarker(int64_t pid, const std::string& marker);

  // Live members of the sandbox rooted at root, excluding the calling
  // process. marker may be empty.
  static std::set<int64_t> Members(int64_t root, const std::string& marker);

  // Freezes every member (so that nothing can fork while we look), then kills
  // them all. Rescans until no new member shows up. Returns the number of
  // processes that are still alive afterwards.
  static size_t Kill(int64_t root, const std::string& marker);
};

}  // namespace sandbox

#endif
