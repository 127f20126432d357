#ifndef SANDBOX_PATH_GUARD_HPP
#define SANDBOX_PATH_GUARD_HPP

#include <string>
#include <vector>

namespace sandbox {

// Decides whether a path may be accessed from inside a sandbox. The decision
// is purely lexical: paths are normalized against a working directory, but
// symbolic links are not followed. Callers that can resolve links (like the
// guard module) must do so before asking.
class PathGuard {
 public:
  enum class Access { kRead, kWrite };

  // root is the read-write sandbox root. Both root and read_only_roots must
  // be absolute.
  explicit PathGuard(std::string root,
                     std::vector<std::string> read_only_roots = {});

  // Returns true if path, interpreted relative to cwd when it is not
  // absolute, lies under the sandbox root (any access) or under one of the
  // read-only roots (kRead only).
  bool IsAllowed(const std::string& path, Access access,
                 const std::string& cwd) const;

  // Same as above, with relative paths interpreted against the sandbox root.
  bool IsAllowed(const std::string& path, Access access) const {
    return IsAllowed(path, access, root_);
  }

  const std::string& Root() const { return root_; }
  const std::vector<std::string>& ReadOnlyRoots() const {
    return read_only_roots_;
  }

  // Collapses ".", ".." and repeated separators. ".." never climbs above
  // "/". Relative paths are first joined to cwd.
  static std::string Normalize(const std::string& path,
                               const std::string& cwd);

  // Returns true if path equals prefix or lies below it. Both must be
  // normalized.
  static bool IsUnder(const std::string& path, const std::string& prefix);

 private:
  std::string root_;
  std::vector<std::string> read_only_roots_;
};

}  // namespace sandbox

#endif
