#include "sandbox/path_guard.hpp"

#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace sandbox {

PathGuard::PathGuard(std::string root,
                     std::vector<std::string> read_only_roots)
    : root_(Normalize(root, "/")) {
  for (const std::string& ro : read_only_roots) {
    read_only_roots_.push_back(Normalize(ro, "/"));
  }
}

std::string PathGuard::Normalize(const std::string& path,
                                 const std::string& cwd) {
  std::string full = path;
  if (full.empty() || full[0] != '/') full = cwd + "/" + full;
  std::vector<std::string> parts;
  for (absl::string_view part :
       absl::StrSplit(full, '/', absl::SkipEmpty())) {
    if (part == ".") continue;
    if (part == "..") {
      if (!parts.empty()) parts.pop_back();
      continue;
    }
    parts.emplace_back(part);
  }
  return "/" + absl::StrJoin(parts, "/");
}

bool PathGuard::IsUnder(const std::string& path, const std::string& prefix) {
  if (prefix == "/") return true;
  if (path.compare(0, prefix.size(), prefix) != 0) return false;
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

bool PathGuard::IsAllowed(const std::string& path, Access access,
                          const std::string& cwd) const {
  if (path.empty() || path.find('\0') != std::string::npos) return false;
  std::string normalized = Normalize(path, Normalize(cwd, "/"));
  if (IsUnder(normalized, root_)) return true;
  if (access == Access::kWrite) return false;
  for (const std::string& ro : read_only_roots_) {
    if (IsUnder(normalized, ro)) return true;
  }
  return false;
}

}  // namespace sandbox
