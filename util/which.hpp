#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. Commands containing a path separator
// are returned unchanged if they exist. Returns an empty string if the
// command cannot be found.
std::string which(const std::string& cmd, bool use_cache = true);

// Finds the real binary behind an interpreter command. Launchers such as
// version-manager shims are scripts that exec the interpreter, which a
// confined child is not allowed to do; the interpreter is asked for its own
// path instead. Returns an empty string if the command cannot be found or
// does not run.
std::string ResolveInterpreter(const std::string& cmd);

}  // namespace util

#endif
