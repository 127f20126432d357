#include "util/which.hpp"

#include <errno.h>

#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <sys/stat.h>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

#ifdef _WIN32
#define access _access
#define X_OK 0
#include <io.h>
#else
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

namespace {
std::mutex cmd_cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;

bool is_executable(const std::string& path) {
  struct stat buffer {};
  if (stat(path.c_str(), &buffer) != 0) return false;
  if (buffer.st_mode & S_IFDIR) return false;
  return access(path.c_str(), X_OK) == 0;
}

#ifdef _WIN32
const constexpr char* kPathListSeparator = ";";
#else
const constexpr char* kPathListSeparator = ":";

// Runs args with the current environment and returns its standard output,
// or an empty string if it did not exit cleanly.
std::string RunForOutput(const std::vector<std::string>& args) {
  int pipe_fds[2];
  if (pipe(pipe_fds) == -1) return "";
  posix_spawn_file_actions_t actions;
  if (posix_spawn_file_actions_init(&actions) != 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return "";
  }
  posix_spawn_file_actions_addclose(&actions, pipe_fds[0]);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_addclose(&actions, pipe_fds[1]);

  std::vector<char*> argv;
  for (const std::string& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t child_pid = 0;
  int ret = posix_spawn(&child_pid, argv[0], &actions, nullptr, argv.data(),
                        environ);
  posix_spawn_file_actions_destroy(&actions);
  close(pipe_fds[1]);
  if (ret != 0) {
    close(pipe_fds[0]);
    return "";
  }
  std::string output;
  char buf[4096];
  ssize_t amount;
  while ((amount = read(pipe_fds[0], buf, sizeof(buf))) != 0) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    output.append(buf, amount);
  }
  close(pipe_fds[0]);
  int status = 0;
  while (waitpid(child_pid, &status, 0) == -1 && errno == EINTR) {
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) return "";
  return output;
}
#endif
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find_first_of("/\\") != std::string::npos) {
    return is_executable(cmd) ? cmd : "";
  }
  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  std::vector<std::string> dirs;
  if (path != nullptr) dirs = absl::StrSplit(path, kPathListSeparator);

  std::string found;
  for (const std::string& dir : dirs) {
    if (dir.empty()) continue;
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) {
      found = fullpath;
      break;
    }
  }
  if (!found.empty()) cmd_cache[cmd] = found;
  return found;
}

std::string ResolveInterpreter(const std::string& cmd) {
  std::string path = which(cmd);
  if (path.empty()) return "";
#ifdef _WIN32
  return path;
#else
  std::string real = RunForOutput(
      {path, "-c", "import sys; sys.stdout.write(sys.executable)"});
  if (real.empty() || !is_executable(real)) return "";
  return real;
#endif
}

}  // namespace util
