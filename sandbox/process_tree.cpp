#include "sandbox/process_tree.hpp"

#include <chrono>
#include <map>
#include <system_error>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#include <tlhelp32.h>
#else
#include <dirent.h>
#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {
// A process that keeps forking fresh members can not outrun this many rescans
// while everything found so far is stopped.
const constexpr int kMaxRounds = 16;
const constexpr auto kReapDeadline = std::chrono::seconds(1);

#ifndef _WIN32
bool ReadStat(int64_t pid, sandbox::ProcessInfo* info) {
  std::string content;
  try {
    content = util::File::ReadAll("/proc/" + std::to_string(pid) + "/stat");
  } catch (const std::system_error&) {
    // The process exited in the meantime.
    return false;
  }
  // The command name may contain spaces and parentheses.
  size_t end = content.rfind(')');
  if (end == std::string::npos) return false;
  char state = 0;
  long long ppid = 0;
  long long pgid = 0;
  if (sscanf(content.c_str() + end + 1, " %c %lld %lld", &state, &ppid,
             &pgid) != 3) {
    return false;
  }
  info->pid = pid;
  info->ppid = ppid;
  info->pgid = pgid;
  info->zombie = state == 'Z' || state == 'X';
  return true;
}

bool IsAlive(int64_t pid) {
  sandbox::ProcessInfo info;
  if (ReadStat(pid, &info)) return !info.zombie;
  if (util::File::Exists("/proc/self/stat")) return false;
  // No procfs: zombies can not be told apart from live processes.
  return kill(pid, 0) == 0 || errno == EPERM;
}
#else
bool IsAlive(int64_t pid) {
  HANDLE process = OpenProcess(SYNCHRONIZE, FALSE, static_cast<DWORD>(pid));
  if (process == nullptr) return false;
  bool alive = WaitForSingleObject(process, 0) == WAIT_TIMEOUT;
  CloseHandle(process);
  return alive;
}
#endif
}  // namespace

namespace sandbox {

std::vector<ProcessInfo> ProcessTree::Snapshot() {
  std::vector<ProcessInfo> procs;
#ifdef _WIN32
  HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
  if (snapshot == INVALID_HANDLE_VALUE) {
    LOG(WARNING) << "CreateToolhelp32Snapshot failed: " << GetLastError();
    return procs;
  }
  PROCESSENTRY32 entry;
  entry.dwSize = sizeof(entry);
  for (BOOL ok = Process32First(snapshot, &entry); ok;
       ok = Process32Next(snapshot, &entry)) {
    ProcessInfo info;
    info.pid = entry.th32ProcessID;
    info.ppid = entry.th32ParentProcessID;
    procs.push_back(info);
  }
  CloseHandle(snapshot);
#else
  DIR* dir = opendir("/proc");
  if (dir == nullptr) return procs;
  while (struct dirent* ent = readdir(dir)) {
    char* end = nullptr;
    long long pid = strtoll(ent->d_name, &end, 10);
    if (*end != 0 || pid <= 0) continue;
    ProcessInfo info;
    if (ReadStat(pid, &info)) procs.push_back(info);
  }
  closedir(dir);
#endif
  return procs;
}

std::set<int64_t> ProcessTree::Descendants(
    const std::vector<ProcessInfo>& procs, int64_t root) {
  std::multimap<int64_t, int64_t> children;
  std::set<int64_t> live;
  for (const ProcessInfo& info : procs) {
    if (info.zombie) continue;
    live.insert(info.pid);
    if (info.pid != info.ppid) children.emplace(info.ppid, info.pid);
  }
  std::set<int64_t> result;
  std::vector<int64_t> queue = {root};
  while (!queue.empty()) {
    int64_t pid = queue.back();
    queue.pop_back();
    if (live.count(pid) && !result.insert(pid).second) continue;
    auto range = children.equal_range(pid);
    for (auto it = range.first; it != range.second; ++it) {
      if (!result.count(it->second)) queue.push_back(it->second);
    }
  }
  return result;
}

bool ProcessTree::HasMarker(int64_t pid, const std::string& marker) {
#ifdef _WIN32
  return false;
#else
  if (marker.empty()) return false;
  std::string env;
  try {
    env = util::File::ReadAll("/proc/" + std::to_string(pid) + "/environ");
  } catch (const std::system_error&) {
    // Gone, or owned by someone else.
    return false;
  }
  for (absl::string_view entry : absl::StrSplit(env, '\0')) {
    if (entry == marker) return true;
  }
  return false;
#endif
}

std::set<int64_t> ProcessTree::Members(int64_t root,
                                       const std::string& marker) {
  std::vector<ProcessInfo> procs = Snapshot();
  std::set<int64_t> members = Descendants(procs, root);
  for (const ProcessInfo& info : procs) {
    if (info.zombie || members.count(info.pid)) continue;
    if ((root > 0 && info.pgid == root) || HasMarker(info.pid, marker)) {
      std::set<int64_t> subtree = Descendants(procs, info.pid);
      members.insert(subtree.begin(), subtree.end());
    }
  }
#ifdef _WIN32
  members.erase(GetCurrentProcessId());
#else
  members.erase(getpid());
#endif
  return members;
}

size_t ProcessTree::Kill(int64_t root, const std::string& marker) {
  std::set<int64_t> victims;
#ifdef _WIN32
  for (int round = 0; round < kMaxRounds; round++) {
    bool found_new = false;
    for (int64_t pid : Members(root, marker)) {
      found_new |= victims.insert(pid).second;
      HANDLE process =
          OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
      if (process == nullptr) continue;
      if (TerminateProcess(process, 1)) VLOG(1) << "Killed process " << pid;
      CloseHandle(process);
    }
    if (!found_new) break;
  }
#else
  for (int round = 0; round < kMaxRounds; round++) {
    bool found_new = false;
    for (int64_t pid : Members(root, marker)) {
      if (!victims.insert(pid).second) continue;
      found_new = true;
      kill(pid, SIGSTOP);
    }
    if (!found_new) break;
  }
  victims.insert(root);
  for (int64_t pid : victims) {
    if (kill(pid, SIGKILL) == 0) VLOG(1) << "Killed process " << pid;
  }
  if (killpg(root, SIGKILL) == -1 && errno != ESRCH && errno != EPERM) {
    PLOG(WARNING) << "killpg " << root;
  }
#endif
  // The root is reaped by its parent, so its zombie is not a survivor.
  victims.erase(root);
  auto deadline = std::chrono::steady_clock::now() + kReapDeadline;
  size_t survivors = 0;
  do {
    survivors = 0;
    for (int64_t pid : victims) survivors += IsAlive(pid);
    if (survivors == 0) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  } while (std::chrono::steady_clock::now() < deadline);
  return survivors;
}

}  // namespace sandbox
