#include "sandbox/workspace.hpp"

#include <ctype.h>

#include <algorithm>

#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "sandbox/environment.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/path_guard.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {
bool IsIllegalChar(char c) {
  return !isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' &&
         c != '_';
}

const constexpr size_t kMaxRunIdLength = 64;

std::string SanitizeRunId(const std::string& run_id) {
  std::string clean = run_id.substr(0, kMaxRunIdLength);
  std::replace_if(clean.begin(), clean.end(), IsIllegalChar, '_');
  if (clean.empty()) clean = "run";
  return clean;
}

}  // namespace

namespace sandbox {

SessionOptions SessionOptions::FromFlags() {
  SessionOptions options;
  options.memory_limit_mb = FLAGS_mem;
  options.timeout_s = FLAGS_timeout;
  options.allow_network = FLAGS_allow_network;
  options.max_file_size_mb = FLAGS_max_file_size_mb;
  options.max_open_files = FLAGS_max_open_files;
  options.max_processes = FLAGS_max_processes;
  options.syscall_filter = FLAGS_syscall_filter;
  options.keep = FLAGS_keep_sandboxes;
  return options;
}

void SessionOptions::Validate() const {
  const int32_t* begin = std::begin(kAllowedMemoryLimitsMb);
  const int32_t* end = std::end(kAllowedMemoryLimitsMb);
  if (std::find(begin, end, memory_limit_mb) == end) {
    throw ConfigurationError(
        "Invalid memory limit " + std::to_string(memory_limit_mb) +
        "MB, allowed values are " + absl::StrJoin(begin, end, ", "));
  }
  if (timeout_s < 1 || timeout_s > kMaxTimeoutS) {
    throw ConfigurationError("Invalid timeout " + std::to_string(timeout_s) +
                             "s, must be between 1 and " +
                             std::to_string(kMaxTimeoutS));
  }
  if (max_file_size_mb < 1)
    throw ConfigurationError("max_file_size_mb must be positive");
  if (max_open_files < 16)
    throw ConfigurationError("max_open_files must be at least 16");
  if (max_processes < 1)
    throw ConfigurationError("max_processes must be positive");
}

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kCreated:
      return "CREATED";
    case SessionState::kPopulated:
      return "POPULATED";
    case SessionState::kReady:
      return "READY";
    case SessionState::kRunning:
      return "RUNNING";
    case SessionState::kFinished:
      return "FINISHED";
    case SessionState::kTornDown:
      return "TORN_DOWN";
  }
  return "UNKNOWN";
}

SandboxSession::SandboxSession(std::string run_id, std::string dir,
                               SessionOptions options)
    : run_id_(std::move(run_id)),
      dir_(std::move(dir)),
      root_(util::File::JoinPath(dir_, "box")),
      options_(options) {}

std::string SandboxSession::HomeDir() const {
  return util::File::JoinPath(root_, "home");
}
std::string SandboxSession::TempDir() const {
  return util::File::JoinPath(root_, "temp");
}
std::string SandboxSession::GuardDir() const {
  return util::File::JoinPath(dir_, "guard");
}
std::string SandboxSession::StdoutPath() const {
  return util::File::JoinPath(dir_, "stdout");
}
std::string SandboxSession::StderrPath() const {
  return util::File::JoinPath(dir_, "stderr");
}

SandboxWorkspace::SandboxWorkspace(std::string base_dir,
                                   std::vector<Input> inputs)
    : base_dir_(std::move(base_dir)), inputs_(std::move(inputs)) {}

std::unique_ptr<SandboxSession> SandboxWorkspace::Create(
    const std::string& run_id, const SessionOptions& options) const {
  options.Validate();
  std::string clean_id = SanitizeRunId(run_id);
  std::unique_ptr<util::TempDir> tmp;
  try {
    tmp.reset(new util::TempDir(base_dir_, "evalbox_" + clean_id + "_"));
  } catch (const std::system_error& exc) {
    throw WorkspaceError(exc, "Cannot create sandbox in " + base_dir_);
  }
  // From here on, tmp removes the directory if anything below throws.
  std::unique_ptr<SandboxSession> session(
      new SandboxSession(clean_id, tmp->Path(), options));
  PathGuard guard(session->Root());
  try {
    util::File::MakeDirs(session->HomeDir());
    util::File::MakeDirs(session->TempDir());
    util::File::MakeDirs(session->GuardDir());
    for (const Input& input : inputs_) {
      std::string dest = PathGuard::Normalize(input.destination,
                                              session->Root());
      if (input.destination.empty() ||
          !guard.IsAllowed(dest, PathGuard::Access::kWrite) ||
          dest == guard.Root()) {
        throw WorkspaceError(EINVAL,
                             "Invalid input destination " + input.destination);
      }
      if (!util::File::Exists(input.source)) {
        throw WorkspaceError(ENOENT, "Missing input " + input.source);
      }
      std::vector<std::string> files;
      if (util::File::IsDirectory(input.source)) {
        files = util::File::CopyTree(input.source, dest);
      } else {
        util::File::DeepCopy(input.source, dest, /*overwrite=*/true);
        files.push_back(dest);
      }
      for (const std::string& file : files) util::File::MakeImmutable(file);
      VLOG(2) << "Copied " << files.size() << " file(s) from " << input.source
              << " into " << dest;
    }
  } catch (const WorkspaceError&) {
    throw;
  } catch (const std::system_error& exc) {
    throw WorkspaceError(exc, "Cannot populate sandbox " + tmp->Path());
  }
  session->SetState(SessionState::kPopulated);
  session->SetEnvironment(EnvironmentScrubber().Build(*session));
  session->SetState(SessionState::kReady);
  tmp->Keep();
  VLOG(1) << "Created sandbox " << session->Dir() << " for run "
          << session->RunId();
  return session;
}

void SandboxWorkspace::Teardown(SandboxSession* session) {
  if (session == nullptr) return;
  if (session->State() == SessionState::kTornDown) return;
  session->SetState(SessionState::kTornDown);
  if (session->Options().keep) {
    LOG(INFO) << "Keeping sandbox " << session->Dir();
    return;
  }
  if (!util::File::Exists(session->Dir())) return;
  try {
    util::File::RemoveTree(session->Dir());
    VLOG(1) << "Removed sandbox " << session->Dir();
  } catch (const std::system_error& exc) {
    if (exc.code().value() == ENOENT) return;
    LOG(WARNING) << "Cannot remove sandbox " << session->Dir() << ": "
                 << exc.what();
  }
}

}  // namespace sandbox
