#ifndef SANDBOX_WORKSPACE_HPP
#define SANDBOX_WORKSPACE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

using EnvMap = std::map<std::string, std::string>;

// Limits and switches of a single run.
struct SessionOptions {
  int32_t memory_limit_mb = 512;
  int32_t timeout_s = 30;
  bool allow_network = false;
  int32_t max_file_size_mb = 16;
  int32_t max_open_files = 64;
  int32_t max_processes = 1;
  bool syscall_filter = true;
  // Skip the removal of the sandbox directory on teardown.
  bool keep = false;

  // Reads the options from the command line flags.
  static SessionOptions FromFlags();

  // Throws ConfigurationError if any value is out of range.
  void Validate() const;
};

static const constexpr int32_t kAllowedMemoryLimitsMb[] = {256, 384, 512, 768,
                                                          1024};
static const constexpr int32_t kMaxTimeoutS = 600;

enum class SessionState {
  kCreated,
  kPopulated,
  kReady,
  kRunning,
  kFinished,
  kTornDown
};

const char* SessionStateName(SessionState state);

// The isolated execution context of one run. Layout on disk:
//   <dir>/box/        sandbox root, current directory of the child
//   <dir>/box/home/   HOME
//   <dir>/box/temp/   TMPDIR
//   <dir>/guard/      auto-loaded guard module, read-only to the child
//   <dir>/stdout, <dir>/stderr
class SandboxSession {
 public:
  SandboxSession(std::string run_id, std::string dir, SessionOptions options);

  const std::string& RunId() const { return run_id_; }
  const std::string& Dir() const { return dir_; }
  const std::string& Root() const { return root_; }
  std::string HomeDir() const;
  std::string TempDir() const;
  std::string GuardDir() const;
  std::string StdoutPath() const;
  std::string StderrPath() const;

  const SessionOptions& Options() const { return options_; }
  bool AllowNetwork() const { return options_.allow_network; }
  int32_t MemoryLimitMb() const { return options_.memory_limit_mb; }
  int32_t TimeoutS() const { return options_.timeout_s; }

  const EnvMap& Environment() const { return env_; }
  void SetEnvironment(EnvMap env) { env_ = std::move(env); }

  SessionState State() const { return state_; }
  void SetState(SessionState state) { state_ = state; }

  SandboxSession(const SandboxSession&) = delete;
  SandboxSession& operator=(const SandboxSession&) = delete;

 private:
  std::string run_id_;
  std::string dir_;
  std::string root_;
  SessionOptions options_;
  EnvMap env_;
  SessionState state_ = SessionState::kCreated;
};

// Creates and destroys sandbox sessions under a base directory.
class SandboxWorkspace {
 public:
  // A file or directory to copy into every session. destination is relative
  // to the sandbox root.
  struct Input {
    std::string source;
    std::string destination;
  };

  explicit SandboxWorkspace(std::string base_dir,
                            std::vector<Input> inputs = {});

  // Allocates a fresh directory, creates home and temp, copies the inputs
  // (read-only) and computes the child environment. Throws WorkspaceError;
  // nothing is left on disk in that case.
  std::unique_ptr<SandboxSession> Create(const std::string& run_id,
                                         const SessionOptions& options) const;

  // Removes everything belonging to the session. Can be called any number
  // of times; errors are logged and never thrown.
  static void Teardown(SandboxSession* session);

  const std::string& BaseDir() const { return base_dir_; }

 private:
  std::string base_dir_;
  std::vector<Input> inputs_;
};

// Owns a session for the duration of a scope and tears it down on every
// exit path.
class ScopedSession {
 public:
  ScopedSession(const SandboxWorkspace& workspace, const std::string& run_id,
                const SessionOptions& options)
      : session_(workspace.Create(run_id, options)) {}
  ~ScopedSession() { SandboxWorkspace::Teardown(session_.get()); }

  SandboxSession& operator*() const { return *session_; }
  SandboxSession* operator->() const { return session_.get(); }
  SandboxSession* get() const { return session_.get(); }

  ScopedSession(const ScopedSession&) = delete;
  ScopedSession& operator=(const ScopedSession&) = delete;

 private:
  std::unique_ptr<SandboxSession> session_;
};

}  // namespace sandbox

#endif
