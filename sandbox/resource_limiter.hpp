#ifndef SANDBOX_RESOURCE_LIMITER_HPP
#define SANDBOX_RESOURCE_LIMITER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/workspace.hpp"

namespace sandbox {

enum class Guarantee {
  // Kernel-enforced caps on CPU time, memory, file size and open files.
  kFull,
  // Wall-clock watchdog and tree-kill only. Memory is polled, not capped.
  kReduced
};

const char* GuaranteeName(Guarantee guarantee);

// The child process as seen by the parent.
struct ChildProcess {
  int64_t pid = 0;
  // Process handle, only meaningful on Windows.
  void* handle = nullptr;
};

// Resource limiter interface. Implementations need to register themselves by
// creating a global object of type ResourceLimiter::Register<LimiterImpl> and
// should define the Create and Score static functions. Create should return a
// pointer to a newly allocated instance of the given implementation, while
// Score should return a value that defines how "good" that limiter is:
// negative if the limiter cannot be used on this system, positive otherwise
// (a bigger value means stronger enforcement).
// Registering a limiter is not thread-safe and should be done before any
// threads are created.
//
// A limiter instance is used for a single run: Configure, then ApplyToChild
// (in the child, POSIX) or ApplyToProcess (in the parent, Windows), then
// KillTree and ViolationReported as needed.
class ResourceLimiter {
 public:
  using create_t = std::function<ResourceLimiter*()>;
  using score_t = std::function<int()>;

  // Returns a new instance of the best limiter available, or nullptr.
  static std::unique_ptr<ResourceLimiter> Create();

  // Returns a new instance of the limiter with the given name, or nullptr if
  // no such limiter is usable here.
  static std::unique_ptr<ResourceLimiter> Create(const std::string& name);

  // Names of the usable limiters, best first.
  static std::vector<std::string> Available();

  virtual const char* Name() const = 0;
  virtual Guarantee GetGuarantee() const = 0;

  // Reads the limits of the session for a run of at most timeout_s seconds.
  // Called in the parent before the child is created. Returns false and sets
  // error_msg if the limits cannot be enforced.
  virtual bool Configure(const SandboxSession& session, int32_t timeout_s,
                         std::string* error_msg);

  int64_t CpuLimitS() const { return cpu_limit_s_; }

  // Applies the limits to the calling process. Executed in the child between
  // fork and exec: this function must not use dynamic memory allocation and
  // error_msg must not be longer than buflen characters.
  virtual bool ApplyToChild(char* error_msg, size_t buflen) { return true; }

  // Applies the limits to a child that was just created. Executed in the
  // parent before the child runs any code.
  virtual bool ApplyToProcess(const ChildProcess& child,
                              std::string* error_msg) {
    return true;
  }

  // True if the limiter observed one of its caps being reached.
  virtual bool ViolationReported() { return false; }

  // Terminates the child and all its descendants, including the processes
  // whose environment carries marker ("NAME=value").
  virtual void KillTree(const ChildProcess& child, const std::string& marker);

  int64_t MemoryLimitKb() const { return memory_limit_bytes_ / 1024; }

  virtual ~ResourceLimiter() = default;
  ResourceLimiter() = default;
  ResourceLimiter(const ResourceLimiter&) = delete;
  ResourceLimiter(ResourceLimiter&&) = delete;
  ResourceLimiter& operator=(const ResourceLimiter&) = delete;
  ResourceLimiter& operator=(ResourceLimiter&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { ResourceLimiter::Register_(&T::Create, &T::Score); }
  };

 protected:
  int64_t cpu_limit_s_ = 0;
  int64_t memory_limit_bytes_ = 0;
  int64_t max_file_size_bytes_ = 0;
  int64_t max_open_files_ = 0;
  int32_t max_processes_ = 0;

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Limiters_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
