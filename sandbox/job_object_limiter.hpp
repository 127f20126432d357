#ifndef SANDBOX_JOB_OBJECT_LIMITER_HPP
#define SANDBOX_JOB_OBJECT_LIMITER_HPP
#include "sandbox/resource_limiter.hpp"

namespace sandbox {

// Puts the child in a job object that caps per-process and per-job memory,
// the number of active processes and the user CPU time. Breakaway is not
// allowed and every process of the job is killed when the job is closed.
//
// If the job cannot be created or the child cannot be assigned to it (for
// example when the engine already runs inside a job that forbids nesting),
// the run continues under the executor's watchdog and GetGuarantee reports
// kReduced from then on.
class JobObjectLimiter : public ResourceLimiter {
 public:
  static ResourceLimiter* Create() { return new JobObjectLimiter(); }
  static int Score();

  const char* Name() const override { return "job-object"; }
  Guarantee GetGuarantee() const override {
    return degraded_ ? Guarantee::kReduced : Guarantee::kFull;
  }
  bool Configure(const SandboxSession& session, int32_t timeout_s,
                 std::string* error_msg) override;
  bool ApplyToProcess(const ChildProcess& child,
                      std::string* error_msg) override;
  bool ViolationReported() override;
  void KillTree(const ChildProcess& child, const std::string& marker) override;

  ~JobObjectLimiter() override;

 protected:
  JobObjectLimiter() = default;

 private:
  void Degrade(const std::string& step);

  void* job_ = nullptr;
  bool degraded_ = false;
};

}  // namespace sandbox
#endif
