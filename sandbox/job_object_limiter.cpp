#include "sandbox/job_object_limiter.hpp"

#include <windows.h>

#include "glog/logging.h"
#include "sandbox/process_tree.hpp"

namespace {
std::string LastErrorMessage(const std::string& step) {
  DWORD err = GetLastError();
  char buf[512] = {};
  FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                 nullptr, err, 0, buf, sizeof(buf), nullptr);
  return step + ": " + buf;
}

// Allocations that fail this close to the cap are attributed to it.
const constexpr int64_t kMemorySlackBytes = 1024 * 1024;
}  // namespace

namespace sandbox {

int JobObjectLimiter::Score() {
  HANDLE job = CreateJobObjectW(nullptr, nullptr);
  if (job == nullptr) return -1;
  CloseHandle(job);
  return 3;
}

JobObjectLimiter::~JobObjectLimiter() {
  // JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE terminates anything still running.
  if (job_ != nullptr) CloseHandle(static_cast<HANDLE>(job_));
}

void JobObjectLimiter::Degrade(const std::string& step) {
  LOG(WARNING) << LastErrorMessage(step)
               << "; continuing with the wall-clock watchdog only, there is "
                  "no hard memory cap for this run";
  degraded_ = true;
  if (job_ != nullptr) {
    CloseHandle(static_cast<HANDLE>(job_));
    job_ = nullptr;
  }
}

bool JobObjectLimiter::Configure(const SandboxSession& session,
                                 int32_t timeout_s, std::string* error_msg) {
  if (!ResourceLimiter::Configure(session, timeout_s, error_msg)) {
    return false;
  }
  HANDLE job = CreateJobObjectW(nullptr, nullptr);
  if (job == nullptr) {
    Degrade("CreateJobObject");
    return true;
  }
  job_ = job;

  JOBOBJECT_EXTENDED_LIMIT_INFORMATION info = {};
  info.BasicLimitInformation.LimitFlags =
      JOB_OBJECT_LIMIT_PROCESS_MEMORY | JOB_OBJECT_LIMIT_JOB_MEMORY |
      JOB_OBJECT_LIMIT_ACTIVE_PROCESS | JOB_OBJECT_LIMIT_PROCESS_TIME |
      JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE |
      JOB_OBJECT_LIMIT_DIE_ON_UNHANDLED_EXCEPTION;
  info.BasicLimitInformation.ActiveProcessLimit = max_processes_;
  // 100ns units.
  info.BasicLimitInformation.PerProcessUserTimeLimit.QuadPart =
      cpu_limit_s_ * 10000000LL;
  info.ProcessMemoryLimit = static_cast<SIZE_T>(memory_limit_bytes_);
  info.JobMemoryLimit = static_cast<SIZE_T>(memory_limit_bytes_);
  if (!SetInformationJobObject(job, JobObjectExtendedLimitInformation, &info,
                               sizeof(info))) {
    Degrade("SetInformationJobObject");
  }
  return true;
}

bool JobObjectLimiter::ApplyToProcess(const ChildProcess& child,
                                      std::string* error_msg) {
  if (degraded_) return true;
  if (!AssignProcessToJobObject(static_cast<HANDLE>(job_),
                                static_cast<HANDLE>(child.handle))) {
    Degrade("AssignProcessToJobObject");
  }
  return true;
}

bool JobObjectLimiter::ViolationReported() {
  if (degraded_ || job_ == nullptr) return false;
  JOBOBJECT_EXTENDED_LIMIT_INFORMATION info = {};
  if (!QueryInformationJobObject(static_cast<HANDLE>(job_),
                                 JobObjectExtendedLimitInformation, &info,
                                 sizeof(info), nullptr)) {
    LOG(WARNING) << LastErrorMessage("QueryInformationJobObject");
    return false;
  }
  int64_t peak = static_cast<int64_t>(info.PeakJobMemoryUsed);
  if (peak + kMemorySlackBytes >= memory_limit_bytes_) return true;

  JOBOBJECT_BASIC_ACCOUNTING_INFORMATION accounting = {};
  if (QueryInformationJobObject(static_cast<HANDLE>(job_),
                                JobObjectBasicAccountingInformation,
                                &accounting, sizeof(accounting), nullptr)) {
    int64_t user_time = accounting.TotalUserTime.QuadPart / 10000000LL;
    if (user_time >= cpu_limit_s_) return true;
  }
  return false;
}

void JobObjectLimiter::KillTree(const ChildProcess& child,
                                const std::string& marker) {
  if (!degraded_ && job_ != nullptr) {
    if (TerminateJobObject(static_cast<HANDLE>(job_), 1)) {
      VLOG(1) << "Terminated job of sandbox child " << child.pid;
    } else {
      LOG(WARNING) << LastErrorMessage("TerminateJobObject");
    }
  }
  // Also catches anything that was created before the assignment.
  ResourceLimiter::KillTree(child, marker);
}

namespace {
ResourceLimiter::Register<JobObjectLimiter> r;
}  // namespace

}  // namespace sandbox
