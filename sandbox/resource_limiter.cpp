#include "sandbox/resource_limiter.hpp"

#include <algorithm>

#include "glog/logging.h"
#include "sandbox/process_tree.hpp"

namespace sandbox {

const char* GuaranteeName(Guarantee guarantee) {
  switch (guarantee) {
    case Guarantee::kFull:
      return "FULL";
    case Guarantee::kReduced:
      return "REDUCED";
  }
  return "UNKNOWN";
}

ResourceLimiter::store_t* ResourceLimiter::Limiters_() {
  static store_t* limiters = new store_t;
  return limiters;
}

void ResourceLimiter::Register_(ResourceLimiter::create_t create,
                                ResourceLimiter::score_t score) {
  Limiters_()->emplace_back(create, score);
}

std::unique_ptr<ResourceLimiter> ResourceLimiter::Create() {
  const store_t& limiters = *Limiters_();
  // Computed once, the first time a limiter is requested.
  static const unsigned best_limiter = [&limiters]() {
    unsigned best = -1U;
    int best_score = 0;
    for (unsigned i = 0; i < limiters.size(); i++) {
      int score = limiters[i].second();
      if (score > best_score) {
        best_score = score;
        best = i;
      }
    }
    return best;
  }();
  if (best_limiter == -1U) {
    LOG(ERROR) << "No resource limiter could be found";
    return nullptr;
  }
  return std::unique_ptr<ResourceLimiter>(limiters[best_limiter].first());
}

std::unique_ptr<ResourceLimiter> ResourceLimiter::Create(
    const std::string& name) {
  for (const auto& limiter : *Limiters_()) {
    if (limiter.second() <= 0) continue;
    std::unique_ptr<ResourceLimiter> instance(limiter.first());
    if (instance->Name() == name) return instance;
  }
  return nullptr;
}

std::vector<std::string> ResourceLimiter::Available() {
  std::vector<std::pair<int, std::string>> scored;
  for (const auto& limiter : *Limiters_()) {
    int score = limiter.second();
    if (score <= 0) continue;
    std::unique_ptr<ResourceLimiter> instance(limiter.first());
    scored.emplace_back(score, instance->Name());
  }
  std::stable_sort(
      scored.begin(), scored.end(),
      [](const std::pair<int, std::string>& a,
         const std::pair<int, std::string>& b) { return a.first > b.first; });
  std::vector<std::string> names;
  for (const auto& entry : scored) names.push_back(entry.second);
  return names;
}

bool ResourceLimiter::Configure(const SandboxSession& session,
                                int32_t timeout_s, std::string* error_msg) {
  const SessionOptions& options = session.Options();
  if (options.memory_limit_mb <= 0 || timeout_s <= 0) {
    *error_msg = "Memory and time limits must be positive";
    return false;
  }
  // One second of slack so that the wall-clock watchdog normally fires first.
  cpu_limit_s_ = int64_t{timeout_s} + 1;
  memory_limit_bytes_ = int64_t{options.memory_limit_mb} * 1024 * 1024;
  max_file_size_bytes_ = int64_t{options.max_file_size_mb} * 1024 * 1024;
  max_open_files_ = options.max_open_files;
  max_processes_ = options.max_processes;
  return true;
}

void ResourceLimiter::KillTree(const ChildProcess& child,
                               const std::string& marker) {
  size_t survivors = ProcessTree::Kill(child.pid, marker);
  if (survivors != 0) {
    LOG(WARNING) << survivors << " process(es) of sandbox child " << child.pid
                 << " survived the tree-kill";
  }
}

}  // namespace sandbox
