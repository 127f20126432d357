#include "engine/banner.hpp"

#include <stdlib.h>
#include <string.h>

#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"

namespace {

const constexpr int kWidth = 38;
const constexpr char* kTitle = "evalbox Security Status";

struct Frame {
  const char* top_left;
  const char* top_right;
  const char* mid_left;
  const char* mid_right;
  const char* bottom_left;
  const char* bottom_right;
  const char* horizontal;
  const char* vertical;
};

const Frame kAsciiFrame = {"+", "+", "+", "+", "+", "+", "-", "|"};
const Frame kBoxFrame = {"╔", "╗", "╠", "╣",
                         "╚", "╝", "═", "║"};

std::string Rule(const Frame& frame, const char* left, const char* right) {
  std::string rule = left;
  for (int i = 0; i < kWidth; i++) rule += frame.horizontal;
  return rule + right + "\n";
}

}  // namespace

namespace engine {

BannerStatus BannerStatus::FromEngine(const Engine& engine,
                                      bool trusted_model) {
  using sandbox::Capability;
  const sandbox::GuardManifest& manifest = engine.Manifest();
  BannerStatus status;
  status.sandboxing =
      manifest.Blocked().size() == sandbox::AllCapabilities().size();
  status.network_allowed = engine.Options().session.allow_network ||
                           !manifest.Blocks(Capability::kNetwork);
  status.subprocess_blocked = manifest.Blocks(Capability::kProcessSpawn) ||
                              engine.SyscallFilterActive();
  status.filesystem_confined = manifest.Blocks(Capability::kFileAccess);
  status.env_clean = true;
  status.resource_limits =
      engine.GetGuarantee() == sandbox::Guarantee::kFull;
  status.trusted_model = trusted_model;
  status.limiter = engine.LimiterName();
  if (engine.SyscallFilterActive()) status.limiter += " + seccomp";
  status.audit = EngineStateName(engine.State());
  if (engine.Overridden()) status.audit += " (OVERRIDDEN)";
  return status;
}

std::string RenderBanner(const BannerStatus& status, bool unicode) {
  const Frame& frame = unicode ? kBoxFrame : kAsciiFrame;
  std::vector<std::pair<const char*, std::string>> lines = {
      {"Sandboxing:", status.sandboxing ? "ENABLED" : "PARTIAL"},
      {"Network:", status.network_allowed ? "ALLOWED" : "BLOCKED"},
      {"Subprocess:", status.subprocess_blocked ? "BLOCKED" : "ALLOWED"},
      {"Filesystem:", status.filesystem_confined ? "CONFINED" : "FULL ACCESS"},
      {"Env Clean:", status.env_clean ? "CLEANED" : "FULL"},
      {"ResourceLimits:", status.resource_limits ? "ENFORCED" : "REDUCED"},
      {"Trusted Model:", status.trusted_model ? "YES" : "NO"},
      {"Limiter:", status.limiter},
      {"Audit:", status.audit},
  };

  std::string banner = Rule(frame, frame.top_left, frame.top_right);
  int title_len = strlen(kTitle);
  int left = (kWidth - title_len) / 2;
  banner += absl::StrFormat("%s%*s%s%*s%s\n", frame.vertical, left, "", kTitle,
                            kWidth - left - title_len, "", frame.vertical);
  banner += Rule(frame, frame.mid_left, frame.mid_right);
  for (const auto& line : lines) {
    std::string text = absl::StrFormat("%-16s%s", line.first, line.second);
    if (text.size() > static_cast<size_t>(kWidth)) text.resize(kWidth);
    banner += absl::StrFormat("%s%-*s%s\n", frame.vertical, kWidth, text,
                              frame.vertical);
  }
  banner += Rule(frame, frame.bottom_left, frame.bottom_right);
  return banner;
}

bool UnicodeTerminal() {
  for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"}) {
    const char* value = getenv(var);
    if (value == nullptr || *value == '\0') continue;
    std::string lower = absl::AsciiStrToLower(value);
    return absl::StrContains(lower, "utf-8") || absl::StrContains(lower, "utf8");
  }
  return false;
}

}  // namespace engine
