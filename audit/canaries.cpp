#include "audit/canaries.hpp"

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace {

const constexpr char* kPrologue = "import sys\ntry:\n";
const constexpr char* kEpilogue =
    "except BaseException as exc:\n"
    "    sys.stderr.write(\"%s: %s\\n\" % (type(exc).__name__, exc))\n"
    "    sys.exit(3)\n"
    "print(\"CANARY-ESCAPED\")\n";

std::vector<audit::Canary> MakeCanaries() {
  using sandbox::Capability;
  std::vector<audit::Canary> canaries;
  canaries.push_back({Capability::kDynamicCode, "evaluate a dynamic expression",
                      "eval(\"6 * 7\")", ""});
  canaries.push_back({Capability::kProcessSpawn, "run a shell command",
                      "import os\n"
                      "os.system(\"echo escaped > spawn_canary_marker\")",
                      "spawn_canary_marker"});
  canaries.push_back({Capability::kDeserialization,
                      "import a deserialization module", "import pickle",
                      ""});
  canaries.push_back({Capability::kNativeMemory, "import an FFI module",
                      "import ctypes", ""});
  canaries.push_back(
      {Capability::kFileAccess, "write outside the sandbox root",
       "import os\n"
       "root = os.environ[\"EVALBOX_SANDBOX_ROOT\"]\n"
       "with open(os.path.join(root, \"..\", \"escape_canary\"), \"w\") as f:\n"
       "    f.write(\"escaped\")",
       "../escape_canary"});
  canaries.push_back(
      {Capability::kNetwork, "open an outbound connection",
       "import socket\n"
       "socket.create_connection((\"127.0.0.1\", 9), timeout=1).close()",
       ""});
  canaries.push_back({Capability::kGuardTamper, "reload the guard module",
                      "import importlib\n"
                      "import sitecustomize\n"
                      "importlib.reload(sitecustomize)",
                      ""});
  return canaries;
}

// First line of stderr that carries a guard label, or the last line.
std::string Summarize(const std::string& err) {
  std::vector<absl::string_view> lines =
      absl::StrSplit(err, '\n', absl::SkipWhitespace());
  for (absl::string_view line : lines) {
    if (absl::StrContains(line, sandbox::kGuardLabelPrefix)) {
      return std::string(line);
    }
  }
  if (lines.empty()) return "";
  return std::string(lines.back());
}

}  // namespace

namespace audit {

std::string Canary::Program() const {
  std::string program = kPrologue;
  for (absl::string_view line : absl::StrSplit(body, '\n')) {
    absl::StrAppend(&program, "    ", line, "\n");
  }
  return program + kEpilogue;
}

const std::vector<Canary>& Canaries() {
  static const std::vector<Canary> canaries = MakeCanaries();
  return canaries;
}

CanaryCheck Evaluate(const Canary& canary,
                     const executor::ExecutionResult& result,
                     bool side_effect_present) {
  CanaryCheck check;
  check.name = canary.Name();
  check.capability = canary.capability;
  std::string label = sandbox::GuardLabel(canary.capability);
  check.expected = canary.attempt + " is blocked with " + label;

  bool escaped = absl::StrContains(result.Stdout(), kEscapedMarker);
  bool labeled = absl::StrContains(result.Stderr(), label);
  if (!result.SpawnError().empty()) {
    check.actual = "did not start: " + result.SpawnError();
  } else if (result.TimedOut()) {
    check.actual = result.Describe();
  } else if (escaped || side_effect_present) {
    check.actual = "not blocked";
    if (side_effect_present) check.actual += ", side effect left on disk";
  } else if (!labeled) {
    check.actual = absl::StrCat("failed without the guard label (",
                                result.Describe(), "): ",
                                Summarize(result.Stderr()));
  } else {
    check.actual = "blocked: " + Summarize(result.Stderr());
    check.passed = true;
  }
  return check;
}

}  // namespace audit
