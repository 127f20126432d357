#include "sandbox/environment.hpp"

#include <algorithm>
#include <cctype>

#include "absl/strings/str_cat.h"
#include "util/file.hpp"

#ifndef _WIN32
extern char** environ;
#endif

namespace sandbox {

namespace {
const char* kSensitivePatterns[] = {
    "API",    "KEY",    "TOKEN",  "SECRET", "PASSWORD",  "CREDENTIAL",
    "AWS",    "AZURE",  "GOOGLE", "OPENAI", "ANTHROPIC", "DATABASE",
};

#ifdef _WIN32
const char* kPassThrough[] = {"SYSTEMROOT", "WINDIR", "COMSPEC", "PATHEXT",
                              "SYSTEMDRIVE"};
const constexpr char* kDefaultSearchPath = "C:\\Windows\\System32;C:\\Windows";
const constexpr char kPathListSeparator = ';';
#else
const char* kPassThrough[] = {"TZ"};
const constexpr char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";
const constexpr char kPathListSeparator = ':';
#endif
}  // namespace

constexpr const char* EnvironmentScrubber::kSandboxRootVar;
constexpr const char* EnvironmentScrubber::kAllowNetworkVar;

bool EnvironmentScrubber::IsSensitive(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (const char* pattern : kSensitivePatterns) {
    if (upper.find(pattern) != std::string::npos) return true;
  }
  return false;
}

EnvMap EnvironmentScrubber::CurrentEnvironment() {
  EnvMap env;
#ifdef _WIN32
  char** envp = _environ;
#else
  char** envp = environ;
#endif
  for (char** var = envp; var != nullptr && *var != nullptr; var++) {
    std::string entry = *var;
    size_t eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    env[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  return env;
}

EnvMap EnvironmentScrubber::Build(const SandboxSession& session) const {
  return Build(session, CurrentEnvironment());
}

EnvMap EnvironmentScrubber::Build(const SandboxSession& session,
                                  const EnvMap& parent) const {
  EnvMap env;
  for (const char* name : kPassThrough) {
    auto it = parent.find(name);
    if (it != parent.end()) env[name] = it->second;
  }

  env["HOME"] = session.HomeDir();
  env["USERPROFILE"] = session.HomeDir();
  env["TMPDIR"] = session.TempDir();
  env["TMP"] = session.TempDir();
  env["TEMP"] = session.TempDir();
  env["PATH"] = kDefaultSearchPath;
  env["LANG"] = "C.UTF-8";
  env["LC_ALL"] = "C.UTF-8";
  env["PYTHONDONTWRITEBYTECODE"] = "1";
  env["PYTHONNOUSERSITE"] = "1";
  env["PYTHONIOENCODING"] = "utf-8";
  // The guard directory goes first so that its sitecustomize wins over any
  // file with the same name among the submission's files.
  env["PYTHONPATH"] =
      absl::StrCat(session.GuardDir(), std::string(1, kPathListSeparator),
                   session.Root());
  env[kSandboxRootVar] = session.Root();
  env[kAllowNetworkVar] = session.AllowNetwork() ? "1" : "0";

  for (auto it = env.begin(); it != env.end();) {
    if (IsSensitive(it->first)) {
      it = env.erase(it);
    } else {
      ++it;
    }
  }
  return env;
}

std::vector<std::string> EnvironmentScrubber::ToEnvp(const EnvMap& env) {
  std::vector<std::string> envp;
  envp.reserve(env.size());
  for (const auto& kv : env) envp.push_back(kv.first + "=" + kv.second);
  return envp;
}

}  // namespace sandbox
