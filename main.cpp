#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "engine/banner.hpp"
#include "engine/engine.hpp"
#include "glog/logging.h"
#include "sandbox/errors.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

const constexpr int kExitFailedRuns = 1;
const constexpr int kExitRefused = 2;

// A file is run as is, a directory must contain main.py.
engine::Submission MakeSubmission(const std::string& path) {
  engine::Submission submission;
  submission.name = util::File::BaseName(path);
  if (!util::File::IsDirectory(path)) {
    std::string dest = "submission/" + util::File::BaseName(path);
    submission.files.push_back({path, dest});
    submission.entry_point = dest;
  } else {
    submission.files.push_back({path, "submission"});
    submission.entry_point = "submission/main.py";
  }
  return submission;
}

// Asks the operator to accept the unsafe mode. End of input means no.
bool ConfirmUnsafe() {
  std::cout << "WARNING: UNSAFE mode runs submissions even if the security "
               "audit fails. Type 'yes' to continue: "
            << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    std::cout << std::endl << "Aborted (non-interactive unsafe request)"
              << std::endl;
    return false;
  }
  if (absl::AsciiStrToLower(absl::StripAsciiWhitespace(answer)) != "yes") {
    std::cout << "Aborted." << std::endl;
    return false;
  }
  return true;
}

void PrintReport(const audit::AuditReport& report) {
  for (const audit::CanaryCheck& check : report.checks) {
    std::cout << (check.passed ? "[PASS] " : "[FAIL] ") << check.name << ": "
              << check.actual << std::endl;
  }
  std::cout << report.Describe() << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs untrusted Python submissions in a sandbox.\n"
      "Usage: evalbox [flags] <script.py | directory with main.py>...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::unique_ptr<engine::Engine> eng;
  std::vector<engine::Submission> submissions;
  try {
    eng.reset(new engine::Engine(engine::EngineOptions::FromFlags()));
    for (int i = 1; i < argc; i++) {
      submissions.push_back(MakeSubmission(argv[i]));
    }
  } catch (const sandbox::ConfigurationError& exc) {
    LOG(ERROR) << "Invalid configuration: " << exc.what();
    return kExitRefused;
  }
  if (submissions.empty() && !FLAGS_audit_only) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "flags.cpp");
    return kExitRefused;
  }

  bool passed = false;
  try {
    passed = eng->EnsureAudited();
  } catch (const std::system_error& exc) {
    // Failing to even run the audit counts as a failed audit.
    LOG(ERROR) << "Cannot run the security audit: " << exc.what();
    return kExitRefused;
  } catch (const sandbox::ConfigurationError& exc) {
    LOG(ERROR) << "Cannot run the security audit: " << exc.what();
    return kExitRefused;
  }
  if (FLAGS_audit_only) {
    std::cout << engine::RenderBanner(
        engine::BannerStatus::FromEngine(*eng, FLAGS_trusted_model),
        engine::UnicodeTerminal());
    PrintReport(*eng->Report());
    return passed ? 0 : kExitRefused;
  }
  if (!passed) PrintReport(*eng->Report());
  if (FLAGS_unsafe && !FLAGS_trusted_model && !ConfirmUnsafe()) {
    return kExitFailedRuns;
  }
  if (!passed) {
    if (!FLAGS_unsafe) {
      std::cout << "Security audit failed. Refusing to run submissions. "
                   "Re-run with --unsafe to bypass (NOT RECOMMENDED)."
                << std::endl;
      return kExitRefused;
    }
    eng->Override("--unsafe given on the command line");
  }
  std::cout << engine::RenderBanner(
      engine::BannerStatus::FromEngine(*eng, FLAGS_trusted_model),
      engine::UnicodeTerminal());

  int status = 0;
  std::vector<engine::BatchResult> results = eng->RunBatch(submissions);
  for (size_t i = 0; i < results.size(); i++) {
    const engine::BatchResult& batch = results[i];
    std::cout << "== " << submissions[i].name << ": ";
    if (!batch.result) {
      std::cout << "engine error: " << batch.error << std::endl;
      status = kExitFailedRuns;
      continue;
    }
    const executor::ExecutionResult& result = *batch.result;
    std::cout << result.Describe() << std::endl;
    std::cout << result.Stdout();
    if (!result.Stderr().empty()) std::cerr << result.Stderr();
    if (!result.Success()) status = kExitFailedRuns;
  }
  return status;
}
