#ifndef AUDIT_CANARIES_HPP
#define AUDIT_CANARIES_HPP

#include <string>
#include <vector>

#include "executor/execution_result.hpp"
#include "sandbox/guard_module.hpp"

namespace audit {

// Printed by a canary whose attack went through.
static const constexpr char* kEscapedMarker = "CANARY-ESCAPED";

// A deliberately dangerous program that must be stopped by the guard of one
// capability.
struct Canary {
  sandbox::Capability capability;
  // What the canary attempts, e.g. "spawn a shell".
  std::string attempt;
  // Body of the attack, indented for the try block of the program.
  std::string body;
  // File the attack would create, relative to the sandbox root. Empty if the
  // attack leaves no trace on disk.
  std::string side_effect;

  // Name of the canary, the same as the capability it checks.
  const char* Name() const { return sandbox::CapabilityName(capability); }

  // The complete program. Errors are written to stderr and turned into exit
  // code 3; kEscapedMarker is printed if the attack did not raise.
  std::string Program() const;
};

// One canary per capability, in the order of sandbox::AllCapabilities().
const std::vector<Canary>& Canaries();

// Outcome of one canary.
struct CanaryCheck {
  std::string name;
  sandbox::Capability capability;
  std::string expected;
  std::string actual;
  bool passed = false;
};

// Judges the result of a canary run. The canary passes only if the attack
// raised the labeled error of its capability and left no side effect behind.
CanaryCheck Evaluate(const Canary& canary,
                     const executor::ExecutionResult& result,
                     bool side_effect_present);

}  // namespace audit

#endif
