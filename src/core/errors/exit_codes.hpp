#pragma once

namespace siteaudit::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Higher values classify audit-specific failure modes so wrappers can branch
// without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kScenarioInvalid = 20,
  kAuditError = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace siteaudit::core::errors
