#pragma once

namespace camgate::core::errors {

// Stable process-exit contract for service supervisors and scripts.
//
// The first three values keep conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify startup failures so a supervisor can tell a bad
// config file from a port that is already taken without scraping the log.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kBindFailed = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camgate::core::errors
