#pragma once

namespace docguard::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The remaining values keep the failure classes callers must tell apart:
// backend unavailable vs backend tried-and-failed vs untrustworthy content vs
// a dangerous output destination.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kBackendUnavailable = 20,
  kBackendFailed = 21,
  kContentRejected = 30,
  kPathRejected = 40,
  kCancelled = 130,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace docguard::core::errors
