#pragma once

namespace bugreportd::core::errors {

// Stable process-exit contract for the bugreportd CLI.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values classify how a capture ended so wrappers can branch
// without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kAdmissionRejected = 20,
  kConsentDenied = 30,
  kConsentTimedOut = 31,
  kCaptureFailed = 40,
  kCaptureCancelled = 41,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace bugreportd::core::errors
