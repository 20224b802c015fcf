#pragma once

#include <optional>
#include <string_view>

namespace bugreportd::capture {

// Error codes delivered to a listener through onError. The numeric values are
// part of the wire contract with clients and must never be renumbered.
enum class ListenerErrorCode : int {
  kInvalidInput = 1,
  kRuntime = 2,
  kUserDeniedConsent = 3,
  kUserConsentTimedOut = 4,
};

// Failures a backend collector can report after it has been started.
enum class BackendErrorCode {
  kInvalidInput,
  kRuntime,
};

// Synchronous result of a capture request.
enum class AdmissionStatus {
  kAdmitted,
  kInvalidInput,
  kAlreadyActive,
  kPermissionDenied,
};

// Synchronous result of a cancel request. kNoActiveSession covers stale and
// already-terminal handles and is not an error.
enum class CancelStatus {
  kCancelRequested,
  kNoActiveSession,
  kPermissionDenied,
};

std::string_view ToString(ListenerErrorCode code);
std::string_view ToString(BackendErrorCode code);
std::string_view ToString(AdmissionStatus status);
std::string_view ToString(CancelStatus status);

// Maps a numeric wire value back onto the enum; nullopt for unknown values.
std::optional<ListenerErrorCode> ListenerErrorCodeFromInt(int value);

constexpr int ToInt(ListenerErrorCode code) {
  return static_cast<int>(code);
}

ListenerErrorCode ToListenerError(BackendErrorCode code);

} // namespace bugreportd::capture
