#include "capture/status_codes.hpp"

namespace bugreportd::capture {

std::string_view ToString(const ListenerErrorCode code) {
  switch (code) {
  case ListenerErrorCode::kInvalidInput:
    return "INVALID_INPUT";
  case ListenerErrorCode::kRuntime:
    return "RUNTIME";
  case ListenerErrorCode::kUserDeniedConsent:
    return "USER_DENIED_CONSENT";
  case ListenerErrorCode::kUserConsentTimedOut:
    return "USER_CONSENT_TIMED_OUT";
  }
  return "UNKNOWN";
}

std::string_view ToString(const BackendErrorCode code) {
  switch (code) {
  case BackendErrorCode::kInvalidInput:
    return "BACKEND_INVALID_INPUT";
  case BackendErrorCode::kRuntime:
    return "BACKEND_RUNTIME_ERROR";
  }
  return "BACKEND_UNKNOWN";
}

std::string_view ToString(const AdmissionStatus status) {
  switch (status) {
  case AdmissionStatus::kAdmitted:
    return "ADMITTED";
  case AdmissionStatus::kInvalidInput:
    return "INVALID_INPUT";
  case AdmissionStatus::kAlreadyActive:
    return "ALREADY_ACTIVE";
  case AdmissionStatus::kPermissionDenied:
    return "PERMISSION_DENIED";
  }
  return "UNKNOWN";
}

std::string_view ToString(const CancelStatus status) {
  switch (status) {
  case CancelStatus::kCancelRequested:
    return "CANCEL_REQUESTED";
  case CancelStatus::kNoActiveSession:
    return "NO_ACTIVE_SESSION";
  case CancelStatus::kPermissionDenied:
    return "PERMISSION_DENIED";
  }
  return "UNKNOWN";
}

std::optional<ListenerErrorCode> ListenerErrorCodeFromInt(const int value) {
  switch (value) {
  case 1:
    return ListenerErrorCode::kInvalidInput;
  case 2:
    return ListenerErrorCode::kRuntime;
  case 3:
    return ListenerErrorCode::kUserDeniedConsent;
  case 4:
    return ListenerErrorCode::kUserConsentTimedOut;
  default:
    return std::nullopt;
  }
}

ListenerErrorCode ToListenerError(const BackendErrorCode code) {
  return code == BackendErrorCode::kInvalidInput ? ListenerErrorCode::kInvalidInput
                                                 : ListenerErrorCode::kRuntime;
}

} // namespace bugreportd::capture
