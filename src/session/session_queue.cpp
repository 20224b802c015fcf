#include "session/session_queue.hpp"

namespace bugreportd::session {

const char* ToString(const SessionInput::Kind kind) {
  switch (kind) {
  case SessionInput::Kind::kStart:
    return "start";
  case SessionInput::Kind::kBackendStarted:
    return "backend_started";
  case SessionInput::Kind::kBackendProgress:
    return "backend_progress";
  case SessionInput::Kind::kBackendError:
    return "backend_error";
  case SessionInput::Kind::kBackendFinished:
    return "backend_finished";
  case SessionInput::Kind::kConsentApproved:
    return "consent_approved";
  case SessionInput::Kind::kConsentDenied:
    return "consent_denied";
  case SessionInput::Kind::kConsentDeadline:
    return "consent_deadline";
  case SessionInput::Kind::kCancel:
    return "cancel";
  case SessionInput::Kind::kPeerDied:
    return "peer_died";
  }
  return "unknown";
}

} // namespace bugreportd::session
