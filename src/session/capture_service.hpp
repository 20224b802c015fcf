#pragma once

#include "backends/capture_backend.hpp"
#include "capture/capture_request.hpp"
#include "capture/permission_checker.hpp"
#include "capture/status_codes.hpp"
#include "consent/consent_prompt.hpp"
#include "core/config/service_config.hpp"
#include "events/emitter.hpp"
#include "session/capture_session.hpp"
#include "session/event_channel.hpp"
#include "session/session_registry.hpp"

#include <chrono>
#include <memory>
#include <ostream>
#include <string>

namespace bugreportd::core::logging {
class Logger;
}

namespace bugreportd::session {

// Inbound surface of the privileged capture service. One instance owns the
// registry, the journal and the per-session policy derived from config.
//
// `prompt` and `logger` are borrowed and must outlive the service.
class CaptureService {
public:
  CaptureService(core::config::ServiceConfig config, backends::BackendFactory backend_factory,
                 consent::IConsentPrompt* prompt, core::logging::Logger& logger,
                 std::unique_ptr<capture::IPermissionChecker> permission_checker = nullptr);
  ~CaptureService();

  CaptureService(const CaptureService&) = delete;
  CaptureService& operator=(const CaptureService&) = delete;

  // Checks, in order: caller permission, request validity, the single
  // session slot. On kAdmitted the capture continues asynchronously and all
  // further outcomes reach `listener`; any other status means no session was
  // created and the listener is never called.
  capture::AdmissionStatus StartCapture(const capture::CaptureRequest& request,
                                        std::shared_ptr<ICaptureListener> listener,
                                        SessionId& handle, std::string& error);

  // Only the principal that started the active capture may cancel it.
  capture::CancelStatus CancelCapture(SessionId handle, const capture::Principal& caller,
                                      std::string& error);

  // Death notification from the transport for the listener of `handle`.
  bool NotifyListenerDied(SessionId handle);

  // Human-readable state for diagnostics.
  void Dump(std::ostream& out) const;

  bool WaitForIdle(std::chrono::milliseconds timeout) const;

  // Cancels any active session and joins every session thread.
  void Shutdown();

  const core::config::ServiceConfig& config() const {
    return config_;
  }

  const events::Emitter& journal() const {
    return journal_;
  }

  SessionRegistry& registry() {
    return registry_;
  }

private:
  std::shared_ptr<CaptureSession> BuildSession(SessionId id,
                                               const capture::CaptureRequest& request,
                                               std::shared_ptr<ICaptureListener> listener,
                                               CaptureSession::ReleaseHook release);
  bool IsConsentExempt(const capture::Principal& requester) const;
  std::chrono::milliseconds ConsentTimeoutFor(capture::CaptureMode mode) const;

  const core::config::ServiceConfig config_;
  const backends::BackendFactory backend_factory_;
  consent::IConsentPrompt* const prompt_;
  core::logging::Logger& logger_;
  const std::unique_ptr<capture::IPermissionChecker> permission_checker_;
  events::Emitter journal_;
  // Declared last: its destructor joins sessions that still use the members
  // above.
  SessionRegistry registry_;
};

} // namespace bugreportd::session
