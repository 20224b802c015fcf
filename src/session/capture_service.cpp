#include "session/capture_service.hpp"

#include "core/logging/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <utility>

namespace bugreportd::session {

CaptureService::CaptureService(core::config::ServiceConfig config,
                               backends::BackendFactory backend_factory,
                               consent::IConsentPrompt* prompt, core::logging::Logger& logger,
                               std::unique_ptr<capture::IPermissionChecker> permission_checker)
    : config_(std::move(config)),
      backend_factory_(std::move(backend_factory)),
      prompt_(prompt),
      logger_(logger),
      permission_checker_(permission_checker != nullptr
                              ? std::move(permission_checker)
                              : std::make_unique<capture::UidAllowListChecker>(
                                    config_.allowed_uids)),
      journal_(config_.journal_dir),
      registry_([this](SessionId id, const capture::CaptureRequest& request,
                       std::shared_ptr<ICaptureListener> listener,
                       CaptureSession::ReleaseHook release) {
        return BuildSession(id, request, std::move(listener), std::move(release));
      }) {}

CaptureService::~CaptureService() {
  Shutdown();
}

capture::AdmissionStatus CaptureService::StartCapture(const capture::CaptureRequest& request,
                                                      std::shared_ptr<ICaptureListener> listener,
                                                      SessionId& handle, std::string& error) {
  const std::string requester = capture::Describe(request.requester);

  std::string reason;
  if (!permission_checker_->CheckCapturePermission(request.requester, reason)) {
    error = reason;
    logger_.Warn("capture rejected", {{"status", capture::ToString(
                                                     capture::AdmissionStatus::kPermissionDenied)},
                                      {"requester", requester},
                                      {"error", error}});
    return capture::AdmissionStatus::kPermissionDenied;
  }

  bool valid = true;
  if (listener == nullptr) {
    reason = "capture listener is required";
    valid = false;
  } else if (!backend_factory_) {
    reason = "no capture backend configured";
    valid = false;
  } else {
    valid = capture::ValidateCaptureRequest(request, reason);
  }
  if (!valid) {
    error = reason;
    logger_.Warn("capture rejected",
                 {{"status", capture::ToString(capture::AdmissionStatus::kInvalidInput)},
                  {"requester", requester},
                  {"error", error}});
    return capture::AdmissionStatus::kInvalidInput;
  }

  const capture::AdmissionStatus status =
      registry_.Admit(request, std::move(listener), handle, error);
  if (status != capture::AdmissionStatus::kAdmitted) {
    logger_.Warn("capture rejected", {{"status", capture::ToString(status)},
                                      {"requester", requester},
                                      {"error", error}});
    return status;
  }

  logger_.Info("capture admitted", {{"session_id", std::to_string(handle)},
                                    {"mode", capture::ToString(request.mode)},
                                    {"requester", requester}});
  return status;
}

capture::CancelStatus CaptureService::CancelCapture(const SessionId handle,
                                                    const capture::Principal& caller,
                                                    std::string& error) {
  const std::shared_ptr<CaptureSession> session = registry_.Find(handle);
  if (session == nullptr) {
    logger_.Debug("cancel ignored; no such active session",
                  {{"session_id", std::to_string(handle)}, {"caller", capture::Describe(caller)}});
    return capture::CancelStatus::kNoActiveSession;
  }

  if (session->request().requester != caller) {
    error = "cancellation requested by " + capture::Describe(caller) +
            " does not match ongoing capture from " +
            capture::Describe(session->request().requester);
    logger_.Warn("cancel rejected", {{"session_id", std::to_string(handle)}, {"error", error}});
    return capture::CancelStatus::kPermissionDenied;
  }

  const capture::CancelStatus status = registry_.Cancel(handle);
  logger_.Info("cancel requested",
               {{"session_id", std::to_string(handle)}, {"status", capture::ToString(status)}});
  return status;
}

bool CaptureService::NotifyListenerDied(const SessionId handle) {
  const bool forwarded = registry_.NotifyPeerDied(handle);
  logger_.Info("listener died", {{"session_id", std::to_string(handle)},
                                 {"active", forwarded ? "true" : "false"}});
  return forwarded;
}

void CaptureService::Dump(std::ostream& out) const {
  const SessionRegistry::Snapshot registry = registry_.DebugSnapshot();

  out << "bugreportd capture service\n";
  out << "  consent_timeout_ms: " << config_.consent_timeout.count() << "\n";
  out << "  telephony_consent_timeout_ms: " << config_.telephony_consent_timeout.count() << "\n";
  out << "  require_consent: " << (config_.require_consent ? "true" : "false") << "\n";
  out << "  sessions admitted: " << registry.admitted << ", released: " << registry.released
      << ", rejected (already active): " << registry.rejected_already_active << "\n";

  const std::shared_ptr<CaptureSession> active = registry_.Active();
  if (active == nullptr) {
    out << "  capture not in progress\n";
    return;
  }

  const CaptureSession::Snapshot session = active->DebugSnapshot();
  out << "  session_id: " << session.id << "\n";
  out << "  mode: " << capture::ToString(session.mode) << "\n";
  out << "  state: " << ToString(session.state) << "\n";
  out << "  consent: " << consent::ToString(session.consent);
  if (session.consent == consent::ConsentDecision::kPending) {
    out << " (remaining_ms=" << session.consent_remaining_ms << ")";
  }
  out << "\n";
  if (session.last_progress >= 0.0F) {
    out << "  progress: " << std::fixed << std::setprecision(1) << session.last_progress << "\n";
  } else {
    out << "  progress: none\n";
  }
  out << "  requester: " << capture::Describe(session.requester) << "\n";
}

bool CaptureService::WaitForIdle(const std::chrono::milliseconds timeout) const {
  return registry_.WaitForIdle(timeout);
}

void CaptureService::Shutdown() {
  registry_.Shutdown();
}

std::shared_ptr<CaptureSession>
CaptureService::BuildSession(const SessionId id, const capture::CaptureRequest& request,
                             std::shared_ptr<ICaptureListener> listener,
                             CaptureSession::ReleaseHook release) {
  std::unique_ptr<backends::ICaptureBackend> backend = backend_factory_();
  if (backend == nullptr) {
    logger_.Error("backend factory returned no collector", {{"session_id", std::to_string(id)}});
    return nullptr;
  }

  SessionOptions options;
  options.id = id;
  options.request = request;
  options.consent_timeout = ConsentTimeoutFor(request.mode);
  if (!config_.require_consent) {
    options.consent_required = false;
    options.consent_waiver = "not_required";
  } else if (IsConsentExempt(request.requester)) {
    options.consent_required = false;
    options.consent_waiver = "exempt";
  }

  // Journaled here, under the registry lock, so it precedes anything the
  // session worker writes.
  std::string error;
  if (!journal_.EmitSessionAdmitted(
          {
              .ts = std::chrono::system_clock::now(),
              .session_id = id,
              .mode = capture::ToString(request.mode),
              .requester = capture::Describe(request.requester),
              .screenshot = capture::ModeIncludesScreenshot(request.mode),
          },
          error)) {
    logger_.Warn("journal write failed", {{"session_id", std::to_string(id)}, {"error", error}});
  }

  return CaptureSession::Create(std::move(options), std::move(listener), std::move(backend),
                                SessionEnvironment{
                                    .logger = &logger_,
                                    .journal = &journal_,
                                    .prompt = prompt_,
                                    .retained_dir = config_.retained_dir,
                                },
                                std::move(release));
}

bool CaptureService::IsConsentExempt(const capture::Principal& requester) const {
  return std::find(config_.consent_exempt_uids.begin(), config_.consent_exempt_uids.end(),
                   requester.uid) != config_.consent_exempt_uids.end();
}

std::chrono::milliseconds CaptureService::ConsentTimeoutFor(const capture::CaptureMode mode) const {
  return mode == capture::CaptureMode::kTelephony ? config_.telephony_consent_timeout
                                                  : config_.consent_timeout;
}

} // namespace bugreportd::session
