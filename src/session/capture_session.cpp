#include "session/capture_session.hpp"

#include "artifacts/retained_artifact_writer.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"

#include <algorithm>
#include <utility>

namespace bugreportd::session {

namespace {

using Clock = std::chrono::steady_clock;

std::uint64_t ElapsedMillis(Clock::time_point since) {
  const auto elapsed = Clock::now() - since;
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

events::Emitter::SessionTerminalEvent::Kind ToTerminalKind(const SessionState state) {
  switch (state) {
  case SessionState::kErrored:
    return events::Emitter::SessionTerminalEvent::Kind::kErrored;
  case SessionState::kCancelled:
    return events::Emitter::SessionTerminalEvent::Kind::kCancelled;
  default:
    return events::Emitter::SessionTerminalEvent::Kind::kFinished;
  }
}

} // namespace

const char* ToString(const SessionState state) {
  switch (state) {
  case SessionState::kRequested:
    return "requested";
  case SessionState::kRunning:
    return "running";
  case SessionState::kFinishing:
    return "finishing";
  case SessionState::kFinished:
    return "finished";
  case SessionState::kErrored:
    return "errored";
  case SessionState::kCancelled:
    return "cancelled";
  }
  return "requested";
}

bool IsTerminal(const SessionState state) {
  return state == SessionState::kFinished || state == SessionState::kErrored ||
         state == SessionState::kCancelled;
}

void CaptureSession::BackendEvents::OnStarted() {
  SessionInput input;
  input.kind = SessionInput::Kind::kBackendStarted;
  session_.PostOrReport(std::move(input));
}

void CaptureSession::BackendEvents::OnProgress(const float percent) {
  SessionInput input;
  input.kind = SessionInput::Kind::kBackendProgress;
  input.progress = percent;
  session_.PostOrReport(std::move(input));
}

void CaptureSession::BackendEvents::OnError(const capture::BackendErrorCode code,
                                            const std::string& detail) {
  SessionInput input;
  input.kind = SessionInput::Kind::kBackendError;
  input.error_code = code;
  input.detail = detail;
  session_.PostOrReport(std::move(input));
}

void CaptureSession::BackendEvents::OnFinished() {
  SessionInput input;
  input.kind = SessionInput::Kind::kBackendFinished;
  session_.PostOrReport(std::move(input));
}

std::shared_ptr<CaptureSession>
CaptureSession::Create(SessionOptions options, std::shared_ptr<ICaptureListener> listener,
                       std::unique_ptr<backends::ICaptureBackend> backend,
                       SessionEnvironment environment, ReleaseHook release) {
  return std::shared_ptr<CaptureSession>(new CaptureSession(std::move(options),
                                                            std::move(listener),
                                                            std::move(backend),
                                                            std::move(environment),
                                                            std::move(release)));
}

CaptureSession::CaptureSession(SessionOptions options, std::shared_ptr<ICaptureListener> listener,
                               std::unique_ptr<backends::ICaptureBackend> backend,
                               SessionEnvironment environment, ReleaseHook release)
    : options_(std::move(options)),
      environment_(std::move(environment)),
      release_(std::move(release)),
      admitted_at_(Clock::now()),
      backend_(std::move(backend)),
      backend_events_(*this),
      queue_(std::make_shared<SessionQueue>()),
      channel_(std::move(listener), [this]() { Teardown(); }) {}

CaptureSession::~CaptureSession() {
  // Collector and timer threads call back into this object; stop them first.
  if (backend_ != nullptr) {
    backend_->Cancel();
    backend_.reset();
  }
  timer_.reset();

  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id()) {
      worker_.detach();
    } else {
      worker_.join();
    }
  }
}

bool CaptureSession::Launch(std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (launched_) {
      error = "session " + std::to_string(options_.id) + " already launched";
      return false;
    }
    launched_ = true;
  }
  if (backend_ == nullptr) {
    error = "session " + std::to_string(options_.id) + " has no capture backend";
    return false;
  }

  SessionInput start;
  start.kind = SessionInput::Kind::kStart;
  queue_->Post(std::move(start));

  // The worker keeps the session alive until it has torn everything down.
  std::shared_ptr<CaptureSession> self = shared_from_this();
  worker_ = std::thread([self]() { self->Run(); });
  return true;
}

bool CaptureSession::RequestCancel() {
  SessionInput input;
  input.kind = SessionInput::Kind::kCancel;
  return queue_->Post(std::move(input));
}

bool CaptureSession::NotifyPeerDied() {
  SessionInput input;
  input.kind = SessionInput::Kind::kPeerDied;
  return queue_->Post(std::move(input));
}

bool CaptureSession::OnConsentResponse(const bool approved) {
  SessionInput input;
  input.kind = approved ? SessionInput::Kind::kConsentApproved : SessionInput::Kind::kConsentDenied;
  return PostOrReport(std::move(input));
}

bool CaptureSession::WaitForRelease(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return released_cv_.wait_for(lock, timeout, [this]() { return released_; });
}

void CaptureSession::Join() {
  std::lock_guard<std::mutex> lock(join_mu_);
  if (!worker_.joinable() || worker_.get_id() == std::this_thread::get_id()) {
    return;
  }
  worker_.join();
}

CaptureSession::Snapshot CaptureSession::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  Snapshot snapshot;
  snapshot.id = options_.id;
  snapshot.state = state_;
  snapshot.consent = consent_snapshot_;
  snapshot.consent_required = options_.consent_required;
  if (options_.consent_required && consent_snapshot_ == consent::ConsentDecision::kPending &&
      consent_deadline_ != Clock::time_point{}) {
    snapshot.consent_remaining_ms = core::RemainingMillis(consent_deadline_, Clock::now());
  }
  snapshot.last_progress = last_progress_;
  snapshot.error_code = error_code_;
  snapshot.terminal_reason = terminal_reason_;
  snapshot.mode = options_.request.mode;
  snapshot.requester = options_.request.requester;
  snapshot.released = released_;
  snapshot.late_events_dropped = late_events_dropped_;
  return snapshot;
}

bool CaptureSession::PostOrReport(SessionInput input) {
  if (queue_->Post(input)) {
    return true;
  }
  ReportLateEvent(input);
  return false;
}

void CaptureSession::ReportLateEvent(const SessionInput& input) {
  const SessionState current = state();
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++late_events_dropped_;
  }

  const std::string session_id = std::to_string(options_.id);
  environment_.logger->Warn("dropped event after session terminated",
                            {{"session_id", session_id},
                             {"input", ToString(input.kind)},
                             {"state", ToString(current)}});

  if (environment_.journal != nullptr) {
    std::string error;
    if (!environment_.journal->EmitLateEventDropped(
            {
                .ts = std::chrono::system_clock::now(),
                .session_id = options_.id,
                .input = ToString(input.kind),
                .state = ToString(current),
            },
            error)) {
      environment_.logger->Warn("journal write failed",
                                {{"session_id", session_id}, {"error", error}});
    }
  }
}

void CaptureSession::Run() {
  while (std::optional<SessionInput> input = queue_->Pop()) {
    Handle(*input);
    if (torn_down_) {
      break;
    }
  }

  // Joins the collector thread; anything it still emits is reported late.
  if (backend_ != nullptr) {
    backend_->Cancel();
    backend_.reset();
  }
  if (timer_ != nullptr) {
    timer_->Cancel();
    timer_.reset();
  }
}

void CaptureSession::Handle(const SessionInput& input) {
  switch (input.kind) {
  case SessionInput::Kind::kStart:
    HandleStart();
    return;
  case SessionInput::Kind::kBackendStarted:
    HandleBackendStarted(input);
    return;
  case SessionInput::Kind::kBackendProgress:
    HandleBackendProgress(input);
    return;
  case SessionInput::Kind::kBackendError:
    HandleBackendError(input);
    return;
  case SessionInput::Kind::kBackendFinished:
    HandleBackendFinished(input);
    return;
  case SessionInput::Kind::kConsentApproved:
    HandleConsentResponse(input, true);
    return;
  case SessionInput::Kind::kConsentDenied:
    HandleConsentResponse(input, false);
    return;
  case SessionInput::Kind::kConsentDeadline:
    HandleConsentDeadline();
    return;
  case SessionInput::Kind::kCancel:
    Terminate(SessionState::kCancelled, std::nullopt, "cancel requested");
    return;
  case SessionInput::Kind::kPeerDied:
    Terminate(SessionState::kCancelled, std::nullopt, "listener died");
    return;
  }
}

void CaptureSession::HandleStart() {
  const std::string session_id = std::to_string(options_.id);
  core::logging::Logger& logger = *environment_.logger;

  if (!options_.consent_required) {
    consent_.MarkNotRequired();
    {
      std::lock_guard<std::mutex> lock(mu_);
      consent_snapshot_ = consent_.decision();
    }
    JournalConsentDecided(options_.consent_waiver.empty() ? "not_required"
                                                          : options_.consent_waiver.c_str());
  } else {
    const Clock::time_point deadline = Clock::now() + options_.consent_timeout;
    consent_.Request(deadline);
    {
      std::lock_guard<std::mutex> lock(mu_);
      consent_deadline_ = deadline;
    }

    std::string error;
    timer_ = std::make_unique<consent::DeadlineTimer>();
    if (!timer_->Start(
            deadline,
            [this]() {
              SessionInput input;
              input.kind = SessionInput::Kind::kConsentDeadline;
              PostOrReport(std::move(input));
            },
            error)) {
      logger.Error("failed to arm consent timer", {{"session_id", session_id}, {"error", error}});
      Terminate(SessionState::kErrored, capture::ListenerErrorCode::kRuntime,
                "consent timer failed: " + error);
      return;
    }

    if (environment_.journal != nullptr &&
        !environment_.journal->EmitConsentRequested(
            {
                .ts = std::chrono::system_clock::now(),
                .session_id = options_.id,
                .timeout_ms = static_cast<std::uint64_t>(options_.consent_timeout.count()),
            },
            error)) {
      logger.Warn("journal write failed", {{"session_id", session_id}, {"error", error}});
    }

    if (environment_.prompt == nullptr) {
      logger.Warn("no consent prompt available; consent will time out",
                  {{"session_id", session_id}});
    } else {
      std::weak_ptr<CaptureSession> weak = weak_from_this();
      error.clear();
      if (environment_.prompt->Request(
              options_.request.requester,
              [weak](bool approved) {
                if (std::shared_ptr<CaptureSession> session = weak.lock()) {
                  session->OnConsentResponse(approved);
                }
              },
              error)) {
        prompt_outstanding_ = true;
      } else {
        logger.Warn("failed to show consent prompt; consent will time out",
                    {{"session_id", session_id}, {"error", error}});
      }
    }
  }

  const bool include_screenshot = capture::ModeIncludesScreenshot(options_.request.mode);
  const backends::CaptureSpec spec{
      .session_id = options_.id,
      .mode = options_.request.mode,
      .include_screenshot = include_screenshot,
  };

  std::string error;
  if (!backend_->Start(spec, staging_.report_sink(),
                       include_screenshot ? &staging_.screenshot_sink() : nullptr,
                       backend_events_, error)) {
    logger.Error("capture backend failed to start",
                 {{"session_id", session_id}, {"error", error}});
    Terminate(SessionState::kErrored, capture::ListenerErrorCode::kRuntime,
              "backend start failed: " + error);
    return;
  }

  logger.Debug("capture backend start requested",
               {{"session_id", session_id}, {"mode", capture::ToString(spec.mode)}});
}

void CaptureSession::HandleBackendStarted(const SessionInput& input) {
  if (state() != SessionState::kRequested) {
    HandleUnexpected(input);
    return;
  }

  SetState(SessionState::kRunning);
  const std::string session_id = std::to_string(options_.id);
  environment_.logger->Info("capture running", {{"session_id", session_id}});

  std::string error;
  if (environment_.journal != nullptr &&
      !environment_.journal->EmitSessionPhase(
          {
              .phase = events::Emitter::SessionPhaseEvent::Phase::kRunning,
              .ts = std::chrono::system_clock::now(),
              .session_id = options_.id,
          },
          error)) {
    environment_.logger->Warn("journal write failed",
                              {{"session_id", session_id}, {"error", error}});
  }
}

void CaptureSession::HandleBackendProgress(const SessionInput& input) {
  if (state() != SessionState::kRunning) {
    HandleUnexpected(input);
    return;
  }

  const EventChannel::Delivery delivery = channel_.Progress(input.progress);
  if (delivery == EventChannel::Delivery::kPeerDead) {
    Terminate(SessionState::kCancelled, std::nullopt, "listener died");
    return;
  }
  if (delivery == EventChannel::Delivery::kDropped) {
    environment_.logger->Debug("progress update dropped",
                               {{"session_id", std::to_string(options_.id)},
                                {"progress", std::to_string(input.progress)}});
    return;
  }

  std::lock_guard<std::mutex> lock(mu_);
  last_progress_ = channel_.last_progress();
}

void CaptureSession::HandleBackendError(const SessionInput& input) {
  const SessionState current = state();
  if (current != SessionState::kRequested && current != SessionState::kRunning) {
    HandleUnexpected(input);
    return;
  }

  environment_.logger->Error("capture backend reported failure",
                             {{"session_id", std::to_string(options_.id)},
                              {"code", capture::ToString(input.error_code)},
                              {"detail", input.detail}});
  staging_.Discard();
  Terminate(SessionState::kErrored, capture::ToListenerError(input.error_code),
            input.detail.empty() ? "backend error" : input.detail);
}

void CaptureSession::HandleBackendFinished(const SessionInput& input) {
  // A collector that never acknowledged is taken as started by its finish.
  if (state() == SessionState::kRequested) {
    HandleBackendStarted(input);
  }
  if (state() != SessionState::kRunning) {
    HandleUnexpected(input);
    return;
  }
  backend_finished_ = true;

  if (consent_.decision() == consent::ConsentDecision::kApproved) {
    DeliverArtifacts();
    return;
  }

  // The deadline may have passed with its timer input still queued.
  if (consent_.IsExpired(Clock::now())) {
    HandleConsentTimedOut();
    return;
  }

  SetState(SessionState::kFinishing);
  const std::string session_id = std::to_string(options_.id);
  environment_.logger->Info("capture finished; waiting for consent",
                            {{"session_id", session_id}});

  std::string error;
  if (environment_.journal != nullptr &&
      !environment_.journal->EmitSessionPhase(
          {
              .phase = events::Emitter::SessionPhaseEvent::Phase::kFinishing,
              .ts = std::chrono::system_clock::now(),
              .session_id = options_.id,
          },
          error)) {
    environment_.logger->Warn("journal write failed",
                              {{"session_id", session_id}, {"error", error}});
  }
}

void CaptureSession::HandleConsentResponse(const SessionInput& input, const bool approved) {
  const consent::ConsentUpdate update =
      approved ? consent_.Approve(Clock::now()) : consent_.Deny(Clock::now());

  switch (update) {
  case consent::ConsentUpdate::kAlreadyDecided:
    environment_.logger->Debug("consent response ignored; decision already final",
                               {{"session_id", std::to_string(options_.id)},
                                {"input", ToString(input.kind)},
                                {"decision", consent::ToString(consent_.decision())}});
    return;
  case consent::ConsentUpdate::kExpired:
    HandleConsentTimedOut();
    return;
  case consent::ConsentUpdate::kApplied:
    break;
  }

  prompt_outstanding_ = false;
  if (timer_ != nullptr) {
    timer_->Cancel();
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    consent_snapshot_ = consent_.decision();
  }
  JournalConsentDecided("prompt");
  environment_.logger->Info("consent decided",
                            {{"session_id", std::to_string(options_.id)},
                             {"decision", consent::ToString(consent_.decision())}});

  if (!approved) {
    staging_.Discard();
    Terminate(SessionState::kErrored, capture::ListenerErrorCode::kUserDeniedConsent,
              "user denied consent");
    return;
  }

  if (state() == SessionState::kFinishing) {
    DeliverArtifacts();
  }
}

void CaptureSession::HandleConsentDeadline() {
  if (consent_.decision() != consent::ConsentDecision::kPending) {
    return;
  }
  // The timer firing is authoritative even if the clock reads a hair early.
  const Clock::time_point now = std::max(Clock::now(), consent_.deadline());
  if (consent_.IsExpired(now)) {
    HandleConsentTimedOut();
  }
}

void CaptureSession::HandleConsentTimedOut() {
  const std::string session_id = std::to_string(options_.id);
  core::logging::Logger& logger = *environment_.logger;

  {
    std::lock_guard<std::mutex> lock(mu_);
    consent_snapshot_ = consent_.decision();
  }
  if (prompt_outstanding_ && environment_.prompt != nullptr) {
    environment_.prompt->Cancel();
  }
  prompt_outstanding_ = false;
  JournalConsentDecided("timer");
  logger.Warn("consent timed out", {{"session_id", session_id}});

  // A complete capture is kept for manual retrieval instead of being shared.
  if (backend_finished_ && !environment_.retained_dir.empty()) {
    artifacts::RetainedArtifactPaths paths;
    std::string error;
    if (artifacts::WriteRetainedArtifacts(staging_, environment_.retained_dir, options_.id, paths,
                                          error)) {
      logger.Info("capture retained for manual retrieval",
                  {{"session_id", session_id}, {"path", paths.session_dir.string()}});
      if (environment_.journal != nullptr &&
          !environment_.journal->EmitArtifactRetained(
              {
                  .ts = std::chrono::system_clock::now(),
                  .session_id = options_.id,
                  .report_path = paths.report_path.string(),
                  .screenshot_path = paths.screenshot_path.string(),
              },
              error)) {
        logger.Warn("journal write failed", {{"session_id", session_id}, {"error", error}});
      }
    } else {
      logger.Error("failed to retain timed-out capture",
                   {{"session_id", session_id}, {"error", error}});
    }
  }

  staging_.Discard();
  Terminate(SessionState::kErrored, capture::ListenerErrorCode::kUserConsentTimedOut,
            "user consent timed out");
}

void CaptureSession::DeliverArtifacts() {
  const std::string session_id = std::to_string(options_.id);
  const artifacts::ArtifactStaging::Snapshot staged = staging_.DebugSnapshot();

  std::string error;
  if (!staging_.DeliverTo(*options_.request.report_sink, options_.request.screenshot_sink,
                          error)) {
    environment_.logger->Error("failed to deliver capture to caller",
                               {{"session_id", session_id}, {"error", error}});
    Terminate(SessionState::kErrored, capture::ListenerErrorCode::kRuntime, error);
    return;
  }

  environment_.logger->Info("capture delivered",
                            {{"session_id", session_id},
                             {"report_bytes", std::to_string(staged.report_bytes)},
                             {"screenshot_bytes", std::to_string(staged.screenshot_bytes)}});
  if (environment_.journal != nullptr &&
      !environment_.journal->EmitArtifactDelivered(
          {
              .ts = std::chrono::system_clock::now(),
              .session_id = options_.id,
              .report_bytes = staged.report_bytes,
              .screenshot_bytes = staged.screenshot_bytes,
          },
          error)) {
    environment_.logger->Warn("journal write failed",
                              {{"session_id", session_id}, {"error", error}});
  }

  Terminate(SessionState::kFinished, std::nullopt, "");
}

void CaptureSession::HandleUnexpected(const SessionInput& input) {
  const SessionState current = state();
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++late_events_dropped_;
  }
  environment_.logger->Warn("dropped event not valid in current state",
                            {{"session_id", std::to_string(options_.id)},
                             {"input", ToString(input.kind)},
                             {"state", ToString(current)}});
}

void CaptureSession::Terminate(const SessionState terminal,
                               const std::optional<capture::ListenerErrorCode> code,
                               std::string reason) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = terminal;
    error_code_ = code;
    terminal_reason_ = std::move(reason);
  }

  EventChannel::Delivery delivery = EventChannel::Delivery::kClosed;
  switch (terminal) {
  case SessionState::kFinished:
    // Runs Teardown through the channel's finished hook.
    delivery = channel_.Finished();
    break;
  case SessionState::kErrored:
    delivery = channel_.Error(code.value_or(capture::ListenerErrorCode::kRuntime));
    break;
  default:
    channel_.Close();
    break;
  }

  if (delivery == EventChannel::Delivery::kPeerDead) {
    environment_.logger->Warn("listener died before terminal callback",
                              {{"session_id", std::to_string(options_.id)},
                               {"state", ToString(terminal)}});
  }

  Teardown();
}

void CaptureSession::Teardown() {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;

  const std::string session_id = std::to_string(options_.id);
  core::logging::Logger& logger = *environment_.logger;

  // Best-effort: the collector may already be done, or may ignore this.
  if (backend_ != nullptr) {
    backend_->Cancel();
  }
  if (timer_ != nullptr) {
    timer_->Cancel();
  }
  if (prompt_outstanding_ && environment_.prompt != nullptr) {
    environment_.prompt->Cancel();
  }
  prompt_outstanding_ = false;
  staging_.Discard();

  for (const SessionInput& pending : queue_->Close()) {
    ReportLateEvent(pending);
  }

  SessionState terminal = SessionState::kCancelled;
  std::optional<capture::ListenerErrorCode> code;
  std::string reason;
  {
    std::lock_guard<std::mutex> lock(mu_);
    terminal = state_;
    code = error_code_;
    reason = terminal_reason_;
  }
  const std::uint64_t duration_ms = ElapsedMillis(admitted_at_);

  logger.Info("session ended", {{"session_id", session_id},
                                {"state", ToString(terminal)},
                                {"error_code", code.has_value() ? capture::ToString(*code) : ""},
                                {"reason", reason},
                                {"duration_ms", std::to_string(duration_ms)}});

  std::string error;
  if (environment_.journal != nullptr &&
      !environment_.journal->EmitSessionTerminal(
          {
              .kind = ToTerminalKind(terminal),
              .ts = std::chrono::system_clock::now(),
              .session_id = options_.id,
              .error_code = code.has_value() ? std::string(capture::ToString(*code)) : "",
              .reason = reason,
              .duration_ms = duration_ms,
          },
          error)) {
    logger.Warn("journal write failed", {{"session_id", session_id}, {"error", error}});
  }

  if (release_) {
    release_(options_.id);
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    released_ = true;
  }
  released_cv_.notify_all();
}

void CaptureSession::JournalConsentDecided(const char* source) {
  if (environment_.journal == nullptr) {
    return;
  }
  std::string error;
  if (!environment_.journal->EmitConsentDecided(
          {
              .ts = std::chrono::system_clock::now(),
              .session_id = options_.id,
              .decision = consent::ToString(consent_.decision()),
              .source = source,
          },
          error)) {
    environment_.logger->Warn("journal write failed",
                              {{"session_id", std::to_string(options_.id)}, {"error", error}});
  }
}

SessionState CaptureSession::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

void CaptureSession::SetState(const SessionState state) {
  std::lock_guard<std::mutex> lock(mu_);
  state_ = state;
}

} // namespace bugreportd::session
