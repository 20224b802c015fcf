#pragma once

#include "artifacts/artifact_staging.hpp"
#include "backends/capture_backend.hpp"
#include "capture/capture_request.hpp"
#include "capture/status_codes.hpp"
#include "consent/consent_gate.hpp"
#include "consent/consent_prompt.hpp"
#include "consent/deadline_timer.hpp"
#include "session/event_channel.hpp"
#include "session/session_queue.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace bugreportd::core::logging {
class Logger;
}

namespace bugreportd::events {
class Emitter;
}

namespace bugreportd::session {

using SessionId = std::uint64_t;

enum class SessionState {
  kRequested,
  kRunning,
  kFinishing,
  kFinished,
  kErrored,
  kCancelled,
};

const char* ToString(SessionState state);
bool IsTerminal(SessionState state);

// Collaborators shared by every session. Owned by the service, which outlives
// all sessions it creates.
struct SessionEnvironment {
  core::logging::Logger* logger = nullptr;
  // Null disables journaling.
  events::Emitter* journal = nullptr;
  // Null means nobody is asked; a required consent then times out.
  consent::IConsentPrompt* prompt = nullptr;
  // Empty means timed-out artifacts are discarded.
  std::filesystem::path retained_dir;
};

struct SessionOptions {
  SessionId id = 0;
  capture::CaptureRequest request;
  bool consent_required = true;
  // Journal source recorded when consent is not required ("exempt", "not_required").
  std::string consent_waiver;
  std::chrono::milliseconds consent_timeout{30'000};
};

// One in-flight capture.
//
// Every state transition and every listener callback happens on the
// session's own worker thread, fed by a SessionQueue. Backend threads, the
// consent timer, the consent prompt and the registry only post inputs.
//
// On entering a terminal state the session, in this order:
// - delivers the terminal callback (none for cancel and peer death)
// - cancels the collector, the consent timer and any outstanding prompt
// - closes its queue and logs inputs still pending as late events
// - releases its registry slot through the release hook
class CaptureSession : public std::enable_shared_from_this<CaptureSession> {
public:
  using ReleaseHook = std::function<void(SessionId)>;

  static std::shared_ptr<CaptureSession> Create(SessionOptions options,
                                                std::shared_ptr<ICaptureListener> listener,
                                                std::unique_ptr<backends::ICaptureBackend> backend,
                                                SessionEnvironment environment,
                                                ReleaseHook release);
  ~CaptureSession();

  CaptureSession(const CaptureSession&) = delete;
  CaptureSession& operator=(const CaptureSession&) = delete;

  // Starts the worker and queues the start input. Called once.
  bool Launch(std::string& error);

  // Thread-safe inputs. Each returns false once the session has terminated.
  bool RequestCancel();
  bool NotifyPeerDied();
  bool OnConsentResponse(bool approved);

  // Blocks until the session released its slot, or the timeout elapsed.
  bool WaitForRelease(std::chrono::milliseconds timeout) const;

  // Joins the worker thread. No-op from the worker thread itself.
  void Join();

  SessionId id() const {
    return options_.id;
  }

  const capture::CaptureRequest& request() const {
    return options_.request;
  }

  struct Snapshot {
    SessionId id = 0;
    SessionState state = SessionState::kRequested;
    consent::ConsentDecision consent = consent::ConsentDecision::kPending;
    bool consent_required = true;
    long long consent_remaining_ms = 0;
    float last_progress = -1.0F;
    std::optional<capture::ListenerErrorCode> error_code;
    std::string terminal_reason;
    capture::CaptureMode mode = capture::CaptureMode::kDefault;
    capture::Principal requester;
    bool released = false;
    std::uint64_t late_events_dropped = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  using Clock = std::chrono::steady_clock;

  // Adapts collector notifications into queued inputs.
  class BackendEvents final : public backends::IBackendEventSink {
  public:
    explicit BackendEvents(CaptureSession& session) : session_(session) {}

    void OnStarted() override;
    void OnProgress(float percent) override;
    void OnError(capture::BackendErrorCode code, const std::string& detail) override;
    void OnFinished() override;

  private:
    CaptureSession& session_;
  };

  CaptureSession(SessionOptions options, std::shared_ptr<ICaptureListener> listener,
                 std::unique_ptr<backends::ICaptureBackend> backend,
                 SessionEnvironment environment, ReleaseHook release);

  // Posts to the queue, or reports the input as dropped after termination.
  bool PostOrReport(SessionInput input);
  void ReportLateEvent(const SessionInput& input);

  void Run();
  void Handle(const SessionInput& input);
  void HandleStart();
  void HandleBackendStarted(const SessionInput& input);
  void HandleBackendProgress(const SessionInput& input);
  void HandleBackendError(const SessionInput& input);
  void HandleBackendFinished(const SessionInput& input);
  void HandleConsentResponse(const SessionInput& input, bool approved);
  void HandleConsentDeadline();
  void HandleConsentTimedOut();
  void DeliverArtifacts();
  void HandleUnexpected(const SessionInput& input);

  void Terminate(SessionState terminal, std::optional<capture::ListenerErrorCode> code,
                 std::string reason);
  void Teardown();
  void JournalConsentDecided(const char* source);

  SessionState state() const;
  void SetState(SessionState state);

  const SessionOptions options_;
  const SessionEnvironment environment_;
  const ReleaseHook release_;
  const Clock::time_point admitted_at_;

  std::unique_ptr<backends::ICaptureBackend> backend_;
  BackendEvents backend_events_;
  artifacts::ArtifactStaging staging_;
  std::shared_ptr<SessionQueue> queue_;

  // Touched only on the worker thread.
  EventChannel channel_;
  consent::ConsentGate consent_;
  std::unique_ptr<consent::DeadlineTimer> timer_;
  bool prompt_outstanding_ = false;
  bool backend_finished_ = false;
  bool torn_down_ = false;

  mutable std::mutex mu_;
  mutable std::condition_variable released_cv_;
  SessionState state_ = SessionState::kRequested;
  consent::ConsentDecision consent_snapshot_ = consent::ConsentDecision::kPending;
  Clock::time_point consent_deadline_{};
  float last_progress_ = -1.0F;
  std::optional<capture::ListenerErrorCode> error_code_;
  std::string terminal_reason_;
  bool released_ = false;
  bool launched_ = false;
  std::uint64_t late_events_dropped_ = 0;

  std::mutex join_mu_;
  std::thread worker_;
};

} // namespace bugreportd::session
