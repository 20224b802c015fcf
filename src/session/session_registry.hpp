#pragma once

#include "capture/capture_request.hpp"
#include "capture/status_codes.hpp"
#include "session/capture_session.hpp"
#include "session/event_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bugreportd::session {

// Builds the session for an admitted request. Runs under the registry lock,
// so it must not call back into the registry.
using SessionFactory = std::function<std::shared_ptr<CaptureSession>(
    SessionId id, const capture::CaptureRequest& request,
    std::shared_ptr<ICaptureListener> listener, CaptureSession::ReleaseHook release)>;

// Process-wide slot holding at most one active capture session.
//
// Admission, release and cancel all go through one mutex, so two sessions
// can never be admitted concurrently. Terminated sessions are parked as
// retired until their worker threads are joined.
class SessionRegistry {
public:
  explicit SessionRegistry(SessionFactory factory);
  ~SessionRegistry();

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Admits and launches a session, or reports why not. `handle` is set only
  // for kAdmitted. Validation is the caller's job; this only enforces the
  // single-session slot.
  capture::AdmissionStatus Admit(const capture::CaptureRequest& request,
                                 std::shared_ptr<ICaptureListener> listener, SessionId& handle,
                                 std::string& error);

  // Requests cancellation of the active session. A stale or terminated
  // handle is a no-op reported as kNoActiveSession.
  capture::CancelStatus Cancel(SessionId handle);

  // Forwards a transport death notification. Stale handles are ignored.
  bool NotifyPeerDied(SessionId handle);

  // Frees the slot held by `handle`. Idempotent; stale handles are ignored.
  // Called by the session itself on terminal transition.
  void Release(SessionId handle);

  // The active session, if `handle` still names it.
  std::shared_ptr<CaptureSession> Find(SessionId handle) const;
  std::shared_ptr<CaptureSession> Active() const;

  // Blocks until no session is active or the timeout elapsed.
  bool WaitForIdle(std::chrono::milliseconds timeout) const;

  // Joins worker threads of terminated sessions.
  void ReapRetired();

  // Cancels the active session and joins every session thread. Later Admit
  // calls are rejected.
  void Shutdown();

  struct Snapshot {
    bool active = false;
    SessionId active_id = 0;
    SessionId last_id = 0;
    std::uint64_t admitted = 0;
    std::uint64_t rejected_already_active = 0;
    std::uint64_t released = 0;
    std::size_t retired = 0;
    bool shut_down = false;
  };

  Snapshot DebugSnapshot() const;

private:
  std::vector<std::shared_ptr<CaptureSession>> TakeRetiredLocked();
  static void JoinAll(const std::vector<std::shared_ptr<CaptureSession>>& sessions);

  const SessionFactory factory_;

  mutable std::mutex mu_;
  mutable std::condition_variable idle_cv_;
  std::shared_ptr<CaptureSession> active_;
  std::vector<std::shared_ptr<CaptureSession>> retired_;
  SessionId next_id_ = 1;
  std::uint64_t admitted_ = 0;
  std::uint64_t rejected_already_active_ = 0;
  std::uint64_t released_ = 0;
  bool shut_down_ = false;
};

} // namespace bugreportd::session
