#include "session/session_registry.hpp"

#include <utility>

namespace bugreportd::session {

SessionRegistry::SessionRegistry(SessionFactory factory) : factory_(std::move(factory)) {}

SessionRegistry::~SessionRegistry() {
  Shutdown();
}

capture::AdmissionStatus SessionRegistry::Admit(const capture::CaptureRequest& request,
                                                std::shared_ptr<ICaptureListener> listener,
                                                SessionId& handle, std::string& error) {
  ReapRetired();

  std::lock_guard<std::mutex> lock(mu_);
  if (shut_down_) {
    error = "capture service is shutting down";
    return capture::AdmissionStatus::kAlreadyActive;
  }
  if (active_ != nullptr) {
    ++rejected_already_active_;
    error = "bugreport already in progress (session " + std::to_string(active_->id()) + ")";
    return capture::AdmissionStatus::kAlreadyActive;
  }
  if (listener == nullptr) {
    error = "capture listener is required";
    return capture::AdmissionStatus::kInvalidInput;
  }

  const SessionId id = next_id_++;
  std::shared_ptr<CaptureSession> session =
      factory_(id, request, std::move(listener), [this](SessionId released) { Release(released); });
  if (session == nullptr) {
    error = "failed to create capture session";
    return capture::AdmissionStatus::kInvalidInput;
  }

  // The worker may already be running when the lock drops; its Release call
  // then waits for this admission to finish.
  active_ = session;
  if (!session->Launch(error)) {
    active_.reset();
    return capture::AdmissionStatus::kInvalidInput;
  }

  ++admitted_;
  handle = id;
  return capture::AdmissionStatus::kAdmitted;
}

capture::CancelStatus SessionRegistry::Cancel(const SessionId handle) {
  std::lock_guard<std::mutex> lock(mu_);
  if (active_ == nullptr || active_->id() != handle) {
    return capture::CancelStatus::kNoActiveSession;
  }
  // A session that terminated between its last event and this call has a
  // closed queue; that is still a no-op.
  if (!active_->RequestCancel()) {
    return capture::CancelStatus::kNoActiveSession;
  }
  return capture::CancelStatus::kCancelRequested;
}

bool SessionRegistry::NotifyPeerDied(const SessionId handle) {
  std::lock_guard<std::mutex> lock(mu_);
  if (active_ == nullptr || active_->id() != handle) {
    return false;
  }
  return active_->NotifyPeerDied();
}

void SessionRegistry::Release(const SessionId handle) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (active_ == nullptr || active_->id() != handle) {
      return;
    }
    retired_.push_back(std::move(active_));
    active_.reset();
    ++released_;
  }
  idle_cv_.notify_all();
}

std::shared_ptr<CaptureSession> SessionRegistry::Find(const SessionId handle) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (active_ == nullptr || active_->id() != handle) {
    return nullptr;
  }
  return active_;
}

std::shared_ptr<CaptureSession> SessionRegistry::Active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

bool SessionRegistry::WaitForIdle(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return active_ == nullptr; });
}

void SessionRegistry::ReapRetired() {
  std::vector<std::shared_ptr<CaptureSession>> retired;
  {
    std::lock_guard<std::mutex> lock(mu_);
    retired = TakeRetiredLocked();
  }
  JoinAll(retired);
}

void SessionRegistry::Shutdown() {
  std::shared_ptr<CaptureSession> active;
  std::vector<std::shared_ptr<CaptureSession>> retired;
  {
    std::lock_guard<std::mutex> lock(mu_);
    shut_down_ = true;
    active = active_;
    retired = TakeRetiredLocked();
  }

  if (active != nullptr) {
    active->RequestCancel();
    active->Join();
  }
  JoinAll(retired);
  ReapRetired();
}

SessionRegistry::Snapshot SessionRegistry::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .active = active_ != nullptr,
      .active_id = active_ != nullptr ? active_->id() : 0,
      .last_id = next_id_ - 1,
      .admitted = admitted_,
      .rejected_already_active = rejected_already_active_,
      .released = released_,
      .retired = retired_.size(),
      .shut_down = shut_down_,
  };
}

std::vector<std::shared_ptr<CaptureSession>> SessionRegistry::TakeRetiredLocked() {
  std::vector<std::shared_ptr<CaptureSession>> retired;
  retired.swap(retired_);
  return retired;
}

void SessionRegistry::JoinAll(const std::vector<std::shared_ptr<CaptureSession>>& sessions) {
  for (const auto& session : sessions) {
    session->Join();
  }
}

} // namespace bugreportd::session
