#include "consent/deadline_timer.hpp"

#include <utility>

namespace bugreportd::consent {

DeadlineTimer::~DeadlineTimer() {
  Cancel();
  if (!thread_.joinable()) {
    return;
  }
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
    return;
  }
  thread_.join();
}

bool DeadlineTimer::Start(const Clock::time_point deadline, std::function<void()> on_expired,
                          std::string& error) {
  if (!on_expired) {
    error = "deadline timer requires a callback";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (armed_) {
    error = "deadline timer already armed";
    return false;
  }
  deadline_ = deadline;
  on_expired_ = std::move(on_expired);
  armed_ = true;
  thread_ = std::thread([this]() { Run(); });
  return true;
}

void DeadlineTimer::Cancel() {
  std::unique_lock<std::mutex> lock(mu_);
  cancelled_ = true;
  cv_.notify_all();
  // Wait out a callback already in flight so "cancelled" really means no
  // further callback, unless we are the callback.
  if (firing_ && thread_.get_id() != std::this_thread::get_id()) {
    fire_done_cv_.wait(lock, [this]() { return !firing_; });
  }
}

void DeadlineTimer::Run() {
  std::function<void()> callback;
  {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_until(lock, deadline_, [this]() { return cancelled_; });
    if (cancelled_) {
      return;
    }
    fired_ = true;
    firing_ = true;
    callback = std::move(on_expired_);
  }

  callback();

  std::lock_guard<std::mutex> lock(mu_);
  firing_ = false;
  fire_done_cv_.notify_all();
}

DeadlineTimer::Snapshot DeadlineTimer::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .armed = armed_,
      .cancelled = cancelled_,
      .fired = fired_,
  };
}

} // namespace bugreportd::consent
