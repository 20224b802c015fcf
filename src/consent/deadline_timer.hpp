#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace bugreportd::consent {

// One-shot cancellable timer running on its own thread. The callback runs on
// the timer thread at most once; it should only hand the expiry over to the
// owner's serialized context (post an input), never mutate shared state.
class DeadlineTimer {
public:
  using Clock = std::chrono::steady_clock;

  DeadlineTimer() = default;
  ~DeadlineTimer();

  DeadlineTimer(const DeadlineTimer&) = delete;
  DeadlineTimer& operator=(const DeadlineTimer&) = delete;
  DeadlineTimer(DeadlineTimer&&) = delete;
  DeadlineTimer& operator=(DeadlineTimer&&) = delete;

  // Arms the timer. Fails if it was already armed once.
  bool Start(Clock::time_point deadline, std::function<void()> on_expired, std::string& error);

  // Disarms the timer without waiting for the thread. Idempotent. After
  // Cancel returns the callback has either already run or never will.
  void Cancel();

  struct Snapshot {
    bool armed = false;
    bool cancelled = false;
    bool fired = false;
  };

  Snapshot DebugSnapshot() const;

private:
  void Run();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  Clock::time_point deadline_{};
  std::function<void()> on_expired_;
  bool armed_ = false;
  bool cancelled_ = false;
  bool fired_ = false;
  bool firing_ = false;
  std::condition_variable fire_done_cv_;
  std::thread thread_;
};

} // namespace bugreportd::consent
