#pragma once

#include "capture/status_codes.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bugreportd::session {

// Everything that can happen to a session, in the order it is processed.
struct SessionInput {
  enum class Kind {
    kStart,
    kBackendStarted,
    kBackendProgress,
    kBackendError,
    kBackendFinished,
    kConsentApproved,
    kConsentDenied,
    kConsentDeadline,
    kCancel,
    kPeerDied,
  };

  Kind kind = Kind::kStart;
  float progress = 0.0F;
  capture::BackendErrorCode error_code = capture::BackendErrorCode::kRuntime;
  std::string detail;
};

const char* ToString(SessionInput::Kind kind);

// Multi-producer single-consumer queue feeding one session worker. Backend
// threads, the consent timer, the prompt and the registry post; only the
// worker pops.
class SessionQueue {
public:
  SessionQueue() = default;

  SessionQueue(const SessionQueue&) = delete;
  SessionQueue& operator=(const SessionQueue&) = delete;

  // Returns false once the queue is closed; the input is not enqueued.
  bool Post(SessionInput input) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(input));
      ++posted_;
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until an input is available. nullopt once closed and drained.
  std::optional<SessionInput> Pop() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    SessionInput input = std::move(items_.front());
    items_.pop_front();
    return input;
  }

  // Closes the queue and hands back whatever was still pending.
  std::vector<SessionInput> Close() {
    std::vector<SessionInput> pending;
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
      pending.assign(std::make_move_iterator(items_.begin()),
                     std::make_move_iterator(items_.end()));
      items_.clear();
    }
    cv_.notify_all();
    return pending;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::uint64_t posted() const {
    std::lock_guard<std::mutex> lock(mu_);
    return posted_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<SessionInput> items_;
  bool closed_ = false;
  std::uint64_t posted_ = 0;
};

} // namespace bugreportd::session
