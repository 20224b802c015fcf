#pragma once

#include "capture/status_codes.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace bugreportd::session {

// Caller-side callback object. Each method returns false when the peer is
// gone (for a remote listener: the transport reported the call as failed).
class ICaptureListener {
public:
  virtual ~ICaptureListener() = default;

  virtual bool OnProgress(float percent) = 0;
  virtual bool OnError(capture::ListenerErrorCode code) = 0;
  virtual bool OnFinished() = 0;
};

// Ordered delivery of one session's notifications to its listener.
//
// Guarantees:
// - progress values are clamped to [0, 100] and never decrease; NaN and
//   regressions are dropped
// - exactly one terminal notification (error or finished); the channel is
//   closed afterwards and drops everything
// - a failed delivery marks the peer dead and closes the channel
// - after onFinished the teardown hook runs
//
// Not thread-safe: only the owning session worker calls it.
class EventChannel {
public:
  using TeardownHook = std::function<void()>;

  enum class Delivery {
    kDelivered,
    // Filtered out (regression, NaN); the channel stays open.
    kDropped,
    // Delivery failed; the peer is gone and the channel is now closed.
    kPeerDead,
    // The channel was already closed; nothing was sent.
    kClosed,
  };

  EventChannel(std::shared_ptr<ICaptureListener> listener, TeardownHook on_finished);

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  Delivery Progress(float percent);
  Delivery Error(capture::ListenerErrorCode code);
  Delivery Finished();

  // Closes without notifying the listener (cancel and peer death).
  void Close();

  bool closed() const {
    return closed_;
  }

  bool peer_dead() const {
    return peer_dead_;
  }

  bool terminal_delivered() const {
    return terminal_delivered_;
  }

  // -1 until the first progress notification.
  float last_progress() const {
    return last_progress_;
  }

  std::uint64_t progress_delivered() const {
    return progress_delivered_;
  }

private:
  Delivery MarkPeerDead();

  std::shared_ptr<ICaptureListener> listener_;
  TeardownHook on_finished_;
  bool closed_ = false;
  bool peer_dead_ = false;
  bool terminal_delivered_ = false;
  float last_progress_ = -1.0F;
  std::uint64_t progress_delivered_ = 0;
};

const char* ToString(EventChannel::Delivery delivery);

} // namespace bugreportd::session
