#include "session/event_channel.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace bugreportd::session {

const char* ToString(const EventChannel::Delivery delivery) {
  switch (delivery) {
  case EventChannel::Delivery::kDelivered:
    return "delivered";
  case EventChannel::Delivery::kDropped:
    return "dropped";
  case EventChannel::Delivery::kPeerDead:
    return "peer_dead";
  case EventChannel::Delivery::kClosed:
    return "closed";
  }
  return "closed";
}

EventChannel::EventChannel(std::shared_ptr<ICaptureListener> listener, TeardownHook on_finished)
    : listener_(std::move(listener)), on_finished_(std::move(on_finished)) {
  if (listener_ == nullptr) {
    closed_ = true;
  }
}

EventChannel::Delivery EventChannel::Progress(const float percent) {
  if (closed_) {
    return Delivery::kClosed;
  }
  if (std::isnan(percent)) {
    return Delivery::kDropped;
  }

  const float clamped = std::clamp(percent, 0.0F, 100.0F);
  if (clamped < last_progress_) {
    return Delivery::kDropped;
  }

  if (!listener_->OnProgress(clamped)) {
    return MarkPeerDead();
  }
  last_progress_ = clamped;
  ++progress_delivered_;
  return Delivery::kDelivered;
}

EventChannel::Delivery EventChannel::Error(const capture::ListenerErrorCode code) {
  if (closed_) {
    return Delivery::kClosed;
  }

  const bool delivered = listener_->OnError(code);
  closed_ = true;
  listener_.reset();
  if (!delivered) {
    peer_dead_ = true;
    return Delivery::kPeerDead;
  }
  terminal_delivered_ = true;
  return Delivery::kDelivered;
}

EventChannel::Delivery EventChannel::Finished() {
  if (closed_) {
    return Delivery::kClosed;
  }

  const bool delivered = listener_->OnFinished();
  closed_ = true;
  listener_.reset();
  if (delivered) {
    terminal_delivered_ = true;
  } else {
    peer_dead_ = true;
  }

  // Finished sessions never linger: tear the session and collector down
  // right after the listener has been told.
  if (on_finished_) {
    TeardownHook hook = std::move(on_finished_);
    on_finished_ = nullptr;
    hook();
  }
  return delivered ? Delivery::kDelivered : Delivery::kPeerDead;
}

void EventChannel::Close() {
  closed_ = true;
  listener_.reset();
}

EventChannel::Delivery EventChannel::MarkPeerDead() {
  peer_dead_ = true;
  Close();
  return Delivery::kPeerDead;
}

} // namespace bugreportd::session
