#ifndef BUGREPORTD_TESTS_COMMON_CAPTURE_FIXTURES_HPP_
#define BUGREPORTD_TESTS_COMMON_CAPTURE_FIXTURES_HPP_

#include "assertions.hpp"
#include "backends/capture_backend.hpp"
#include "capture/byte_sink.hpp"
#include "capture/status_codes.hpp"
#include "consent/consent_prompt.hpp"
#include "session/event_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace bugreportd::tests::common {

inline bool WaitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5'000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

// In-memory caller sink. Thread-safe so a test can inspect it while a
// session may still be writing.
class StringSink final : public capture::IByteSink {
public:
  bool Write(std::string_view bytes, std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++write_calls_;
    if (fail_writes_) {
      error = "sink rejected write";
      return false;
    }
    bytes_.append(bytes.data(), bytes.size());
    return true;
  }

  void set_fail_writes(bool fail) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_writes_ = fail;
  }

  std::string bytes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return bytes_;
  }

  std::uint64_t write_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return write_calls_;
  }

private:
  mutable std::mutex mu_;
  std::string bytes_;
  bool fail_writes_ = false;
  std::uint64_t write_calls_ = 0;
};

// Records every notification in arrival order.
class RecordingListener final : public session::ICaptureListener {
public:
  struct Notification {
    enum class Kind {
      kProgress,
      kError,
      kFinished,
    };

    Kind kind = Kind::kProgress;
    float progress = 0.0F;
    capture::ListenerErrorCode code = capture::ListenerErrorCode::kRuntime;
  };

  bool OnProgress(float percent) override {
    return Record({.kind = Notification::Kind::kProgress, .progress = percent});
  }

  bool OnError(capture::ListenerErrorCode code) override {
    return Record({.kind = Notification::Kind::kError, .code = code});
  }

  bool OnFinished() override {
    return Record({.kind = Notification::Kind::kFinished});
  }

  // A dead listener reports every delivery as failed, like a remote peer
  // whose process went away.
  void set_alive(bool alive) {
    std::lock_guard<std::mutex> lock(mu_);
    alive_ = alive;
  }

  bool WaitForTerminal(std::chrono::milliseconds timeout = std::chrono::milliseconds(5'000)) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return terminal_count_ > 0U; });
  }

  std::vector<Notification> notifications() const {
    std::lock_guard<std::mutex> lock(mu_);
    return notifications_;
  }

  std::vector<float> progress_values() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<float> values;
    for (const Notification& notification : notifications_) {
      if (notification.kind == Notification::Kind::kProgress) {
        values.push_back(notification.progress);
      }
    }
    return values;
  }

  std::size_t terminal_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return terminal_count_;
  }

  bool finished() const {
    std::lock_guard<std::mutex> lock(mu_);
    return !notifications_.empty() &&
           notifications_.back().kind == Notification::Kind::kFinished;
  }

  std::optional<capture::ListenerErrorCode> error_code() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (notifications_.empty() || notifications_.back().kind != Notification::Kind::kError) {
      return std::nullopt;
    }
    return notifications_.back().code;
  }

  // Notifications that arrived after the first terminal one.
  std::size_t after_terminal_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return after_terminal_;
  }

private:
  bool Record(const Notification& notification) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!alive_) {
        return false;
      }
      if (terminal_count_ > 0U) {
        ++after_terminal_;
      }
      notifications_.push_back(notification);
      if (notification.kind != Notification::Kind::kProgress) {
        ++terminal_count_;
      }
    }
    cv_.notify_all();
    return true;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool alive_ = true;
  std::vector<Notification> notifications_;
  std::size_t terminal_count_ = 0;
  std::size_t after_terminal_ = 0;
};

// State shared between a test and the ScriptedBackend a session owns. The
// test plays the collector thread: it writes artifacts and emits events.
class ScriptedBackendState {
public:
  bool EmitStarted() {
    return WithEvents([](backends::IBackendEventSink& events) { events.OnStarted(); });
  }

  bool EmitProgress(float percent) {
    return WithEvents([percent](backends::IBackendEventSink& events) {
      events.OnProgress(percent);
    });
  }

  bool EmitError(capture::BackendErrorCode code, const std::string& detail = "scripted failure") {
    return WithEvents([code, &detail](backends::IBackendEventSink& events) {
      events.OnError(code, detail);
    });
  }

  bool EmitFinished() {
    return WithEvents([](backends::IBackendEventSink& events) { events.OnFinished(); });
  }

  bool WriteReport(std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mu_);
    std::string error;
    return report_sink_ != nullptr && report_sink_->Write(bytes, error);
  }

  bool WriteScreenshot(std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mu_);
    std::string error;
    return screenshot_sink_ != nullptr && screenshot_sink_->Write(bytes, error);
  }

  bool WaitForStart(std::chrono::milliseconds timeout = std::chrono::milliseconds(5'000)) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return start_calls_ > 0U; });
  }

  void set_fail_start(bool fail) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_start_ = fail;
  }

  std::uint64_t start_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return start_calls_;
  }

  std::uint64_t cancel_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cancel_calls_;
  }

  bool destroyed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return destroyed_;
  }

  backends::CaptureSpec spec() const {
    std::lock_guard<std::mutex> lock(mu_);
    return spec_;
  }

  bool screenshot_sink_provided() const {
    std::lock_guard<std::mutex> lock(mu_);
    return screenshot_sink_ != nullptr;
  }

private:
  friend class ScriptedBackend;

  bool WithEvents(const std::function<void(backends::IBackendEventSink&)>& emit) {
    std::lock_guard<std::mutex> lock(mu_);
    if (events_ == nullptr) {
      return false;
    }
    emit(*events_);
    return true;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  backends::IBackendEventSink* events_ = nullptr;
  capture::IByteSink* report_sink_ = nullptr;
  capture::IByteSink* screenshot_sink_ = nullptr;
  backends::CaptureSpec spec_;
  bool fail_start_ = false;
  bool destroyed_ = false;
  std::uint64_t start_calls_ = 0;
  std::uint64_t cancel_calls_ = 0;
};

class ScriptedBackend final : public backends::ICaptureBackend {
public:
  explicit ScriptedBackend(std::shared_ptr<ScriptedBackendState> state)
      : state_(std::move(state)) {}

  ~ScriptedBackend() override {
    std::lock_guard<std::mutex> lock(state_->mu_);
    state_->events_ = nullptr;
    state_->report_sink_ = nullptr;
    state_->screenshot_sink_ = nullptr;
    state_->destroyed_ = true;
  }

  bool SetParam(const std::string& key, const std::string& value, std::string& error) override {
    if (key.empty() || value.empty()) {
      error = "parameter key and value cannot be empty";
      return false;
    }
    params_[key] = value;
    return true;
  }

  backends::BackendConfig DumpConfig() const override {
    return params_;
  }

  bool Start(const backends::CaptureSpec& spec, capture::IByteSink& report_sink,
             capture::IByteSink* screenshot_sink, backends::IBackendEventSink& events,
             std::string& error) override {
    {
      std::lock_guard<std::mutex> lock(state_->mu_);
      ++state_->start_calls_;
      state_->spec_ = spec;
      if (state_->fail_start_) {
        error = "scripted start failure";
      } else {
        state_->events_ = &events;
        state_->report_sink_ = &report_sink;
        state_->screenshot_sink_ = screenshot_sink;
      }
    }
    state_->cv_.notify_all();
    return error.empty();
  }

  void Cancel() override {
    std::lock_guard<std::mutex> lock(state_->mu_);
    ++state_->cancel_calls_;
  }

private:
  std::shared_ptr<ScriptedBackendState> state_;
  backends::BackendConfig params_;
};

inline backends::BackendFactory MakeScriptedFactory(std::shared_ptr<ScriptedBackendState> state) {
  return [state]() -> std::unique_ptr<backends::ICaptureBackend> {
    return std::make_unique<ScriptedBackend>(state);
  };
}

// Consent UI double: the test decides when (and whether) to answer.
class ManualConsentPrompt final : public consent::IConsentPrompt {
public:
  bool Request(const capture::Principal& requester, consent::ConsentResponder responder,
               std::string& error) override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++request_calls_;
      if (fail_requests_) {
        error = "prompt unavailable";
        return false;
      }
      last_requester_ = requester;
      responder_ = std::move(responder);
    }
    cv_.notify_all();
    return true;
  }

  void Cancel() override {
    std::lock_guard<std::mutex> lock(mu_);
    ++cancel_calls_;
  }

  // Answers the most recent prompt. Returns false when nothing was asked.
  bool Respond(bool approved) {
    consent::ConsentResponder responder;
    {
      std::lock_guard<std::mutex> lock(mu_);
      responder = responder_;
    }
    if (!responder) {
      return false;
    }
    responder(approved);
    return true;
  }

  bool WaitForRequest(std::chrono::milliseconds timeout = std::chrono::milliseconds(5'000)) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return static_cast<bool>(responder_); });
  }

  void set_fail_requests(bool fail) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_requests_ = fail;
  }

  std::uint64_t request_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return request_calls_;
  }

  std::uint64_t cancel_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cancel_calls_;
  }

  capture::Principal last_requester() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_requester_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  consent::ConsentResponder responder_;
  capture::Principal last_requester_;
  bool fail_requests_ = false;
  std::uint64_t request_calls_ = 0;
  std::uint64_t cancel_calls_ = 0;
};

} // namespace bugreportd::tests::common

#endif // BUGREPORTD_TESTS_COMMON_CAPTURE_FIXTURES_HPP_
