#pragma once

#include "capture/byte_sink.hpp"
#include "capture/capture_request.hpp"
#include "capture/status_codes.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace bugreportd::backends {

using BackendConfig = std::map<std::string, std::string>;

// What the session asks the collector to produce.
struct CaptureSpec {
  std::uint64_t session_id = 0;
  capture::CaptureMode mode = capture::CaptureMode::kDefault;
  bool include_screenshot = false;
};

// Asynchronous notifications from a running collector. Callable from any
// thread; implementations hand them to the session's serialized context.
class IBackendEventSink {
public:
  virtual ~IBackendEventSink() = default;

  virtual void OnStarted() = 0;
  virtual void OnProgress(float percent) = 0;
  virtual void OnError(capture::BackendErrorCode code, const std::string& detail) = 0;
  virtual void OnFinished() = 0;
};

// Diagnostic collector contract consumed by capture sessions.
//
// Contract:
// - `Start` returns promptly. The collector acknowledges through
//   `OnStarted`, then reports progress and exactly one of error/finished.
//   Progress before the ack is dropped; a finish before the ack counts as
//   both.
// - All artifact bytes go to the sinks passed to `Start`; the sinks and the
//   event sink outlive the collector's work (the session destroys the
//   collector before them).
// - `Cancel` is best-effort and idempotent; a collector may still emit
//   events afterwards, which the session drops.
// - Destruction stops any collector threads.
class ICaptureBackend {
public:
  virtual ~ICaptureBackend() = default;

  // Updates one collector parameter before start.
  virtual bool SetParam(const std::string& key, const std::string& value, std::string& error) = 0;

  // Returns current collector parameter snapshot.
  virtual BackendConfig DumpConfig() const = 0;

  virtual bool Start(const CaptureSpec& spec, capture::IByteSink& report_sink,
                     capture::IByteSink* screenshot_sink, IBackendEventSink& events,
                     std::string& error) = 0;

  virtual void Cancel() = 0;
};

// Builds a fresh collector for each admitted session.
using BackendFactory = std::function<std::unique_ptr<ICaptureBackend>()>;

} // namespace bugreportd::backends
