#pragma once

#include "backends/capture_backend.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace bugreportd::backends::sim {

// Deterministic, device-free collector.
//
// Runs the capture on its own thread: acknowledges start, writes one report
// section per step and reports `100*i/steps` progress, writes a screenshot
// payload when requested, then reports finished. Knobs:
// - `steps` (default 10), `step_delay_ms` (default 20)
// - `fail_at_step` (default 0 = never), `fail_code` (runtime|invalid_input)
// - `ack_delay_ms` (default 0), `section_bytes` (default 256)
class SimCaptureBackend final : public ICaptureBackend {
public:
  SimCaptureBackend();
  // Defaults overlaid with `overrides`; values are validated at Start.
  explicit SimCaptureBackend(const BackendConfig& overrides);
  ~SimCaptureBackend() override;

  SimCaptureBackend(const SimCaptureBackend&) = delete;
  SimCaptureBackend& operator=(const SimCaptureBackend&) = delete;

  bool SetParam(const std::string& key, const std::string& value, std::string& error) override;
  BackendConfig DumpConfig() const override;

  bool Start(const CaptureSpec& spec, capture::IByteSink& report_sink,
             capture::IByteSink* screenshot_sink, IBackendEventSink& events,
             std::string& error) override;
  void Cancel() override;

private:
  struct RunPlan {
    std::uint32_t steps = 0;
    std::uint32_t step_delay_ms = 0;
    std::uint32_t fail_at_step = 0;
    capture::BackendErrorCode fail_code = capture::BackendErrorCode::kRuntime;
    std::uint32_t ack_delay_ms = 0;
    std::uint32_t section_bytes = 0;
  };

  bool ResolvePlan(RunPlan& plan, std::string& error) const;
  void Run(RunPlan plan, CaptureSpec spec, capture::IByteSink& report_sink,
           capture::IByteSink* screenshot_sink, IBackendEventSink& events);

  // Sleeps up to `delay_ms`; returns false when cancelled meanwhile.
  bool WaitUnlessCancelled(std::uint32_t delay_ms);

  BackendConfig params_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool started_ = false;
  bool cancelled_ = false;
  std::thread worker_;
};

// Builds a `BackendFactory` producing sim collectors with `params` applied.
// Invalid params surface from `Start`, not from the factory.
BackendFactory MakeSimBackendFactory(BackendConfig params);

} // namespace bugreportd::backends::sim
