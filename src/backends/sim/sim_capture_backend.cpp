#include "backends/sim/sim_capture_backend.hpp"

#include <charconv>
#include <chrono>
#include <utility>

namespace bugreportd::backends::sim {

namespace {

constexpr std::uint32_t kDefaultSteps = 10;
constexpr std::uint32_t kDefaultStepDelayMs = 20;
constexpr std::uint32_t kDefaultFailAtStep = 0;
constexpr std::uint32_t kDefaultAckDelayMs = 0;
constexpr std::uint32_t kDefaultSectionBytes = 256;
constexpr std::uint32_t kMaxSteps = 10'000;
constexpr std::uint32_t kMaxSectionBytes = 1U << 20;

constexpr char kPngSignature[] = "\x89PNG\r\n\x1a\n";

bool ParseUInt32(const std::string& text, std::uint32_t& value) {
  if (text.empty()) {
    return false;
  }

  std::uint32_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  value = parsed;
  return true;
}

bool ResolveUInt32(const BackendConfig& params, const std::string& key, std::uint32_t min_value,
                   std::uint32_t max_value, std::uint32_t& value, std::string& error) {
  const auto it = params.find(key);
  if (it == params.end()) {
    return true;
  }

  std::uint32_t parsed = 0;
  if (!ParseUInt32(it->second, parsed) || parsed < min_value || parsed > max_value) {
    error = "invalid " + key + " parameter value: " + it->second;
    return false;
  }

  value = parsed;
  return true;
}

// One report section: a header line followed by filler up to `section_bytes`.
std::string BuildSection(const CaptureSpec& spec, std::uint32_t step, std::uint32_t steps,
                         std::uint32_t section_bytes) {
  std::string section = "== section " + std::to_string(step) + "/" + std::to_string(steps) +
                        " mode=" + capture::ToString(spec.mode) +
                        " session=" + std::to_string(spec.session_id) + " ==\n";
  if (section.size() < section_bytes) {
    const std::size_t filler = section_bytes - section.size();
    for (std::size_t i = 0; i + 1 < filler; ++i) {
      section.push_back(static_cast<char>('a' + ((step + i) % 26U)));
    }
    section.push_back('\n');
  }
  return section;
}

std::string BuildScreenshot(const CaptureSpec& spec) {
  std::string png(kPngSignature, sizeof(kPngSignature) - 1U);
  png += "sim-screenshot session=" + std::to_string(spec.session_id) + "\n";
  return png;
}

} // namespace

SimCaptureBackend::SimCaptureBackend() {
  params_ = {
      {"backend", "sim"},
      {"steps", std::to_string(kDefaultSteps)},
      {"step_delay_ms", std::to_string(kDefaultStepDelayMs)},
      {"fail_at_step", std::to_string(kDefaultFailAtStep)},
      {"fail_code", "runtime"},
      {"ack_delay_ms", std::to_string(kDefaultAckDelayMs)},
      {"section_bytes", std::to_string(kDefaultSectionBytes)},
  };
}

SimCaptureBackend::SimCaptureBackend(const BackendConfig& overrides) : SimCaptureBackend() {
  for (const auto& [key, value] : overrides) {
    params_[key] = value;
  }
}

SimCaptureBackend::~SimCaptureBackend() {
  Cancel();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool SimCaptureBackend::SetParam(const std::string& key, const std::string& value,
                                 std::string& error) {
  if (key.empty()) {
    error = "parameter key cannot be empty";
    return false;
  }

  if (value.empty()) {
    error = "parameter value cannot be empty";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (started_) {
    error = "sim backend parameters are frozen after start";
    return false;
  }
  params_[key] = value;
  return true;
}

BackendConfig SimCaptureBackend::DumpConfig() const {
  std::lock_guard<std::mutex> lock(mu_);
  BackendConfig config = params_;
  config["started"] = started_ ? "true" : "false";
  config["cancelled"] = cancelled_ ? "true" : "false";
  return config;
}

bool SimCaptureBackend::Start(const CaptureSpec& spec, capture::IByteSink& report_sink,
                              capture::IByteSink* screenshot_sink, IBackendEventSink& events,
                              std::string& error) {
  RunPlan plan;
  if (!ResolvePlan(plan, error)) {
    return false;
  }
  if (spec.include_screenshot && screenshot_sink == nullptr) {
    error = "screenshot requested without a screenshot sink";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (started_) {
    error = "sim backend is already started";
    return false;
  }
  started_ = true;
  worker_ = std::thread([this, plan, spec, &report_sink, screenshot_sink, &events]() {
    Run(plan, spec, report_sink, screenshot_sink, events);
  });
  return true;
}

void SimCaptureBackend::Cancel() {
  std::lock_guard<std::mutex> lock(mu_);
  cancelled_ = true;
  cv_.notify_all();
}

bool SimCaptureBackend::ResolvePlan(RunPlan& plan, std::string& error) const {
  BackendConfig params;
  {
    std::lock_guard<std::mutex> lock(mu_);
    params = params_;
  }

  plan.steps = kDefaultSteps;
  plan.step_delay_ms = kDefaultStepDelayMs;
  plan.fail_at_step = kDefaultFailAtStep;
  plan.ack_delay_ms = kDefaultAckDelayMs;
  plan.section_bytes = kDefaultSectionBytes;

  if (!ResolveUInt32(params, "steps", 1U, kMaxSteps, plan.steps, error) ||
      !ResolveUInt32(params, "step_delay_ms", 0U, 60'000U, plan.step_delay_ms, error) ||
      !ResolveUInt32(params, "fail_at_step", 0U, kMaxSteps, plan.fail_at_step, error) ||
      !ResolveUInt32(params, "ack_delay_ms", 0U, 60'000U, plan.ack_delay_ms, error) ||
      !ResolveUInt32(params, "section_bytes", 1U, kMaxSectionBytes, plan.section_bytes, error)) {
    return false;
  }

  const auto fail_code = params.find("fail_code");
  if (fail_code != params.end()) {
    if (fail_code->second == "runtime") {
      plan.fail_code = capture::BackendErrorCode::kRuntime;
    } else if (fail_code->second == "invalid_input") {
      plan.fail_code = capture::BackendErrorCode::kInvalidInput;
    } else {
      error = "invalid fail_code parameter value: " + fail_code->second;
      return false;
    }
  }
  return true;
}

bool SimCaptureBackend::WaitUnlessCancelled(const std::uint32_t delay_ms) {
  std::unique_lock<std::mutex> lock(mu_);
  if (delay_ms == 0U) {
    return !cancelled_;
  }
  return !cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this]() { return cancelled_; });
}

void SimCaptureBackend::Run(const RunPlan plan, const CaptureSpec spec,
                            capture::IByteSink& report_sink, capture::IByteSink* screenshot_sink,
                            IBackendEventSink& events) {
  if (!WaitUnlessCancelled(plan.ack_delay_ms)) {
    return;
  }
  events.OnStarted();

  std::string write_error;
  for (std::uint32_t step = 1; step <= plan.steps; ++step) {
    if (!WaitUnlessCancelled(plan.step_delay_ms)) {
      return;
    }
    if (plan.fail_at_step == step) {
      events.OnError(plan.fail_code, "injected failure at step " + std::to_string(step));
      return;
    }
    if (!report_sink.Write(BuildSection(spec, step, plan.steps, plan.section_bytes),
                           write_error)) {
      events.OnError(capture::BackendErrorCode::kRuntime, write_error);
      return;
    }
    events.OnProgress(100.0F * static_cast<float>(step) / static_cast<float>(plan.steps));
  }

  if (spec.include_screenshot && screenshot_sink != nullptr) {
    if (!screenshot_sink->Write(BuildScreenshot(spec), write_error)) {
      events.OnError(capture::BackendErrorCode::kRuntime, write_error);
      return;
    }
  }

  if (!WaitUnlessCancelled(0U)) {
    return;
  }
  events.OnFinished();
}

BackendFactory MakeSimBackendFactory(BackendConfig params) {
  return [params = std::move(params)]() -> std::unique_ptr<ICaptureBackend> {
    return std::make_unique<SimCaptureBackend>(params);
  };
}

} // namespace bugreportd::backends::sim
