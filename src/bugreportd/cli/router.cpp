#include "bugreportd/cli/router.hpp"

#include "backends/sim/sim_capture_backend.hpp"
#include "capture/byte_sink.hpp"
#include "capture/status_codes.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "session/capture_service.hpp"
#include "session/event_channel.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace bugreportd::cli {

namespace {

constexpr std::string_view kVersion = "bugreportd 0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitAdmissionRejected =
    core::errors::ToInt(core::errors::ExitCode::kAdmissionRejected);
constexpr int kExitConsentDenied = core::errors::ToInt(core::errors::ExitCode::kConsentDenied);
constexpr int kExitConsentTimedOut = core::errors::ToInt(core::errors::ExitCode::kConsentTimedOut);
constexpr int kExitCaptureFailed = core::errors::ToInt(core::errors::ExitCode::kCaptureFailed);
constexpr int kExitCaptureCancelled =
    core::errors::ToInt(core::errors::ExitCode::kCaptureCancelled);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  bugreportd capture --out <report> [--screenshot <png>] [--mode <name>] "
         "[--config <json>] [--uid <n>] [--package <name>] "
         "[--consent <approve|deny|none>] [--consent-delay-ms <n>] "
         "[--steps <n>] [--step-delay-ms <n>] [--fail-at-step <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  bugreportd validate-config <config.json>\n"
      << "  bugreportd modes\n"
      << "  bugreportd version\n";
}

// Owns a file descriptor for the CLI's lifetime. The service only borrows it.
class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

private:
  int fd_ = -1;
};

bool OpenOutputFile(const fs::path& path, std::unique_ptr<ScopedFd>& fd, std::string& error) {
  const int raw = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (raw < 0) {
    error = "failed to open '" + path.string() + "': " + std::strerror(errno);
    return false;
  }
  fd = std::make_unique<ScopedFd>(raw);
  return true;
}

// Prints notifications as they arrive and remembers how the capture ended.
class CliCaptureListener final : public session::ICaptureListener {
public:
  explicit CliCaptureListener(std::ostream& out) : out_(out) {}

  bool OnProgress(float percent) override {
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "progress: " << std::fixed << std::setprecision(1) << percent << '\n';
    return true;
  }

  bool OnError(capture::ListenerErrorCode code) override {
    std::lock_guard<std::mutex> lock(mu_);
    error_code_ = code;
    return true;
  }

  bool OnFinished() override {
    std::lock_guard<std::mutex> lock(mu_);
    finished_ = true;
    return true;
  }

  bool finished() const {
    std::lock_guard<std::mutex> lock(mu_);
    return finished_;
  }

  std::optional<capture::ListenerErrorCode> error_code() const {
    std::lock_guard<std::mutex> lock(mu_);
    return error_code_;
  }

private:
  std::ostream& out_;
  mutable std::mutex mu_;
  bool finished_ = false;
  std::optional<capture::ListenerErrorCode> error_code_;
};

bool ParseUInt32(std::string_view text, std::uint32_t& value) {
  if (text.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

bool ParseInt32(std::string_view text, std::int32_t& value) {
  if (text.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

// Parse `capture` args with an explicit contract:
// - `--out <report>` is required
// - every other option is optional and takes exactly one value
// Unknown flags and positional args are usage errors.
bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.empty() || token.front() != '-') {
      error = "capture does not accept positional arguments: " + std::string(token);
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[++i];

    if (token == "--out") {
      options.report_path = fs::path(value);
      continue;
    }
    if (token == "--screenshot") {
      options.screenshot_path = fs::path(value);
      continue;
    }
    if (token == "--config") {
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--package") {
      options.package = std::string(value);
      continue;
    }
    if (token == "--mode") {
      if (!capture::ParseCaptureMode(value, options.mode, error)) {
        return false;
      }
      continue;
    }
    if (token == "--consent") {
      if (!consent::ParseAutoConsentPolicy(value, options.consent, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }
    if (token == "--uid") {
      if (!ParseInt32(value, options.uid) || options.uid < 0) {
        error = "invalid --uid value: " + std::string(value);
        return false;
      }
      continue;
    }

    std::uint32_t number = 0;
    if (!ParseUInt32(value, number)) {
      if (token == "--consent-delay-ms" || token == "--steps" || token == "--step-delay-ms" ||
          token == "--fail-at-step") {
        error = "invalid " + std::string(token) + " value: " + std::string(value);
      } else {
        error = "unknown option: " + std::string(token);
      }
      return false;
    }
    if (token == "--consent-delay-ms") {
      options.consent_delay_ms = number;
    } else if (token == "--steps") {
      options.steps = number;
    } else if (token == "--step-delay-ms") {
      options.step_delay_ms = number;
    } else if (token == "--fail-at-step") {
      options.fail_at_step = number;
    } else {
      error = "unknown option: " + std::string(token);
      return false;
    }
  }

  if (options.report_path.empty()) {
    error = "capture requires --out <report>";
    return false;
  }
  return true;
}

backends::BackendConfig BuildSimParams(const CaptureOptions& options) {
  backends::BackendConfig params;
  if (options.steps.has_value()) {
    params["steps"] = std::to_string(*options.steps);
  }
  if (options.step_delay_ms.has_value()) {
    params["step_delay_ms"] = std::to_string(*options.step_delay_ms);
  }
  if (options.fail_at_step.has_value()) {
    params["fail_at_step"] = std::to_string(*options.fail_at_step);
  }
  return params;
}

int ExitCodeForOutcome(const CliCaptureListener& listener) {
  if (listener.finished()) {
    return kExitSuccess;
  }
  const std::optional<capture::ListenerErrorCode> code = listener.error_code();
  if (!code.has_value()) {
    return kExitCaptureCancelled;
  }
  switch (*code) {
  case capture::ListenerErrorCode::kUserDeniedConsent:
    return kExitConsentDenied;
  case capture::ListenerErrorCode::kUserConsentTimedOut:
    return kExitConsentTimedOut;
  case capture::ListenerErrorCode::kInvalidInput:
  case capture::ListenerErrorCode::kRuntime:
    return kExitCaptureFailed;
  }
  return kExitCaptureFailed;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandModes(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: modes does not accept arguments\n";
    return kExitUsage;
  }

  for (const capture::CaptureMode mode : capture::AllCaptureModes()) {
    std::cout << capture::ToString(mode);
    if (capture::ModeIncludesScreenshot(mode)) {
      std::cout << " (screenshot)";
    }
    std::cout << '\n';
  }
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-config requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  core::config::ServiceConfig config;
  core::config::ConfigReport report;
  if (!core::config::LoadServiceConfig(config_path, config, report)) {
    std::cerr << "invalid config: " << config_path.string() << '\n';
    std::cerr << core::config::FormatConfigIssues(report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  CaptureOptions options;
  std::string error;
  if (!ParseCaptureOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteCapture(options, std::cout, std::cerr);
}

} // namespace

int ExecuteCapture(const CaptureOptions& options, std::ostream& out, std::ostream& err) {
  core::config::ServiceConfig config;
  if (!options.config_path.empty()) {
    core::config::ConfigReport report;
    if (!core::config::LoadServiceConfig(options.config_path, config, report)) {
      err << "invalid config: " << options.config_path.string() << '\n';
      err << core::config::FormatConfigIssues(report);
      return kExitConfigInvalid;
    }
  }

  core::logging::Logger logger(options.log_level.value_or(config.log_level), err);

  std::string error;
  std::unique_ptr<ScopedFd> report_fd;
  if (!OpenOutputFile(options.report_path, report_fd, error)) {
    err << "error: " << error << '\n';
    return kExitFailure;
  }
  std::unique_ptr<ScopedFd> screenshot_fd;
  if (!options.screenshot_path.empty() &&
      !OpenOutputFile(options.screenshot_path, screenshot_fd, error)) {
    err << "error: " << error << '\n';
    return kExitFailure;
  }

  capture::FdByteSink report_sink(report_fd->get());
  std::unique_ptr<capture::FdByteSink> screenshot_sink;
  if (screenshot_fd != nullptr) {
    screenshot_sink = std::make_unique<capture::FdByteSink>(screenshot_fd->get());
  }

  // Declared before the service so it outlives every session.
  consent::AutoConsentPrompt prompt(options.consent,
                                    std::chrono::milliseconds(options.consent_delay_ms));
  session::CaptureService service(config,
                                  backends::sim::MakeSimBackendFactory(BuildSimParams(options)),
                                  &prompt, logger);

  const capture::CaptureRequest request{
      .mode = options.mode,
      .report_sink = &report_sink,
      .screenshot_sink = screenshot_sink.get(),
      .requester = capture::Principal{.uid = options.uid, .package = options.package},
  };
  auto listener = std::make_shared<CliCaptureListener>(out);

  session::SessionId handle = 0;
  const capture::AdmissionStatus status = service.StartCapture(request, listener, handle, error);
  if (status != capture::AdmissionStatus::kAdmitted) {
    err << "error: capture rejected (" << capture::ToString(status) << "): " << error << '\n';
    return kExitAdmissionRejected;
  }

  while (!service.WaitForIdle(std::chrono::seconds(1))) {
  }
  service.Shutdown();

  const int exit_code = ExitCodeForOutcome(*listener);
  if (listener->finished()) {
    out << "finished: " << options.report_path.string() << '\n';
    if (!options.screenshot_path.empty()) {
      out << "screenshot: " << options.screenshot_path.string() << '\n';
    }
  } else if (const auto code = listener->error_code(); code.has_value()) {
    out << "error: " << capture::ToString(*code) << " (" << capture::ToInt(*code) << ")\n";
  } else {
    out << "cancelled\n";
  }
  return exit_code;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "modes") {
    return CommandModes(args);
  }

  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }

  if (command == "capture") {
    return CommandCapture(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace bugreportd::cli
