#pragma once

#include "capture/capture_request.hpp"
#include "consent/consent_prompt.hpp"
#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace bugreportd::cli {

// Options for one unattended `bugreportd capture` run against the simulated
// collector. Exposed so tests can drive a capture in-process.
struct CaptureOptions {
  std::filesystem::path report_path;
  std::filesystem::path screenshot_path;
  capture::CaptureMode mode = capture::CaptureMode::kDefault;
  std::filesystem::path config_path;
  std::int32_t uid = 10000;
  std::string package = "bugreportd.cli";
  consent::AutoConsentPolicy consent = consent::AutoConsentPolicy::kApprove;
  std::uint32_t consent_delay_ms = 0;
  std::optional<std::uint32_t> steps;
  std::optional<std::uint32_t> step_delay_ms;
  std::optional<std::uint32_t> fail_at_step;
  std::optional<core::logging::LogLevel> log_level;
};

// Runs one capture and returns the process exit code for its outcome.
// Progress and the outcome go to `out`; diagnostics go to `err`.
int ExecuteCapture(const CaptureOptions& options, std::ostream& out, std::ostream& err);

// Routes `bugreportd` subcommands and returns process exit codes with a
// stable contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config invalid
//   20 => capture rejected at admission
//   30/31 => consent denied / timed out
//   40/41 => capture failed / cancelled
int Dispatch(int argc, char** argv);

} // namespace bugreportd::cli
