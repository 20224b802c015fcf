#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bugreportd::core::config {

// Service-wide knobs. Defaults match a stock device: 30s consent window,
// two minutes for telephony captures, root and shell exempt from consent.
struct ServiceConfig {
  std::chrono::milliseconds consent_timeout{30'000};
  std::chrono::milliseconds telephony_consent_timeout{120'000};
  bool require_consent = true;
  std::vector<std::int32_t> consent_exempt_uids = {0, 2000};
  // Empty means any uid may request a capture.
  std::vector<std::int32_t> allowed_uids;
  std::filesystem::path journal_dir;
  std::filesystem::path retained_dir;
  logging::LogLevel log_level = logging::LogLevel::kInfo;
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ConfigIssue> issues;
};

// Parses and validates config JSON text into `config`.
//
// Contract:
// - Always fills `report`; `report.valid` is false when any issue was found,
//   in which case `config` keeps its defaults for the offending keys.
// - Returns false only when `report.valid` is false.
bool ParseServiceConfig(std::string_view json_text, ServiceConfig& config, ConfigReport& report);

// Reads and parses a config file. I/O failures are reported under path `$`.
bool LoadServiceConfig(const std::filesystem::path& path, ServiceConfig& config,
                       ConfigReport& report);

// One "path: message" line per issue, for CLI and log output.
std::string FormatConfigIssues(const ConfigReport& report);

} // namespace bugreportd::core::config
