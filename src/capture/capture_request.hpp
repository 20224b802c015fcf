#pragma once

#include "capture/byte_sink.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bugreportd::capture {

// What kind of diagnostic bundle to collect.
enum class CaptureMode {
  kFull,
  kInteractive,
  kRemote,
  kWear,
  kTelephony,
  kWifi,
  kDefault,
};

const char* ToString(CaptureMode mode);

// Accepts the lower-case names printed by ToString ("full", "interactive", ...).
bool ParseCaptureMode(std::string_view text, CaptureMode& mode, std::string& error);

// Maps an untrusted integer (wire value) onto a mode. Out-of-range values fail.
bool CaptureModeFromInt(int value, CaptureMode& mode);

std::vector<CaptureMode> AllCaptureModes();

// Interactive and wear captures include a screenshot of the current screen.
bool ModeIncludesScreenshot(CaptureMode mode);

// Identity of the requesting caller, as reported by the transport.
struct Principal {
  std::int32_t uid = -1;
  std::string package;

  bool operator==(const Principal& other) const {
    return uid == other.uid && package == other.package;
  }
  bool operator!=(const Principal& other) const {
    return !(*this == other);
  }
};

std::string Describe(const Principal& principal);

// Immutable description of one capture. Sinks are borrowed from the caller:
// the service writes to them only while a session is allowed to, and never
// closes them. `screenshot_sink` may be null for modes without a screenshot.
struct CaptureRequest {
  CaptureMode mode = CaptureMode::kDefault;
  IByteSink* report_sink = nullptr;
  IByteSink* screenshot_sink = nullptr;
  Principal requester;
};

// Admission-time validation. Returns false with a human-readable reason when
// the request must be rejected as invalid input.
bool ValidateCaptureRequest(const CaptureRequest& request, std::string& error);

} // namespace bugreportd::capture
