#include "capture/capture_request.hpp"

#include <algorithm>
#include <cctype>

namespace bugreportd::capture {

namespace {

constexpr int kFirstModeValue = static_cast<int>(CaptureMode::kFull);
constexpr int kLastModeValue = static_cast<int>(CaptureMode::kDefault);

std::string ToLower(std::string_view raw) {
  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

const char* ToString(const CaptureMode mode) {
  switch (mode) {
  case CaptureMode::kFull:
    return "full";
  case CaptureMode::kInteractive:
    return "interactive";
  case CaptureMode::kRemote:
    return "remote";
  case CaptureMode::kWear:
    return "wear";
  case CaptureMode::kTelephony:
    return "telephony";
  case CaptureMode::kWifi:
    return "wifi";
  case CaptureMode::kDefault:
    return "default";
  }
  return "unknown";
}

bool ParseCaptureMode(std::string_view text, CaptureMode& mode, std::string& error) {
  const std::string normalized = ToLower(text);
  for (const CaptureMode candidate : AllCaptureModes()) {
    if (normalized == ToString(candidate)) {
      mode = candidate;
      return true;
    }
  }

  std::string expected;
  for (const CaptureMode candidate : AllCaptureModes()) {
    if (!expected.empty()) {
      expected += '|';
    }
    expected += ToString(candidate);
  }
  error = "invalid capture mode '" + std::string(text) + "' (expected " + expected + ")";
  return false;
}

bool CaptureModeFromInt(const int value, CaptureMode& mode) {
  if (value < kFirstModeValue || value > kLastModeValue) {
    return false;
  }
  mode = static_cast<CaptureMode>(value);
  return true;
}

std::vector<CaptureMode> AllCaptureModes() {
  return {CaptureMode::kFull,  CaptureMode::kInteractive, CaptureMode::kRemote,
          CaptureMode::kWear,  CaptureMode::kTelephony,   CaptureMode::kWifi,
          CaptureMode::kDefault};
}

bool ModeIncludesScreenshot(const CaptureMode mode) {
  return mode == CaptureMode::kInteractive || mode == CaptureMode::kWear;
}

std::string Describe(const Principal& principal) {
  return std::to_string(principal.uid) + "/" + principal.package;
}

bool ValidateCaptureRequest(const CaptureRequest& request, std::string& error) {
  CaptureMode checked_mode = CaptureMode::kDefault;
  if (!CaptureModeFromInt(static_cast<int>(request.mode), checked_mode)) {
    error = "bad capture mode: " + std::to_string(static_cast<int>(request.mode));
    return false;
  }
  if (request.report_sink == nullptr) {
    error = "report sink is required";
    return false;
  }
  if (ModeIncludesScreenshot(request.mode) && request.screenshot_sink == nullptr) {
    error = std::string("screenshot sink is required for mode ") + ToString(request.mode);
    return false;
  }
  if (request.requester.package.empty()) {
    error = "requester package cannot be empty";
    return false;
  }
  return true;
}

} // namespace bugreportd::capture
