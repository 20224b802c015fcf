#include "capture/capture_request.hpp"
#include "capture/permission_checker.hpp"
#include "capture/status_codes.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <string_view>

namespace {

using bugreportd::capture::CaptureMode;
using bugreportd::capture::CaptureRequest;

class NullSink final : public bugreportd::capture::IByteSink {
public:
  bool Write(std::string_view, std::string&) override {
    return true;
  }
};

} // namespace

TEST_CASE("Capture modes parse from their printed names", "[capture][request]") {
  for (const CaptureMode mode : bugreportd::capture::AllCaptureModes()) {
    CaptureMode parsed = CaptureMode::kDefault;
    std::string error;
    REQUIRE(bugreportd::capture::ParseCaptureMode(bugreportd::capture::ToString(mode), parsed,
                                                  error));
    REQUIRE(parsed == mode);
  }

  CaptureMode parsed = CaptureMode::kDefault;
  std::string error;
  REQUIRE(bugreportd::capture::ParseCaptureMode("WIFI", parsed, error));
  REQUIRE(parsed == CaptureMode::kWifi);
  REQUIRE_FALSE(bugreportd::capture::ParseCaptureMode("audio", parsed, error));
  REQUIRE(error.find("invalid capture mode 'audio'") != std::string::npos);
}

TEST_CASE("Only interactive and wear captures include a screenshot", "[capture][request]") {
  REQUIRE(bugreportd::capture::ModeIncludesScreenshot(CaptureMode::kInteractive));
  REQUIRE(bugreportd::capture::ModeIncludesScreenshot(CaptureMode::kWear));
  REQUIRE_FALSE(bugreportd::capture::ModeIncludesScreenshot(CaptureMode::kFull));
  REQUIRE_FALSE(bugreportd::capture::ModeIncludesScreenshot(CaptureMode::kTelephony));
  REQUIRE_FALSE(bugreportd::capture::ModeIncludesScreenshot(CaptureMode::kDefault));
}

TEST_CASE("Wire mode values outside the enum are rejected", "[capture][request]") {
  CaptureMode mode = CaptureMode::kDefault;
  REQUIRE(bugreportd::capture::CaptureModeFromInt(0, mode));
  REQUIRE(mode == CaptureMode::kFull);
  REQUIRE_FALSE(bugreportd::capture::CaptureModeFromInt(-1, mode));
  REQUIRE_FALSE(bugreportd::capture::CaptureModeFromInt(7, mode));
}

TEST_CASE("Capture request validation", "[capture][request]") {
  NullSink report;
  NullSink screenshot;
  std::string error;

  CaptureRequest request{
      .mode = CaptureMode::kFull,
      .report_sink = &report,
      .requester = {.uid = 10001, .package = "com.example.feedback"},
  };
  REQUIRE(bugreportd::capture::ValidateCaptureRequest(request, error));

  SECTION("missing report sink") {
    request.report_sink = nullptr;
    REQUIRE_FALSE(bugreportd::capture::ValidateCaptureRequest(request, error));
    REQUIRE(error == "report sink is required");
  }

  SECTION("screenshot mode without screenshot sink") {
    request.mode = CaptureMode::kInteractive;
    REQUIRE_FALSE(bugreportd::capture::ValidateCaptureRequest(request, error));
    REQUIRE(error == "screenshot sink is required for mode interactive");
    request.screenshot_sink = &screenshot;
    REQUIRE(bugreportd::capture::ValidateCaptureRequest(request, error));
  }

  SECTION("out of range mode") {
    request.mode = static_cast<CaptureMode>(42);
    REQUIRE_FALSE(bugreportd::capture::ValidateCaptureRequest(request, error));
    REQUIRE(error == "bad capture mode: 42");
  }

  SECTION("anonymous requester") {
    request.requester.package.clear();
    REQUIRE_FALSE(bugreportd::capture::ValidateCaptureRequest(request, error));
  }
}

TEST_CASE("Principals compare by uid and package", "[capture][request]") {
  const bugreportd::capture::Principal a{.uid = 1000, .package = "com.a"};
  const bugreportd::capture::Principal b{.uid = 1000, .package = "com.b"};
  REQUIRE(a == a);
  REQUIRE(a != b);
  REQUIRE(bugreportd::capture::Describe(a) == "1000/com.a");
}

TEST_CASE("Uid allow list gates capture permission", "[capture][permission]") {
  std::string reason;
  const bugreportd::capture::UidAllowListChecker open({});
  REQUIRE(open.CheckCapturePermission({.uid = 12345, .package = "x"}, reason));

  const bugreportd::capture::UidAllowListChecker closed({1000, 2000});
  REQUIRE(closed.CheckCapturePermission({.uid = 2000, .package = "shell"}, reason));
  REQUIRE_FALSE(closed.CheckCapturePermission({.uid = 10001, .package = "app"}, reason));
  REQUIRE(reason == "uid 10001 is not allowed to capture bugreports");
}

TEST_CASE("Listener error codes keep their wire values", "[capture][status]") {
  using bugreportd::capture::ListenerErrorCode;
  REQUIRE(bugreportd::capture::ToInt(ListenerErrorCode::kInvalidInput) == 1);
  REQUIRE(bugreportd::capture::ToInt(ListenerErrorCode::kRuntime) == 2);
  REQUIRE(bugreportd::capture::ToInt(ListenerErrorCode::kUserDeniedConsent) == 3);
  REQUIRE(bugreportd::capture::ToInt(ListenerErrorCode::kUserConsentTimedOut) == 4);
  REQUIRE(bugreportd::capture::ListenerErrorCodeFromInt(3) == ListenerErrorCode::kUserDeniedConsent);
  REQUIRE_FALSE(bugreportd::capture::ListenerErrorCodeFromInt(0).has_value());
  REQUIRE_FALSE(bugreportd::capture::ListenerErrorCodeFromInt(5).has_value());
  REQUIRE(bugreportd::capture::ToString(ListenerErrorCode::kUserConsentTimedOut) ==
          "USER_CONSENT_TIMED_OUT");
}

TEST_CASE("Backend failures map onto listener error codes", "[capture][status]") {
  using bugreportd::capture::BackendErrorCode;
  using bugreportd::capture::ListenerErrorCode;
  REQUIRE(bugreportd::capture::ToListenerError(BackendErrorCode::kInvalidInput) ==
          ListenerErrorCode::kInvalidInput);
  REQUIRE(bugreportd::capture::ToListenerError(BackendErrorCode::kRuntime) ==
          ListenerErrorCode::kRuntime);
  REQUIRE(bugreportd::capture::ToString(bugreportd::capture::AdmissionStatus::kAlreadyActive) ==
          "ALREADY_ACTIVE");
  REQUIRE(bugreportd::capture::ToString(bugreportd::capture::CancelStatus::kNoActiveSession) ==
          "NO_ACTIVE_SESSION");
}
