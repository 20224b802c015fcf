#include "../common/assertions.hpp"
#include "../common/capture_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/logging/logger.hpp"
#include "session/capture_service.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

using bugreportd::capture::AdmissionStatus;
using bugreportd::capture::CancelStatus;
using bugreportd::capture::CaptureMode;
using bugreportd::capture::ListenerErrorCode;
using bugreportd::session::CaptureService;
using bugreportd::session::SessionId;
using bugreportd::tests::common::AssertContains;
using bugreportd::tests::common::AssertNotContains;
using bugreportd::tests::common::Fail;
using bugreportd::tests::common::ManualConsentPrompt;
using bugreportd::tests::common::RecordingListener;
using bugreportd::tests::common::ScriptedBackendState;
using bugreportd::tests::common::StringSink;

namespace {

const bugreportd::capture::Principal kApp{.uid = 10001, .package = "com.example.feedback"};
const bugreportd::capture::Principal kShell{.uid = 2000, .package = "com.android.shell"};

bugreportd::capture::CaptureRequest MakeRequest(CaptureMode mode, const bugreportd::capture::Principal& who,
                                                StringSink& report, StringSink* screenshot = nullptr) {
  return {.mode = mode, .report_sink = &report, .screenshot_sink = screenshot, .requester = who};
}

std::string DumpText(const CaptureService& service) {
  std::ostringstream out;
  service.Dump(out);
  return out.str();
}

void ExpectAdmissionChecks(const fs::path& root) {
  bugreportd::core::config::ServiceConfig config;
  config.allowed_uids = {2000, 10001};
  config.journal_dir = root / "journal";

  std::ostringstream log;
  bugreportd::core::logging::Logger logger(bugreportd::core::logging::LogLevel::kDebug, log);
  ManualConsentPrompt prompt;
  auto backend = std::make_shared<ScriptedBackendState>();
  CaptureService service(config, bugreportd::tests::common::MakeScriptedFactory(backend), &prompt,
                         logger);

  StringSink report;
  SessionId handle = 0;
  std::string error;

  // Permission is checked before anything else.
  auto stranger_listener = std::make_shared<RecordingListener>();
  if (service.StartCapture(MakeRequest(CaptureMode::kFull, {.uid = 10002, .package = "com.evil"},
                                       report),
                           stranger_listener, handle, error) !=
      AdmissionStatus::kPermissionDenied) {
    Fail("disallowed uid must be rejected");
  }
  AssertContains(error, "uid 10002 is not allowed");

  error.clear();
  if (service.StartCapture(MakeRequest(CaptureMode::kInteractive, kApp, report),
                           std::make_shared<RecordingListener>(), handle, error) !=
      AdmissionStatus::kInvalidInput) {
    Fail("screenshot mode without a screenshot sink must be invalid");
  }
  error.clear();
  if (service.StartCapture(MakeRequest(CaptureMode::kFull, kApp, report), nullptr, handle,
                           error) != AdmissionStatus::kInvalidInput) {
    Fail("missing listener must be invalid");
  }
  if (backend->start_calls() != 0U || service.registry().DebugSnapshot().admitted != 0U) {
    Fail("rejected requests must not create sessions");
  }

  auto listener = std::make_shared<RecordingListener>();
  error.clear();
  if (service.StartCapture(MakeRequest(CaptureMode::kFull, kApp, report), listener, handle,
                           error) != AdmissionStatus::kAdmitted) {
    Fail("valid request rejected: " + error);
  }
  if (!prompt.WaitForRequest()) {
    Fail("app requester should be prompted for consent");
  }

  SessionId other = 0;
  if (service.StartCapture(MakeRequest(CaptureMode::kFull, kShell, report),
                           std::make_shared<RecordingListener>(), other, error) !=
      AdmissionStatus::kAlreadyActive) {
    Fail("second capture must be rejected while one is active");
  }

  const std::string active_dump = DumpText(service);
  AssertContains(active_dump, "session_id: " + std::to_string(handle));
  AssertContains(active_dump, "mode: full");
  AssertContains(active_dump, "consent: pending (remaining_ms=");
  AssertContains(active_dump, "progress: none");
  AssertContains(active_dump, "requester: 10001/com.example.feedback");
  AssertContains(active_dump, "rejected (already active): 1");

  error.clear();
  if (service.CancelCapture(handle, kShell, error) != CancelStatus::kPermissionDenied) {
    Fail("cancel from another principal must be denied");
  }
  AssertContains(error, "cancellation requested by 2000/com.android.shell does not match ongoing "
                        "capture from 10001/com.example.feedback");
  if (service.CancelCapture(handle + 100, kApp, error) != CancelStatus::kNoActiveSession) {
    Fail("stale handle cancel should be a no-op");
  }
  if (service.CancelCapture(handle, kApp, error) != CancelStatus::kCancelRequested) {
    Fail("owner cancel should be accepted");
  }
  if (!service.WaitForIdle(std::chrono::seconds(5))) {
    Fail("cancelled capture never released");
  }
  if (listener->terminal_count() != 0U || stranger_listener->notifications().size() != 0U) {
    Fail("cancel and rejection must not call listeners");
  }

  const std::string idle_dump = DumpText(service);
  AssertContains(idle_dump, "capture not in progress");
  AssertContains(idle_dump, "sessions admitted: 1, released: 1, rejected (already active): 1");
  AssertContains(idle_dump, "consent_timeout_ms: 30000");

  service.Shutdown();
  const std::string journal = bugreportd::tests::common::ReadFileToString(
      root / "journal" / "events.jsonl");
  if (journal.find("SESSION_ADMITTED") > journal.find("CONSENT_REQUESTED")) {
    Fail("admission must be journaled before anything the session writes");
  }
  AssertContains(journal, R"("type":"SESSION_CANCELLED")");
  AssertContains(log.str(), "msg=\"capture rejected\"");
  AssertContains(log.str(), "status=\"PERMISSION_DENIED\"");
  AssertContains(log.str(), "msg=\"cancel rejected\"");
}

void ExpectExemptRequesterSkipsConsent(const fs::path& root) {
  bugreportd::core::config::ServiceConfig config;
  config.journal_dir = root / "journal";

  std::ostringstream log;
  bugreportd::core::logging::Logger logger(bugreportd::core::logging::LogLevel::kInfo, log);
  ManualConsentPrompt prompt;
  auto backend = std::make_shared<ScriptedBackendState>();
  CaptureService service(config, bugreportd::tests::common::MakeScriptedFactory(backend), &prompt,
                         logger);

  StringSink report;
  StringSink screenshot;
  auto listener = std::make_shared<RecordingListener>();
  SessionId handle = 0;
  std::string error;
  if (service.StartCapture(MakeRequest(CaptureMode::kWear, kShell, report, &screenshot), listener,
                           handle, error) != AdmissionStatus::kAdmitted) {
    Fail("shell capture rejected: " + error);
  }
  backend->WaitForStart();
  backend->EmitStarted();
  backend->WriteReport("shell report");
  backend->WriteScreenshot("watch-face");
  backend->EmitProgress(100.0F);
  backend->EmitFinished();
  if (!listener->WaitForTerminal()) {
    Fail("exempt capture never finished");
  }
  service.Shutdown();

  if (!listener->finished() || report.bytes() != "shell report" ||
      screenshot.bytes() != "watch-face") {
    Fail("exempt capture should deliver without consent");
  }
  if (prompt.request_calls() != 0U) {
    Fail("exempt requester must not be prompted");
  }
  const std::string journal = bugreportd::tests::common::ReadFileToString(
      root / "journal" / "events.jsonl");
  AssertContains(journal, R"("source":"exempt")");
  AssertContains(journal, R"("screenshot":"true")");
  AssertNotContains(journal, "CONSENT_REQUESTED");
}

void ExpectConsentDisabledByConfig(const fs::path& root) {
  bugreportd::core::config::ServiceConfig config;
  config.require_consent = false;
  config.journal_dir = root / "journal";

  std::ostringstream log;
  bugreportd::core::logging::Logger logger(bugreportd::core::logging::LogLevel::kInfo, log);
  auto backend = std::make_shared<ScriptedBackendState>();
  CaptureService service(config, bugreportd::tests::common::MakeScriptedFactory(backend), nullptr,
                         logger);

  StringSink report;
  auto listener = std::make_shared<RecordingListener>();
  SessionId handle = 0;
  std::string error;
  if (service.StartCapture(MakeRequest(CaptureMode::kRemote, kApp, report), listener, handle,
                           error) != AdmissionStatus::kAdmitted) {
    Fail("capture rejected: " + error);
  }
  backend->WaitForStart();
  backend->EmitStarted();
  backend->WriteReport("remote");
  backend->EmitFinished();
  if (!listener->WaitForTerminal() || !listener->finished()) {
    Fail("capture without required consent should finish");
  }
  service.Shutdown();
  AssertContains(bugreportd::tests::common::ReadFileToString(root / "journal" / "events.jsonl"),
                 R"("source":"not_required")");
}

void ExpectTelephonyUsesItsOwnTimeout(const fs::path& root) {
  bugreportd::core::config::ServiceConfig config;
  config.consent_timeout = std::chrono::milliseconds(60'000);
  config.telephony_consent_timeout = std::chrono::milliseconds(60);
  config.journal_dir = root / "journal";

  std::ostringstream log;
  bugreportd::core::logging::Logger logger(bugreportd::core::logging::LogLevel::kInfo, log);
  ManualConsentPrompt prompt;
  auto backend = std::make_shared<ScriptedBackendState>();
  CaptureService service(config, bugreportd::tests::common::MakeScriptedFactory(backend), &prompt,
                         logger);

  StringSink report;
  auto listener = std::make_shared<RecordingListener>();
  SessionId handle = 0;
  std::string error;
  if (service.StartCapture(MakeRequest(CaptureMode::kTelephony, kApp, report), listener, handle,
                           error) != AdmissionStatus::kAdmitted) {
    Fail("telephony capture rejected: " + error);
  }
  if (!listener->WaitForTerminal(std::chrono::seconds(5))) {
    Fail("telephony consent timeout never fired");
  }
  service.Shutdown();
  if (listener->error_code() != ListenerErrorCode::kUserConsentTimedOut) {
    Fail("telephony capture should time out on its own window");
  }
  AssertContains(bugreportd::tests::common::ReadFileToString(root / "journal" / "events.jsonl"),
                 R"("timeout_ms":"60")");
}

void ExpectListenerDeathCancels(const fs::path& root) {
  bugreportd::core::config::ServiceConfig config;
  config.journal_dir = root / "journal";

  std::ostringstream log;
  bugreportd::core::logging::Logger logger(bugreportd::core::logging::LogLevel::kInfo, log);
  ManualConsentPrompt prompt;
  auto backend = std::make_shared<ScriptedBackendState>();
  CaptureService service(config, bugreportd::tests::common::MakeScriptedFactory(backend), &prompt,
                         logger);

  StringSink report;
  auto listener = std::make_shared<RecordingListener>();
  SessionId handle = 0;
  std::string error;
  if (service.StartCapture(MakeRequest(CaptureMode::kWifi, kApp, report), listener, handle,
                           error) != AdmissionStatus::kAdmitted) {
    Fail("capture rejected: " + error);
  }
  backend->WaitForStart();
  if (!service.NotifyListenerDied(handle)) {
    Fail("death notice for the active session should be forwarded");
  }
  if (!service.WaitForIdle(std::chrono::seconds(5))) {
    Fail("session never released after listener death");
  }
  if (service.NotifyListenerDied(handle)) {
    Fail("death notice for a released session should be ignored");
  }
  service.Shutdown();
  if (listener->terminal_count() != 0U) {
    Fail("listener death must not produce callbacks");
  }
  AssertContains(bugreportd::tests::common::ReadFileToString(root / "journal" / "events.jsonl"),
                 R"("reason":"listener died")");
}

void ExpectRetryAfterAlreadyActiveIsAdmitted() {
  bugreportd::core::config::ServiceConfig config;
  config.require_consent = false;

  std::ostringstream log;
  bugreportd::core::logging::Logger logger(bugreportd::core::logging::LogLevel::kInfo, log);
  auto backend = std::make_shared<ScriptedBackendState>();
  CaptureService service(config, bugreportd::tests::common::MakeScriptedFactory(backend), nullptr,
                         logger);

  StringSink first_report;
  auto first = std::make_shared<RecordingListener>();
  SessionId handle = 0;
  std::string error;
  if (service.StartCapture(MakeRequest(CaptureMode::kFull, kApp, first_report), first, handle,
                           error) != AdmissionStatus::kAdmitted) {
    Fail("first capture rejected: " + error);
  }

  StringSink second_report;
  auto second = std::make_shared<RecordingListener>();
  SessionId second_handle = 0;
  if (service.StartCapture(MakeRequest(CaptureMode::kFull, kApp, second_report), second,
                           second_handle, error) != AdmissionStatus::kAlreadyActive) {
    Fail("overlapping capture must be rejected");
  }
  AssertContains(error, "bugreport already in progress");

  backend->WaitForStart();
  backend->EmitStarted();
  backend->EmitFinished();
  if (!service.WaitForIdle(std::chrono::seconds(5)) || !first->finished()) {
    Fail("first capture should finish and free the slot");
  }

  // The caller resubmits with the same error string still holding the
  // previous rejection.
  if (service.StartCapture(MakeRequest(CaptureMode::kFull, kApp, second_report), second,
                           second_handle, error) != AdmissionStatus::kAdmitted) {
    Fail("resubmitted capture rejected: " + error);
  }
  if (second_handle == handle) {
    Fail("resubmitted capture must get a fresh session id");
  }
  if (!bugreportd::tests::common::WaitUntil([&]() { return backend->start_calls() == 2U; })) {
    Fail("resubmitted capture never started its collector");
  }
  backend->EmitStarted();
  backend->WriteReport("second");
  backend->EmitFinished();
  if (!second->WaitForTerminal() || !second->finished()) {
    Fail("resubmitted capture should finish");
  }
  service.Shutdown();
  if (second_report.bytes() != "second") {
    Fail("resubmitted capture should deliver its own report");
  }
}

} // namespace

int main() {
  const fs::path root = bugreportd::tests::common::CreateUniqueTempDir("bugreportd-service-smoke");
  ExpectAdmissionChecks(root / "admission");
  ExpectExemptRequesterSkipsConsent(root / "exempt");
  ExpectConsentDisabledByConfig(root / "not-required");
  ExpectTelephonyUsesItsOwnTimeout(root / "telephony");
  ExpectListenerDeathCancels(root / "peer-death");
  ExpectRetryAfterAlreadyActiveIsAdmitted();
  bugreportd::tests::common::RemovePathBestEffort(root);
  return 0;
}
