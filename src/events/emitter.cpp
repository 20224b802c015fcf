#include "events/emitter.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace bugreportd::events {

namespace {

EventType ToEventType(const Emitter::SessionPhaseEvent::Phase phase) {
  switch (phase) {
  case Emitter::SessionPhaseEvent::Phase::kFinishing:
    return EventType::kSessionFinishing;
  case Emitter::SessionPhaseEvent::Phase::kRunning:
  default:
    return EventType::kSessionRunning;
  }
}

EventType ToEventType(const Emitter::SessionTerminalEvent::Kind kind) {
  switch (kind) {
  case Emitter::SessionTerminalEvent::Kind::kErrored:
    return EventType::kSessionErrored;
  case Emitter::SessionTerminalEvent::Kind::kCancelled:
    return EventType::kSessionCancelled;
  case Emitter::SessionTerminalEvent::Kind::kFinished:
  default:
    return EventType::kSessionFinished;
  }
}

} // namespace

Emitter::Emitter(std::filesystem::path journal_dir) : journal_dir_(std::move(journal_dir)) {}

std::filesystem::path Emitter::events_path() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_path_;
}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  if (!enabled()) {
    return true;
  }

  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::lock_guard<std::mutex> lock(mu_);
  return AppendEventJsonl(event, journal_dir_, events_path_, error);
}

bool Emitter::EmitSessionAdmitted(const SessionAdmittedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionAdmitted, event.ts,
                 {
                     {"session_id", std::to_string(event.session_id)},
                     {"mode", event.mode},
                     {"requester", event.requester},
                     {"screenshot", event.screenshot ? "true" : "false"},
                 },
                 error);
}

bool Emitter::EmitConsentRequested(const ConsentRequestedEvent& event, std::string& error) {
  return EmitRaw(EventType::kConsentRequested, event.ts,
                 {
                     {"session_id", std::to_string(event.session_id)},
                     {"timeout_ms", std::to_string(event.timeout_ms)},
                 },
                 error);
}

bool Emitter::EmitConsentDecided(const ConsentDecidedEvent& event, std::string& error) {
  return EmitRaw(EventType::kConsentDecided, event.ts,
                 {
                     {"session_id", std::to_string(event.session_id)},
                     {"decision", event.decision},
                     {"source", event.source},
                 },
                 error);
}

bool Emitter::EmitSessionPhase(const SessionPhaseEvent& event, std::string& error) {
  return EmitRaw(ToEventType(event.phase), event.ts,
                 {
                     {"session_id", std::to_string(event.session_id)},
                 },
                 error);
}

bool Emitter::EmitArtifactDelivered(const ArtifactDeliveredEvent& event, std::string& error) {
  return EmitRaw(EventType::kArtifactDelivered, event.ts,
                 {
                     {"session_id", std::to_string(event.session_id)},
                     {"report_bytes", std::to_string(event.report_bytes)},
                     {"screenshot_bytes", std::to_string(event.screenshot_bytes)},
                 },
                 error);
}

bool Emitter::EmitArtifactRetained(const ArtifactRetainedEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"session_id", std::to_string(event.session_id)},
      {"report_path", event.report_path},
  };
  if (!event.screenshot_path.empty()) {
    payload["screenshot_path"] = event.screenshot_path;
  }
  return EmitRaw(EventType::kArtifactRetained, event.ts, std::move(payload), error);
}

bool Emitter::EmitSessionTerminal(const SessionTerminalEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"session_id", std::to_string(event.session_id)},
      {"duration_ms", std::to_string(event.duration_ms)},
  };
  if (!event.error_code.empty()) {
    payload["error_code"] = event.error_code;
  }
  if (!event.reason.empty()) {
    payload["reason"] = event.reason;
  }
  return EmitRaw(ToEventType(event.kind), event.ts, std::move(payload), error);
}

bool Emitter::EmitLateEventDropped(const LateEventDroppedEvent& event, std::string& error) {
  return EmitRaw(EventType::kLateEventDropped, event.ts,
                 {
                     {"session_id", std::to_string(event.session_id)},
                     {"input", event.input},
                     {"state", event.state},
                 },
                 error);
}

} // namespace bugreportd::events
