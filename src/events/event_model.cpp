#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

namespace bugreportd::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSessionAdmitted:
    return "SESSION_ADMITTED";
  case EventType::kSessionRunning:
    return "SESSION_RUNNING";
  case EventType::kSessionFinishing:
    return "SESSION_FINISHING";
  case EventType::kConsentRequested:
    return "CONSENT_REQUESTED";
  case EventType::kConsentDecided:
    return "CONSENT_DECIDED";
  case EventType::kArtifactDelivered:
    return "ARTIFACT_DELIVERED";
  case EventType::kArtifactRetained:
    return "ARTIFACT_RETAINED";
  case EventType::kSessionFinished:
    return "SESSION_FINISHED";
  case EventType::kSessionErrored:
    return "SESSION_ERRORED";
  case EventType::kSessionCancelled:
    return "SESSION_CANCELLED";
  case EventType::kLateEventDropped:
    return "LATE_EVENT_DROPPED";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::string out;
  out += "{";
  core::AppendJsonStringMember(out, "ts_utc", core::FormatUtcTimestamp(event.ts));
  out += ",";
  core::AppendJsonStringMember(out, "type", ToJson(event.type));
  out += ",\"payload\":{";

  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out += ",";
    }
    first = false;
    core::AppendJsonStringMember(out, key, value);
  }

  out += "}}";
  return out;
}

} // namespace bugreportd::events
