#pragma once

#include <chrono>
#include <map>
#include <string>

namespace bugreportd::events {

// Session lifecycle categories written to the journal. Names are stable:
// operators grep journals for them.
enum class EventType {
  kSessionAdmitted,
  kSessionRunning,
  kSessionFinishing,
  kConsentRequested,
  kConsentDecided,
  kArtifactDelivered,
  kArtifactRetained,
  kSessionFinished,
  kSessionErrored,
  kSessionCancelled,
  kLateEventDropped,
};

// One journal line.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: lifecycle category.
// - `payload`: string key/value attributes, serialized in key order.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kSessionAdmitted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace bugreportd::events
