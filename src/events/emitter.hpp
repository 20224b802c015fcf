#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace bugreportd::events {

// Session journal facade. Keeps payload contracts for each lifecycle event in
// one place and serializes appends from concurrent session workers.
//
// An emitter built with an empty directory is disabled: every Emit call
// succeeds without writing anything.
class Emitter {
public:
  struct SessionAdmittedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
    std::string mode;
    std::string requester;
    bool screenshot = false;
  };

  struct ConsentRequestedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
    std::uint64_t timeout_ms = 0;
  };

  struct ConsentDecidedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
    std::string decision;
    // "prompt", "timer", "exempt" or "not_required".
    std::string source;
  };

  // SESSION_RUNNING / SESSION_FINISHING.
  struct SessionPhaseEvent {
    enum class Phase {
      kRunning,
      kFinishing,
    };

    Phase phase = Phase::kRunning;
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
  };

  struct ArtifactDeliveredEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
    std::uint64_t report_bytes = 0;
    std::uint64_t screenshot_bytes = 0;
  };

  struct ArtifactRetainedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
    std::string report_path;
    std::string screenshot_path;
  };

  // SESSION_FINISHED / SESSION_ERRORED / SESSION_CANCELLED.
  struct SessionTerminalEvent {
    enum class Kind {
      kFinished,
      kErrored,
      kCancelled,
    };

    Kind kind = Kind::kFinished;
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
    // Listener error code name, errored sessions only.
    std::string error_code;
    std::string reason;
    std::uint64_t duration_ms = 0;
  };

  struct LateEventDroppedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t session_id = 0;
    std::string input;
    std::string state;
  };

  explicit Emitter(std::filesystem::path journal_dir);

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  bool enabled() const {
    return !journal_dir_.empty();
  }

  const std::filesystem::path& journal_dir() const {
    return journal_dir_;
  }

  // Empty until the first successful append.
  std::filesystem::path events_path() const;

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitSessionAdmitted(const SessionAdmittedEvent& event, std::string& error);
  bool EmitConsentRequested(const ConsentRequestedEvent& event, std::string& error);
  bool EmitConsentDecided(const ConsentDecidedEvent& event, std::string& error);
  bool EmitSessionPhase(const SessionPhaseEvent& event, std::string& error);
  bool EmitArtifactDelivered(const ArtifactDeliveredEvent& event, std::string& error);
  bool EmitArtifactRetained(const ArtifactRetainedEvent& event, std::string& error);
  bool EmitSessionTerminal(const SessionTerminalEvent& event, std::string& error);
  bool EmitLateEventDropped(const LateEventDroppedEvent& event, std::string& error);

private:
  const std::filesystem::path journal_dir_;

  mutable std::mutex mu_;
  std::filesystem::path events_path_;
};

} // namespace bugreportd::events
