#pragma once

#include "capture/byte_sink.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace bugreportd::artifacts {

// Session-private holding area for everything the backend collector
// produces. The backend only ever sees the staging sinks; the caller's sinks
// receive bytes through DeliverTo once consent allows it.
//
// After DeliverTo or Discard the staging is sealed and further backend
// writes fail.
class ArtifactStaging {
public:
  ArtifactStaging();

  ArtifactStaging(const ArtifactStaging&) = delete;
  ArtifactStaging& operator=(const ArtifactStaging&) = delete;

  capture::IByteSink& report_sink() {
    return report_sink_;
  }

  capture::IByteSink& screenshot_sink() {
    return screenshot_sink_;
  }

  // Copies staged bytes into the caller's sinks. `screenshot` may be null, in
  // which case staged screenshot bytes are dropped. Succeeds at most once.
  bool DeliverTo(capture::IByteSink& report, capture::IByteSink* screenshot, std::string& error);

  // Drops staged bytes and seals. Idempotent.
  void Discard();

  // Copies of the current staged bytes, used for manual-retrieval retention.
  std::string ReportBytes() const;
  std::string ScreenshotBytes() const;

  struct Snapshot {
    std::uint64_t report_bytes = 0;
    std::uint64_t screenshot_bytes = 0;
    bool delivered = false;
    bool discarded = false;
  };

  Snapshot DebugSnapshot() const;

private:
  enum class Slot {
    kReport,
    kScreenshot,
  };

  class StagingSink final : public capture::IByteSink {
  public:
    StagingSink(ArtifactStaging& owner, Slot slot) : owner_(owner), slot_(slot) {}

    bool Write(std::string_view bytes, std::string& error) override {
      return owner_.Append(slot_, bytes, error);
    }

  private:
    ArtifactStaging& owner_;
    Slot slot_;
  };

  bool Append(Slot slot, std::string_view bytes, std::string& error);

  mutable std::mutex mu_;
  std::string report_;
  std::string screenshot_;
  bool delivered_ = false;
  bool discarded_ = false;

  StagingSink report_sink_;
  StagingSink screenshot_sink_;
};

} // namespace bugreportd::artifacts
