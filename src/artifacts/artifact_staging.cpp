#include "artifacts/artifact_staging.hpp"

namespace bugreportd::artifacts {

ArtifactStaging::ArtifactStaging()
    : report_sink_(*this, Slot::kReport), screenshot_sink_(*this, Slot::kScreenshot) {}

bool ArtifactStaging::Append(const Slot slot, std::string_view bytes, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (delivered_ || discarded_) {
    error = "artifact staging is sealed";
    return false;
  }
  (slot == Slot::kReport ? report_ : screenshot_).append(bytes.data(), bytes.size());
  return true;
}

bool ArtifactStaging::DeliverTo(capture::IByteSink& report, capture::IByteSink* screenshot,
                                std::string& error) {
  std::string report_bytes;
  std::string screenshot_bytes;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (discarded_) {
      error = "staged artifacts were discarded";
      return false;
    }
    if (delivered_) {
      error = "staged artifacts were already delivered";
      return false;
    }
    // Seal before copying out so a late backend write cannot slip in between.
    delivered_ = true;
    report_bytes.swap(report_);
    screenshot_bytes.swap(screenshot_);
  }

  if (!report_bytes.empty() && !report.Write(report_bytes, error)) {
    error = "failed to copy bugreport to caller: " + error;
    return false;
  }
  if (screenshot != nullptr && !screenshot_bytes.empty() &&
      !screenshot->Write(screenshot_bytes, error)) {
    error = "failed to copy screenshot to caller: " + error;
    return false;
  }
  return true;
}

void ArtifactStaging::Discard() {
  std::lock_guard<std::mutex> lock(mu_);
  discarded_ = true;
  report_.clear();
  report_.shrink_to_fit();
  screenshot_.clear();
  screenshot_.shrink_to_fit();
}

std::string ArtifactStaging::ReportBytes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return report_;
}

std::string ArtifactStaging::ScreenshotBytes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return screenshot_;
}

ArtifactStaging::Snapshot ArtifactStaging::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .report_bytes = report_.size(),
      .screenshot_bytes = screenshot_.size(),
      .delivered = delivered_,
      .discarded = discarded_,
  };
}

} // namespace bugreportd::artifacts
