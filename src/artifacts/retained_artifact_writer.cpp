#include "artifacts/retained_artifact_writer.hpp"

#include "core/fs_utils.hpp"

namespace fs = std::filesystem;

namespace bugreportd::artifacts {

bool WriteRetainedArtifacts(const ArtifactStaging& staging, const fs::path& retained_dir,
                            const std::uint64_t session_id, RetainedArtifactPaths& paths,
                            std::string& error) {
  if (retained_dir.empty()) {
    error = "retained artifact directory cannot be empty";
    return false;
  }

  paths = RetainedArtifactPaths{};
  paths.session_dir = retained_dir / ("session-" + std::to_string(session_id));
  if (!core::EnsureDirectory(paths.session_dir, error)) {
    return false;
  }

  paths.report_path = paths.session_dir / "bugreport.txt";
  if (!core::WriteFileAtomic(paths.report_path, staging.ReportBytes(), error)) {
    return false;
  }

  const std::string screenshot = staging.ScreenshotBytes();
  if (!screenshot.empty()) {
    paths.screenshot_path = paths.session_dir / "screenshot.png";
    if (!core::WriteFileAtomic(paths.screenshot_path, screenshot, error)) {
      return false;
    }
  }
  return true;
}

} // namespace bugreportd::artifacts
