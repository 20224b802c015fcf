#pragma once

#include "artifacts/artifact_staging.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace bugreportd::artifacts {

// Where a consent-timed-out capture is kept for manual retrieval.
struct RetainedArtifactPaths {
  std::filesystem::path session_dir;
  std::filesystem::path report_path;
  std::filesystem::path screenshot_path; // empty when no screenshot was staged
};

// Writes staged artifacts under `<retained_dir>/session-<id>/`:
// - `bugreport.txt` always (possibly empty)
// - `screenshot.png` only when screenshot bytes were staged
//
// Files are published atomically. The staging is left untouched; the caller
// discards it afterwards.
bool WriteRetainedArtifacts(const ArtifactStaging& staging,
                            const std::filesystem::path& retained_dir,
                            std::uint64_t session_id,
                            RetainedArtifactPaths& paths,
                            std::string& error);

} // namespace bugreportd::artifacts
