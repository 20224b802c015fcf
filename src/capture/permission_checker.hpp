#pragma once

#include "capture/capture_request.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bugreportd::capture {

// Seam for the platform permission layer. The service asks it once per
// capture request, before any session state is touched.
class IPermissionChecker {
public:
  virtual ~IPermissionChecker() = default;

  // Returns false with `reason` populated when `caller` may not capture.
  virtual bool CheckCapturePermission(const Principal& caller, std::string& reason) const = 0;
};

// Config-driven checker: an empty allow list admits every uid.
class UidAllowListChecker final : public IPermissionChecker {
public:
  explicit UidAllowListChecker(std::vector<std::int32_t> allowed_uids)
      : allowed_uids_(std::move(allowed_uids)) {}

  bool CheckCapturePermission(const Principal& caller, std::string& reason) const override;

private:
  std::vector<std::int32_t> allowed_uids_;
};

} // namespace bugreportd::capture
