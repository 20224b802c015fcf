#include "capture/permission_checker.hpp"

#include <algorithm>

namespace bugreportd::capture {

bool UidAllowListChecker::CheckCapturePermission(const Principal& caller,
                                                 std::string& reason) const {
  if (allowed_uids_.empty()) {
    return true;
  }
  if (std::find(allowed_uids_.begin(), allowed_uids_.end(), caller.uid) != allowed_uids_.end()) {
    return true;
  }
  reason = "uid " + std::to_string(caller.uid) + " is not allowed to capture bugreports";
  return false;
}

} // namespace bugreportd::capture
