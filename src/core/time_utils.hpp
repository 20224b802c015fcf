#ifndef BUGREPORTD_CORE_TIME_UTILS_HPP_
#define BUGREPORTD_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace bugreportd::core {

// Canonical UTC timestamp used by log records and the session journal.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Milliseconds left until `deadline`, floored at zero. Used for dump output
// and consent diagnostics.
inline long long RemainingMillis(std::chrono::steady_clock::time_point deadline,
                                 std::chrono::steady_clock::time_point now) {
  if (now >= deadline) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
}

} // namespace bugreportd::core

#endif // BUGREPORTD_CORE_TIME_UTILS_HPP_
