#ifndef STALLWATCH_CORE_TIME_UTILS_HPP_
#define STALLWATCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace stallwatch::core {

// UTC timestamp with millisecond precision, shared by log lines and event JSON.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Whole milliseconds as a decimal string, used for log fields.
inline std::string FormatMillis(std::chrono::milliseconds value) {
  return std::to_string(value.count());
}

} // namespace stallwatch::core

#endif // STALLWATCH_CORE_TIME_UTILS_HPP_
