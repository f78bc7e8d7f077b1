#ifndef CAMGATE_CORE_TIME_UTILS_HPP_
#define CAMGATE_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace camgate::core {

namespace detail {

inline bool ToLocalTime(std::chrono::system_clock::time_point timestamp, std::tm& local_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return localtime_s(&local_time, &epoch_seconds) == 0;
#else
  return localtime_r(&epoch_seconds, &local_time) != nullptr;
#endif
}

inline std::string FormatLocal(std::chrono::system_clock::time_point timestamp,
                               const char* pattern) {
  std::tm local_time{};
  if (!ToLocalTime(timestamp, local_time)) {
    return "";
  }
  std::ostringstream out;
  out << std::put_time(&local_time, pattern);
  return out.str();
}

} // namespace detail

// Log line prefix: `YYYY-MM-DD HH:MM:SS` in local time.
inline std::string FormatLogTimestamp(std::chrono::system_clock::time_point timestamp) {
  return detail::FormatLocal(timestamp, "%Y-%m-%d %H:%M:%S");
}

// Filename-safe stamp used in capture file names: `YYYY-MM-DD_HH-MM-SS`.
inline std::string FormatFileStamp(std::chrono::system_clock::time_point timestamp) {
  return detail::FormatLocal(timestamp, "%Y-%m-%d_%H-%M-%S");
}

} // namespace camgate::core

#endif // CAMGATE_CORE_TIME_UTILS_HPP_
