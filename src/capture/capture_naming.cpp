#include "capture/capture_naming.hpp"

#include "core/time_utils.hpp"

namespace camgate::capture {

namespace {

bool IsFileNameSafe(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_' || c == '-' || c == '.';
}

} // namespace

std::string SanitizeCaptureId(std::string_view id) {
  if (id.empty()) {
    return "no_id";
  }

  std::string sanitized;
  sanitized.reserve(id.size());
  bool leading = true;
  for (const char c : id) {
    if (leading && c == '.') {
      sanitized.push_back('_');
      continue;
    }
    leading = false;
    sanitized.push_back(IsFileNameSafe(c) ? c : '_');
  }
  return sanitized;
}

std::string BuildCaptureFileName(std::string_view prefix,
                                 std::chrono::system_clock::time_point captured_at,
                                 std::string_view id) {
  const std::string safe_prefix = prefix.empty() ? std::string("CamGate") : SanitizeCaptureId(prefix);
  return safe_prefix + "_" + core::FormatFileStamp(captured_at) + "_" + SanitizeCaptureId(id) +
         ".jpg";
}

} // namespace camgate::capture
