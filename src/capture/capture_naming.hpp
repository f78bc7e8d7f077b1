#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace camgate::capture {

// Makes a caller-supplied id safe to embed in a file name: characters outside
// `[A-Za-z0-9._-]` become '_' and leading dots are replaced so the result can
// never name a parent directory or a hidden file. Empty input -> `no_id`.
std::string SanitizeCaptureId(std::string_view id);

// `<prefix>_<YYYY-MM-DD_HH-MM-SS>_<id>.jpg`, with prefix and id sanitized.
std::string BuildCaptureFileName(std::string_view prefix,
                                 std::chrono::system_clock::time_point captured_at,
                                 std::string_view id);

} // namespace camgate::capture
