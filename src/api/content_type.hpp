#pragma once

#include <filesystem>
#include <string>

namespace camgate::api {

// Content type guessed from the file extension (case-insensitive).
// Unknown extensions map to `application/octet-stream`.
std::string GuessContentType(const std::filesystem::path& path);

} // namespace camgate::api
