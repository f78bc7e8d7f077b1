#include "api/content_type.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace camgate::api {

namespace {

struct ExtensionMapping {
  std::string_view extension;
  std::string_view content_type;
};

constexpr ExtensionMapping kMappings[] = {
    {".jpg", "image/jpeg"},  {".jpeg", "image/jpeg"},      {".png", "image/png"},
    {".gif", "image/gif"},   {".bmp", "image/bmp"},        {".webp", "image/webp"},
    {".txt", "text/plain"},  {".json", "application/json"},
};

} // namespace

std::string GuessContentType(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (const auto& mapping : kMappings) {
    if (mapping.extension == extension) {
      return std::string(mapping.content_type);
    }
  }
  return "application/octet-stream";
}

} // namespace camgate::api
