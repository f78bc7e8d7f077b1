#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace camgate::config {

constexpr std::uint16_t kDefaultPort = 8080U;
constexpr std::chrono::seconds kDefaultCaptureTimeout{60};
constexpr const char* kDefaultConfigFileName = "camgate.ini";
constexpr const char* kDefaultPhotoFolderSentinel = "default";

// Resolved service settings. Paths are absolute once `LoadServiceConfig`
// returns successfully.
struct ServiceConfig {
  std::filesystem::path config_path;
  bool config_file_found = false;

  std::uint16_t port = kDefaultPort;
  std::string bind_address = "0.0.0.0";
  std::string photo_folder_setting = kDefaultPhotoFolderSentinel;
  std::filesystem::path photo_root;
  std::chrono::seconds capture_timeout = kDefaultCaptureTimeout;
  bool preview_last_photo = false;
  std::filesystem::path placeholder_image_path;
  std::filesystem::path log_file_path;
  std::string file_prefix = "CamGate";
  std::size_t camera_index = 0U;
  std::vector<std::string> foreground_commands;

  // Non-fatal observations made while loading (for example, a missing config
  // file). Logged once the journal exists.
  std::vector<std::string> warnings;
};

// Resolves the photo folder setting:
// - `default`      -> `<cwd>/photos`
// - `//relative`   -> `<config dir>/relative`
// - anything else  -> used as given (relative paths resolve against cwd)
std::filesystem::path ResolvePhotoRoot(const std::string& setting,
                                       const std::filesystem::path& config_dir);

// Loads `config_path`. A missing file yields defaults plus a warning; any
// unparsable value is an error.
bool LoadServiceConfig(const std::filesystem::path& config_path, ServiceConfig& config,
                       std::string& error);

// Parses the bool spellings accepted in the config file.
bool ParseConfigBool(const std::string& raw, bool& value);

} // namespace camgate::config
