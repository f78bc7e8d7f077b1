#include "config/service_config.hpp"

#include "config/ini_document.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace camgate::config {

namespace {

constexpr std::string_view kSection = IniDocument::kDefaultSection;
constexpr std::string_view kForegroundCommandPrefix = "foreground_command";

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseUnsigned(const std::string& raw, std::uint64_t& value) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

fs::path AbsoluteOrSelf(const fs::path& path) {
  std::error_code ec;
  fs::path absolute_path = fs::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return absolute_path.lexically_normal();
}

// `foreground_command`, `foreground_command.1`, `foreground_command.2`, ...
// ordered by numeric suffix; a bare key sorts first.
std::vector<std::string> CollectForegroundCommands(const IniDocument& document) {
  std::vector<std::pair<std::uint64_t, std::string>> ordered;
  for (const std::string& key : document.KeysWithPrefix(kSection, kForegroundCommandPrefix)) {
    std::uint64_t order = 0;
    const std::string suffix = key.substr(kForegroundCommandPrefix.size());
    if (!suffix.empty()) {
      if (suffix.front() != '.' || !ParseUnsigned(suffix.substr(1), order)) {
        continue;
      }
    }
    const std::optional<std::string> command = document.Get(kSection, key);
    if (command.has_value() && !command->empty()) {
      ordered.emplace_back(order, *command);
    }
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

  std::vector<std::string> commands;
  commands.reserve(ordered.size());
  for (auto& entry : ordered) {
    commands.push_back(std::move(entry.second));
  }
  return commands;
}

} // namespace

bool ParseConfigBool(const std::string& raw, bool& value) {
  const std::string normalized = ToLowerAscii(raw);
  if (normalized == "true" || normalized == "yes" || normalized == "on" || normalized == "1") {
    value = true;
    return true;
  }
  if (normalized == "false" || normalized == "no" || normalized == "off" || normalized == "0") {
    value = false;
    return true;
  }
  return false;
}

fs::path ResolvePhotoRoot(const std::string& setting, const fs::path& config_dir) {
  if (setting.empty() || setting == kDefaultPhotoFolderSentinel) {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    return AbsoluteOrSelf((ec ? fs::path(".") : cwd) / "photos");
  }
  if (setting.rfind("//", 0U) == 0U) {
    std::string relative = setting;
    relative.erase(0, relative.find_first_not_of('/'));
    return AbsoluteOrSelf(config_dir / relative);
  }
  return AbsoluteOrSelf(setting);
}

bool LoadServiceConfig(const fs::path& config_path, ServiceConfig& config, std::string& error) {
  error.clear();
  config = ServiceConfig{};
  config.config_path = AbsoluteOrSelf(config_path);
  const fs::path config_dir = config.config_path.parent_path();

  IniDocument document;
  std::error_code ec;
  if (fs::exists(config.config_path, ec) && !ec) {
    if (!document.LoadFile(config.config_path, error)) {
      return false;
    }
    config.config_file_found = true;
  } else {
    config.warnings.push_back("config file not found, using defaults: " +
                              config.config_path.string());
  }

  const auto read = [&](std::string_view key) { return document.Get(kSection, key); };

  if (const auto raw = read("port"); raw.has_value()) {
    std::uint64_t port = 0;
    if (!ParseUnsigned(*raw, port) || port == 0U ||
        port > std::numeric_limits<std::uint16_t>::max()) {
      error = "config 'port' must be an integer in 1..65535 (got '" + *raw + "')";
      return false;
    }
    config.port = static_cast<std::uint16_t>(port);
  }

  if (const auto raw = read("bind_address"); raw.has_value() && !raw->empty()) {
    config.bind_address = *raw;
  }

  if (const auto raw = read("photo_folder_path"); raw.has_value() && !raw->empty()) {
    config.photo_folder_setting = *raw;
  }
  config.photo_root = ResolvePhotoRoot(config.photo_folder_setting, config_dir);

  if (const auto raw = read("wait_x_seconds_on_ui_capture"); raw.has_value()) {
    std::uint64_t seconds = 0;
    if (!ParseUnsigned(*raw, seconds) || seconds == 0U) {
      error = "config 'wait_x_seconds_on_ui_capture' must be a positive integer (got '" + *raw +
              "')";
      return false;
    }
    config.capture_timeout = std::chrono::seconds(static_cast<std::int64_t>(seconds));
  }

  if (const auto raw = read("preview_last_photo"); raw.has_value()) {
    if (!ParseConfigBool(*raw, config.preview_last_photo)) {
      error = "config 'preview_last_photo' must be a boolean (got '" + *raw + "')";
      return false;
    }
  }

  config.placeholder_image_path = config_dir / "dummy.jpg";
  if (const auto raw = read("dummy_file_path"); raw.has_value() && !raw->empty()) {
    const fs::path configured(*raw);
    config.placeholder_image_path =
        configured.is_absolute() ? configured : AbsoluteOrSelf(config_dir / configured);
  }

  config.log_file_path = config_dir / "camgate.log";
  if (const auto raw = read("log_file_path"); raw.has_value() && !raw->empty()) {
    const fs::path configured(*raw);
    config.log_file_path =
        configured.is_absolute() ? configured : AbsoluteOrSelf(config_dir / configured);
  }

  if (const auto raw = read("file_prefix"); raw.has_value() && !raw->empty()) {
    config.file_prefix = *raw;
  }

  if (const auto raw = read("camera_index"); raw.has_value()) {
    std::uint64_t index = 0;
    if (!ParseUnsigned(*raw, index) || index > 255U) {
      error = "config 'camera_index' must be an integer in 0..255 (got '" + *raw + "')";
      return false;
    }
    config.camera_index = static_cast<std::size_t>(index);
  }

  config.foreground_commands = CollectForegroundCommands(document);
  return true;
}

} // namespace camgate::config
