#include "config/ini_document.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace camgate::config {

namespace {

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

// Section names compare case-sensitively except DEFAULT, which is canonical.
std::string CanonicalSection(std::string_view section) {
  if (ToLowerAscii(section) == "default") {
    return std::string(IniDocument::kDefaultSection);
  }
  return std::string(section);
}

} // namespace

bool IniDocument::Parse(std::string_view text, std::string& error) {
  error.clear();
  sections_.clear();

  std::string current_section(kDefaultSection);
  std::istringstream input{std::string(text)};
  std::string raw_line;
  std::size_t line_number = 0;
  while (std::getline(input, raw_line)) {
    ++line_number;
    const std::string_view line = Trim(raw_line);
    if (line.empty() || line.front() == ';' || line.front() == '#') {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3U) {
        error = "line " + std::to_string(line_number) + ": malformed section header";
        return false;
      }
      current_section = CanonicalSection(Trim(line.substr(1, line.size() - 2U)));
      continue;
    }

    const std::size_t separator = line.find_first_of("=:");
    if (separator == std::string_view::npos) {
      error = "line " + std::to_string(line_number) + ": expected 'key = value'";
      return false;
    }

    const std::string key = ToLowerAscii(Trim(line.substr(0, separator)));
    if (key.empty()) {
      error = "line " + std::to_string(line_number) + ": empty key";
      return false;
    }
    sections_[current_section][key] = std::string(Trim(line.substr(separator + 1U)));
  }
  return true;
}

bool IniDocument::LoadFile(const std::filesystem::path& path, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open config file: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (!Parse(text, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

std::optional<std::string> IniDocument::Get(std::string_view section,
                                            std::string_view key) const {
  const auto section_it = sections_.find(CanonicalSection(section));
  if (section_it == sections_.end()) {
    return std::nullopt;
  }
  const auto value_it = section_it->second.find(ToLowerAscii(key));
  if (value_it == section_it->second.end()) {
    return std::nullopt;
  }
  return value_it->second;
}

std::vector<std::string> IniDocument::KeysWithPrefix(std::string_view section,
                                                     std::string_view prefix) const {
  std::vector<std::string> keys;
  const auto section_it = sections_.find(CanonicalSection(section));
  if (section_it == sections_.end()) {
    return keys;
  }
  const std::string lowered_prefix = ToLowerAscii(prefix);
  for (const auto& [key, value] : section_it->second) {
    (void)value;
    if (key.rfind(lowered_prefix, 0U) == 0U) {
      keys.push_back(key);
    }
  }
  return keys;
}

} // namespace camgate::config
