#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camgate::config {

// Small INI reader for the service config file.
//
// Rules:
// - `[section]` headers switch the current section; keys before any header
//   land in `DEFAULT`
// - `key = value` or `key: value`; keys are lower-cased, values trimmed
// - lines starting with `;` or `#` and blank lines are ignored
// - a later duplicate key overrides an earlier one
class IniDocument {
public:
  static constexpr std::string_view kDefaultSection = "DEFAULT";

  bool Parse(std::string_view text, std::string& error);
  bool LoadFile(const std::filesystem::path& path, std::string& error);

  std::optional<std::string> Get(std::string_view section, std::string_view key) const;

  // Keys of `section` starting with `prefix`, in lexical order.
  std::vector<std::string> KeysWithPrefix(std::string_view section,
                                          std::string_view prefix) const;

private:
  std::map<std::string, std::map<std::string, std::string>> sections_;
};

} // namespace camgate::config
