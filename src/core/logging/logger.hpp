#pragma once

#include "core/logging/log_journal.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>

namespace camgate::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

namespace detail {

struct LevelName {
  std::string_view name;
  LogLevel level;
};

// Accepted `--log-level` spellings; the first entry per level is canonical.
constexpr std::array<LevelName, 5> kLevelNames{{
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
}};

inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace detail

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  for (const auto& entry : detail::kLevelNames) {
    if (detail::EqualsIgnoreCase(raw, entry.name)) {
      level = entry.level;
      return true;
    }
  }
  if (raw.empty()) {
    error = "missing value for --log-level (expected debug|info|warn|error)";
  } else {
    error = "invalid --log-level '" + std::string(raw) + "' (expected debug|info|warn|error)";
  }
  return false;
}

// Leveled front-end over the shared LogJournal.
//
// Renders `LEVEL message key="value" ...` and hands the line to the journal,
// which owns timestamping, fan-out and thread safety. The minimum level is
// expected to be set once during startup before worker threads exist.
class Logger {
public:
  explicit Logger(LogJournal& journal, LogLevel min_level = LogLevel::kInfo)
      : journal_(&journal), min_level_(min_level) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  LogJournal& Journal() const {
    return *journal_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line = ToString(level);
    line.push_back(' ');
    AppendEscaped(line, message);
    for (const auto& field : fields) {
      line.push_back(' ');
      line.append(field.key);
      line.append("=\"");
      AppendEscaped(line, field.value);
      line.push_back('"');
    }
    journal_->Append(line);
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  // One journal entry must stay one line, so line breaks are escaped.
  static void AppendEscaped(std::string& out, std::string_view raw) {
    out.reserve(out.size() + raw.size());
    for (const char c : raw) {
      switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
        break;
      }
    }
  }

  LogJournal* journal_ = nullptr;
  LogLevel min_level_ = LogLevel::kInfo;
};

} // namespace camgate::core::logging
