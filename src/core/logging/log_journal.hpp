#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace camgate::core::logging {

// Process-wide append-only line journal.
//
// Every component appends through one injected instance. Each line is stamped
// with local time, kept in memory for the lifetime of the process, mirrored to
// a console stream and appended to an optional file. Readers keep their own
// cursor (number of lines already consumed) and pull only what is new.
//
// Appends and reads are serialized by one mutex so concurrent writers (HTTP
// workers, the orchestrator, device worker threads) never interleave partial
// lines and readers always see a consistent prefix.
class LogJournal {
public:
  explicit LogJournal(std::ostream& console = std::cout);
  LogJournal(std::filesystem::path file_path, std::ostream& console = std::cout);

  LogJournal(const LogJournal&) = delete;
  LogJournal& operator=(const LogJournal&) = delete;

  void Append(std::string_view line);

  // Lines appended after the first `cursor` lines. A negative cursor is
  // treated as zero; a cursor at or past the end yields an empty list.
  std::vector<std::string> ReadSince(long long cursor) const;

  // All lines joined with '\n', including the trailing newline.
  std::string Body() const;

  std::size_t LineCount() const;

  const std::filesystem::path& FilePath() const {
    return file_path_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::ostream* console_ = &std::cout;
  std::filesystem::path file_path_;
  std::ofstream file_;
};

} // namespace camgate::core::logging
