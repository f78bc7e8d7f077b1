#include "core/logging/log_journal.hpp"

#include "core/time_utils.hpp"

#include <chrono>
#include <system_error>
#include <utility>

namespace camgate::core::logging {

LogJournal::LogJournal(std::ostream& console) : console_(&console) {}

LogJournal::LogJournal(std::filesystem::path file_path, std::ostream& console)
    : console_(&console), file_path_(std::move(file_path)) {
  if (file_path_.empty()) {
    return;
  }

  std::error_code ec;
  const std::filesystem::path parent_dir = file_path_.parent_path();
  if (!parent_dir.empty()) {
    std::filesystem::create_directories(parent_dir, ec);
  }

  file_.open(file_path_, std::ios::out | std::ios::app);
  if (!file_) {
    (*console_) << "warning: unable to open log file '" << file_path_.string()
                << "', continuing with console output only\n";
    console_->flush();
  }
}

void LogJournal::Append(std::string_view line) {
  std::string stamped = FormatLogTimestamp(std::chrono::system_clock::now());
  stamped.push_back(' ');
  stamped.append(line);

  std::lock_guard<std::mutex> lock(mutex_);
  (*console_) << stamped << '\n';
  console_->flush();
  if (file_.is_open()) {
    file_ << stamped << '\n';
    file_.flush();
  }
  lines_.push_back(std::move(stamped));
}

std::vector<std::string> LogJournal::ReadSince(long long cursor) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cursor < 0) {
    cursor = 0;
  }
  const auto start = static_cast<std::size_t>(cursor);
  if (start >= lines_.size()) {
    return {};
  }
  return std::vector<std::string>(lines_.begin() + static_cast<std::ptrdiff_t>(start),
                                  lines_.end());
}

std::string LogJournal::Body() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string body;
  for (const auto& line : lines_) {
    body.append(line);
    body.push_back('\n');
  }
  return body;
}

std::size_t LogJournal::LineCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_.size();
}

} // namespace camgate::core::logging
