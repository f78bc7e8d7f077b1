#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace camgate::cli {

struct FetchOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8080U;
  std::string id;
  std::filesystem::path output_dir = ".";
  std::int64_t chunk_size_bytes = 1048576;
  // Read timeout for the `/capture` call; should exceed the server's
  // capture timeout.
  std::chrono::seconds capture_timeout{90};
};

struct FetchResult {
  std::string remote_file_path;
  std::filesystem::path local_file_path;
  std::uint64_t file_size_bytes = 0;
  std::size_t chunk_count = 0;
};

// Client side of the control surface: triggers `/capture`, then pulls the
// produced file through `/get_file_chunk` with advancing offsets until the
// server reports the last chunk, and writes the reassembled bytes to
// `<output_dir>/<remote file name>`.
bool FetchCapture(const FetchOptions& options, FetchResult& result, std::string& error);

} // namespace camgate::cli
