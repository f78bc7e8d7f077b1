#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::transfer {

constexpr std::int64_t kDefaultChunkSizeBytes = 1048576;
constexpr std::int64_t kMaxChunkSizeBytes = 16 * 1048576;

// Message used for every containment denial. It never echoes the path.
inline constexpr const char* kAccessDeniedMessage =
    "Access denied: file_path not in allowed photo folder";

// One self-describing chunk record.
//
// `is_last_chunk == (offset_bytes + decoded body length >= file_size_bytes)`
// on success. Every error record carries `is_last_chunk = true` and an empty
// body so a client loop always terminates. `offset_bytes` and
// `chunk_size_bytes` echo the effective values used for the read.
struct ChunkResponse {
  bool has_error = false;
  std::string message;
  std::uint64_t file_size_bytes = 0;
  bool is_last_chunk = true;
  std::int64_t offset_bytes = 0;
  std::int64_t chunk_size_bytes = kDefaultChunkSizeBytes;
  std::string chunk_body_base64;
  // Journal snapshot taken after the request was handled.
  std::string log;
};

// Stateless offset-addressed reader over files under one photo root.
//
// Relative `file_path` values resolve against the root. The resolved path
// must be a strict descendant of the root after normalization, otherwise the
// request is denied without touching the file.
class ChunkedTransferService {
public:
  ChunkedTransferService(std::filesystem::path photo_root, core::logging::Logger& logger);

  ChunkResponse GetChunk(const std::string& file_path, std::int64_t offset_bytes,
                         std::int64_t chunk_size_bytes) const;

  // Containment check shared with the static image route.
  bool ResolveServedPath(const std::filesystem::path& requested,
                         std::filesystem::path& resolved) const;

  const std::filesystem::path& PhotoRoot() const {
    return photo_root_;
  }

private:
  ChunkResponse Finish(ChunkResponse response) const;

  std::filesystem::path photo_root_;
  core::logging::Logger& logger_;
};

// Maps malformed values to the defaults and clamps oversized chunks.
std::int64_t NormalizeOffset(std::int64_t offset_bytes);
std::int64_t NormalizeChunkSize(std::int64_t chunk_size_bytes);

} // namespace camgate::transfer
