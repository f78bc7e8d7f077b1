#include "transfer/chunked_transfer.hpp"

#include "core/base64.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace camgate::transfer {

std::int64_t NormalizeOffset(std::int64_t offset_bytes) {
  return offset_bytes < 0 ? 0 : offset_bytes;
}

std::int64_t NormalizeChunkSize(std::int64_t chunk_size_bytes) {
  if (chunk_size_bytes <= 0) {
    return kDefaultChunkSizeBytes;
  }
  if (chunk_size_bytes > kMaxChunkSizeBytes) {
    return kMaxChunkSizeBytes;
  }
  return chunk_size_bytes;
}

ChunkedTransferService::ChunkedTransferService(std::filesystem::path photo_root,
                                               core::logging::Logger& logger)
    : photo_root_(std::move(photo_root)), logger_(logger) {}

bool ChunkedTransferService::ResolveServedPath(const std::filesystem::path& requested,
                                               std::filesystem::path& resolved) const {
  return core::ResolveWithinRoot(photo_root_, requested, resolved);
}

ChunkResponse ChunkedTransferService::Finish(ChunkResponse response) const {
  response.log = logger_.Journal().Body();
  return response;
}

ChunkResponse ChunkedTransferService::GetChunk(const std::string& file_path,
                                               std::int64_t offset_bytes,
                                               std::int64_t chunk_size_bytes) const {
  ChunkResponse response;
  response.offset_bytes = NormalizeOffset(offset_bytes);
  response.chunk_size_bytes = NormalizeChunkSize(chunk_size_bytes);

  std::filesystem::path resolved;
  if (file_path.empty() || !ResolveServedPath(file_path, resolved)) {
    response.has_error = true;
    response.message = kAccessDeniedMessage;
    logger_.Warn("chunk request denied outside photo folder",
                 {{"photo_root", photo_root_.string()}});
    return Finish(std::move(response));
  }

  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(resolved, ec);
  if (ec) {
    response.has_error = true;
    response.message = "Error reading file size: " + ec.message();
    logger_.Error("chunk request failed to size file",
                  {{"file_path", resolved.string()}, {"error", ec.message()}});
    return Finish(std::move(response));
  }
  response.file_size_bytes = static_cast<std::uint64_t>(size);

  const auto offset = static_cast<std::uint64_t>(response.offset_bytes);
  if (offset >= response.file_size_bytes) {
    response.message = "Ok";
    response.is_last_chunk = true;
    logger_.Debug("chunk request past end of file",
                  {{"file_path", resolved.string()},
                   {"offset", std::to_string(response.offset_bytes)}});
    return Finish(std::move(response));
  }

  std::ifstream input(resolved, std::ios::binary);
  if (!input) {
    response.has_error = true;
    response.message = "Error reading file: failed to open '" + resolved.string() + "'";
    logger_.Error("chunk request failed to open file", {{"file_path", resolved.string()}});
    return Finish(std::move(response));
  }

  const std::uint64_t remaining = response.file_size_bytes - offset;
  const std::uint64_t wanted = remaining < static_cast<std::uint64_t>(response.chunk_size_bytes)
                                   ? remaining
                                   : static_cast<std::uint64_t>(response.chunk_size_bytes);
  std::vector<char> buffer(static_cast<std::size_t>(wanted));
  input.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  if (input.bad() || (input.fail() && !input.eof())) {
    response.has_error = true;
    response.message = "Error reading file: read failed at offset " +
                       std::to_string(response.offset_bytes);
    logger_.Error("chunk read failed", {{"file_path", resolved.string()},
                                        {"offset", std::to_string(response.offset_bytes)}});
    return Finish(std::move(response));
  }

  const auto bytes_read = static_cast<std::uint64_t>(input.gcount());
  response.chunk_body_base64 =
      core::Base64Encode(std::string_view(buffer.data(), static_cast<std::size_t>(bytes_read)));
  response.is_last_chunk = offset + bytes_read >= response.file_size_bytes;
  response.message = "Ok";

  logger_.Debug("chunk served", {{"file_path", resolved.string()},
                                 {"offset", std::to_string(response.offset_bytes)},
                                 {"bytes", std::to_string(bytes_read)},
                                 {"last", response.is_last_chunk ? "true" : "false"}});
  return Finish(std::move(response));
}

} // namespace camgate::transfer
