#include "camgate/cli/fetch_client.hpp"

#include "core/base64.hpp"
#include "core/fs_utils.hpp"
#include "core/json_record.hpp"

#include <httplib.h>

namespace camgate::cli {

namespace {

bool GetRecord(httplib::Client& client, const std::string& path, const httplib::Params& params,
               core::json::Record& record, std::string& error) {
  const httplib::Result response = client.Get(path, params, httplib::Headers{});
  if (!response) {
    error = "request to " + path + " failed: " + httplib::to_string(response.error());
    return false;
  }
  if (response->status != 200) {
    error = "request to " + path + " returned HTTP " + std::to_string(response->status);
    return false;
  }
  if (!record.Parse(response->body, error)) {
    error = "invalid response from " + path + ": " + error;
    return false;
  }
  return true;
}

bool ReadServerError(const core::json::Record& record, std::string& error) {
  bool has_error = false;
  if (!record.GetBool("has_error", has_error, error)) {
    return true;
  }
  if (!has_error) {
    return false;
  }
  std::string message;
  std::string ignored;
  (void)record.GetString("message", message, ignored);
  error = "server reported: " + message;
  return true;
}

} // namespace

bool FetchCapture(const FetchOptions& options, FetchResult& result, std::string& error) {
  if (options.id.empty()) {
    error = "capture id cannot be empty";
    return false;
  }
  if (options.chunk_size_bytes <= 0) {
    error = "chunk size must be positive";
    return false;
  }

  httplib::Client client(options.host, options.port);
  client.set_connection_timeout(std::chrono::seconds(5));
  client.set_read_timeout(options.capture_timeout);

  core::json::Record capture;
  if (!GetRecord(client, "/capture", httplib::Params{{"id", options.id}}, capture, error)) {
    return false;
  }
  if (ReadServerError(capture, error)) {
    return false;
  }
  if (!capture.GetString("file_path", result.remote_file_path, error)) {
    return false;
  }

  const std::filesystem::path remote_name =
      std::filesystem::path(result.remote_file_path).filename();
  if (remote_name.empty()) {
    error = "server returned an empty file path";
    return false;
  }

  std::string bytes;
  std::int64_t offset = 0;
  while (true) {
    core::json::Record chunk;
    const httplib::Params params{
        {"id", options.id},
        {"file_path", result.remote_file_path},
        {"offset_in_bytes", std::to_string(offset)},
        {"chunk_size_in_bytes", std::to_string(options.chunk_size_bytes)},
    };
    if (!GetRecord(client, "/get_file_chunk", params, chunk, error)) {
      return false;
    }
    if (ReadServerError(chunk, error)) {
      return false;
    }

    std::string body_base64;
    bool is_last = true;
    std::int64_t file_size = 0;
    if (!chunk.GetString("chunk_body_as_base64", body_base64, error) ||
        !chunk.GetBool("is_last_chunk", is_last, error) ||
        !chunk.GetInteger("file_size_in_bytes", file_size, error)) {
      return false;
    }

    std::string decoded;
    if (!core::Base64Decode(body_base64, decoded, error)) {
      error = "chunk at offset " + std::to_string(offset) + " is not valid base64: " + error;
      return false;
    }
    bytes += decoded;
    offset += static_cast<std::int64_t>(decoded.size());
    ++result.chunk_count;
    result.file_size_bytes = static_cast<std::uint64_t>(file_size);

    if (is_last) {
      break;
    }
    if (decoded.empty()) {
      error = "server returned an empty non-final chunk at offset " + std::to_string(offset);
      return false;
    }
  }

  if (bytes.size() != result.file_size_bytes) {
    error = "downloaded " + std::to_string(bytes.size()) + " bytes, expected " +
            std::to_string(result.file_size_bytes);
    return false;
  }

  result.local_file_path = options.output_dir / remote_name;
  return core::WriteFileAtomic(result.local_file_path, bytes, error);
}

} // namespace camgate::cli
