#include "api/control_api.hpp"

#include "api/content_type.hpp"
#include "capture/capture_orchestrator.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "transfer/chunked_transfer.hpp"

#include <charconv>
#include <exception>
#include <sstream>
#include <system_error>
#include <utility>

namespace camgate::api {

namespace {

constexpr std::size_t kLoggedResponseLimit = 500U;
constexpr const char* kMissingId = "no_id";

std::string QueryValue(const std::map<std::string, std::string>& query, const std::string& key,
                       const std::string& fallback) {
  const auto it = query.find(key);
  if (it == query.end()) {
    return fallback;
  }
  return it->second;
}

std::string EscapedText(std::string_view text) {
  return core::JsonString(core::EscapeMarkup(text));
}

ApiResponse MakeJson(std::string body) {
  ApiResponse response;
  response.status = 200;
  response.content_type = "application/json";
  response.body = std::move(body);
  return response;
}

ApiResponse MakeInternalError() {
  ApiResponse response;
  response.status = 500;
  response.content_type = "text/plain";
  response.body = "Internal Server Error";
  return response;
}

} // namespace

std::int64_t ParseQueryInt(const std::map<std::string, std::string>& query,
                           const std::string& key, std::int64_t fallback) {
  const auto it = query.find(key);
  if (it == query.end()) {
    return fallback;
  }

  std::string_view text = it->second;
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return fallback;
  }

  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return fallback;
  }
  return value;
}

ControlApi::ControlApi(capture::CaptureOrchestrator& orchestrator,
                       transfer::ChunkedTransferService& transfer, ControlApiOptions options,
                       core::logging::Logger& logger)
    : orchestrator_(orchestrator), transfer_(transfer), options_(std::move(options)),
      logger_(logger) {}

void ControlApi::SetCaptureObserver(CaptureObserver observer) {
  observer_ = std::move(observer);
}

ApiResponse ControlApi::Handle(const ApiRequest& request) {
  try {
    if (request.method != "GET") {
      ApiResponse response;
      response.status = 404;
      response.content_type = "text/plain";
      return response;
    }
    if (request.path == "/capture") {
      return HandleCapture(request);
    }
    if (request.path == "/get_file_chunk") {
      return HandleFileChunk(request);
    }
    if (request.path == "/get_img") {
      return HandleImage(request);
    }

    logger_.Info("unknown route", {{"path", request.path}});
    ApiResponse response;
    response.status = 404;
    response.content_type = "text/plain";
    return response;
  } catch (const std::exception& ex) {
    logger_.Error("error handling request", {{"path", request.path}, {"error", ex.what()}});
    return MakeInternalError();
  }
}

ApiResponse ControlApi::HandleCapture(const ApiRequest& request) {
  const std::string id = QueryValue(request.query, "id", kMissingId);
  logger_.Info("/capture request received", {{"id", id}});

  const capture::CaptureResult result = orchestrator_.CaptureSync(id, options_.capture_timeout);

  const std::string message = result.success ? std::string("Ok") : result.error_message;
  std::ostringstream body;
  body << "{\"has_error\": " << core::JsonBool(!result.success)
       << ", \"message\": " << EscapedText(message)
       << ", \"id\": " << core::JsonString(id)
       << ", \"file_size_in_bytes\": " << result.file_size_bytes
       << ", \"file_path\": " << core::JsonString(result.file_path.string())
       << ", \"log\": " << EscapedText(logger_.Journal().Body()) << "}";

  ApiResponse response = MakeJson(body.str());
  LogResponse("/capture", response.body);

  if (observer_) {
    observer_(result);
  }
  return response;
}

ApiResponse ControlApi::HandleFileChunk(const ApiRequest& request) {
  const std::string id = QueryValue(request.query, "id", kMissingId);
  const std::string file_path = QueryValue(request.query, "file_path", "");
  const std::int64_t offset = ParseQueryInt(request.query, "offset_in_bytes", 0);
  const std::int64_t chunk_size =
      ParseQueryInt(request.query, "chunk_size_in_bytes", transfer::kDefaultChunkSizeBytes);

  logger_.Info("/get_file_chunk request",
               {{"id", id}, {"offset", std::to_string(offset)},
                {"chunk_size", std::to_string(chunk_size)}});

  const transfer::ChunkResponse chunk = transfer_.GetChunk(file_path, offset, chunk_size);

  std::ostringstream body;
  body << "{\"has_error\": " << core::JsonBool(chunk.has_error)
       << ", \"message\": " << EscapedText(chunk.message)
       << ", \"id\": " << core::JsonString(id)
       << ", \"file_size_in_bytes\": " << chunk.file_size_bytes
       << ", \"file_path\": " << core::JsonString(file_path)
       << ", \"is_last_chunk\": " << core::JsonBool(chunk.is_last_chunk)
       << ", \"offset_in_bytes\": " << chunk.offset_bytes
       << ", \"chunk_size_in_bytes\": " << chunk.chunk_size_bytes
       << ", \"chunk_body_as_base64\": " << core::JsonString(chunk.chunk_body_base64)
       << ", \"log\": " << EscapedText(chunk.log) << "}";

  ApiResponse response = MakeJson(body.str());
  LogResponse("/get_file_chunk", response.body);
  return response;
}

ApiResponse ControlApi::HandleImage(const ApiRequest& request) {
  const std::string id = QueryValue(request.query, "id", kMissingId);
  const std::string file_name = QueryValue(request.query, "file_name", "");
  logger_.Info("/get_img request", {{"id", id}, {"file_name", file_name}});

  std::filesystem::path to_serve;
  if (file_name.empty() || !transfer_.ResolveServedPath(file_name, to_serve)) {
    logger_.Warn("/get_img access denied, serving placeholder", {{"id", id}});
    to_serve = options_.placeholder_image_path;
  } else {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(to_serve, ec)) {
      logger_.Info("/get_img file not found, serving placeholder",
                   {{"file", to_serve.string()}});
      to_serve = options_.placeholder_image_path;
    }
  }

  std::string bytes;
  std::string error;
  if (!core::ReadFileBytes(to_serve, bytes, error)) {
    logger_.Error("/get_img failed to serve file", {{"error", error}});
    return MakeInternalError();
  }

  ApiResponse response;
  response.status = 200;
  response.content_type = GuessContentType(to_serve);
  response.body = std::move(bytes);
  logger_.Info("/get_img served", {{"file", to_serve.string()},
                                   {"bytes", std::to_string(response.body.size())}});
  return response;
}

void ControlApi::LogResponse(const std::string& route, const std::string& body) {
  const std::string excerpt = body.substr(0, kLoggedResponseLimit);
  logger_.Info(route + " response", {{"body", excerpt}});
}

} // namespace camgate::api
