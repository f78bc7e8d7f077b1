#pragma once

#include "capture/capture_types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {
class CaptureOrchestrator;
}

namespace camgate::transfer {
class ChunkedTransferService;
}

namespace camgate::api {

// Transport-neutral request: decoded path plus decoded query parameters.
struct ApiRequest {
  std::string method = "GET";
  std::string path;
  std::map<std::string, std::string> query;
};

struct ApiResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
};

struct ControlApiOptions {
  std::filesystem::path placeholder_image_path;
  std::chrono::milliseconds capture_timeout{60'000};
};

using CaptureObserver = std::function<void(const capture::CaptureResult&)>;

// Request router for the control surface.
//
// Routes:
//   GET /capture?id=
//   GET /get_file_chunk?id=&file_path=&offset_in_bytes=&chunk_size_in_bytes=
//   GET /get_img?id=&file_name=
// Anything else answers 404. A `std::exception` escaping a handler is logged
// and answered with 500 `Internal Server Error`.
//
// Free text (`message`, `log`) is markup-escaped and then JSON-escaped, so
// neither markup nor control characters in log lines can break the body.
class ControlApi {
public:
  ControlApi(capture::CaptureOrchestrator& orchestrator,
             transfer::ChunkedTransferService& transfer, ControlApiOptions options,
             core::logging::Logger& logger);

  // Invoked after every `/capture` response has been rendered.
  void SetCaptureObserver(CaptureObserver observer);

  ApiResponse Handle(const ApiRequest& request);

private:
  ApiResponse HandleCapture(const ApiRequest& request);
  ApiResponse HandleFileChunk(const ApiRequest& request);
  ApiResponse HandleImage(const ApiRequest& request);

  void LogResponse(const std::string& route, const std::string& body);

  capture::CaptureOrchestrator& orchestrator_;
  transfer::ChunkedTransferService& transfer_;
  ControlApiOptions options_;
  core::logging::Logger& logger_;
  CaptureObserver observer_;
};

// Lenient integer parsing for query parameters: surrounding whitespace and a
// leading sign are accepted, anything else yields `fallback`.
std::int64_t ParseQueryInt(const std::map<std::string, std::string>& query,
                           const std::string& key, std::int64_t fallback);

} // namespace camgate::api
