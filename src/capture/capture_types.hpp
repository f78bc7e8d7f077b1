#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace camgate::capture {

// Failure text returned when no capture was observed before the deadline.
inline constexpr const char* kCaptureSurfaceUnreachableMessage = "capture surface not reachable";

// Failure text returned when another capture held the camera until the deadline.
inline constexpr const char* kCaptureBusyMessage = "capture already in progress";

// Outcome of one capture attempt. Produced exactly once per `CaptureSync`
// call and never modified afterwards.
struct CaptureResult {
  bool success = false;
  std::filesystem::path file_path;
  std::uint64_t file_size_bytes = 0;
  std::string error_message;
};

enum class CaptureOutcome {
  kPending = 0,
  kSucceeded,
  kTimedOut,
  kDenied,
};

const char* ToString(CaptureOutcome outcome);

// Transient per-request state; lives only for the duration of one
// `CaptureOrchestrator::CaptureSync` call.
struct CaptureSession {
  std::string request_id;
  std::filesystem::path target_path;
  std::chrono::steady_clock::time_point started_at{};
  std::chrono::steady_clock::time_point deadline{};
  CaptureOutcome outcome = CaptureOutcome::kPending;
};

} // namespace camgate::capture
