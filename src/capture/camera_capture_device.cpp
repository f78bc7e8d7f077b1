#include "capture/camera_capture_device.hpp"

#include "capture/placeholder_artifact.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"

#include <array>
#include <thread>
#include <utility>

namespace camgate::capture {

namespace {

struct OpenAttempt {
  const char* label;
  bool apply_backoff;
};

constexpr std::array<OpenAttempt, 2> kOpenPlan = {{
    {"primary", false},
    {"retry", true},
}};

} // namespace

const char* ToString(CaptureJobState state) {
  switch (state) {
  case CaptureJobState::kAttempting:
    return "attempting";
  case CaptureJobState::kSucceeded:
    return "succeeded";
  case CaptureJobState::kFellBackToPlaceholder:
    return "fell_back_to_placeholder";
  case CaptureJobState::kFailed:
    return "failed";
  }
  return "attempting";
}

CameraCaptureDevice::CameraCaptureDevice(std::unique_ptr<ICameraSource> source,
                                         CameraCaptureOptions options,
                                         core::logging::Logger& logger)
    : source_(std::move(source)),
      options_(std::move(options)),
      logger_(logger),
      worker_("camera", logger) {}

CameraCaptureDevice::~CameraCaptureDevice() = default;

bool CameraCaptureDevice::StartCapture(const std::filesystem::path& target_path,
                                       std::string& error) {
  if (source_ == nullptr) {
    error = "camera device has no camera source";
    return false;
  }
  logger_.Info("scheduling camera capture",
               {{"target", target_path.string()},
                {"camera_index", std::to_string(options_.camera_index)}});
  return worker_.Post(
      [this, target_path] {
        const CaptureJobState state = RunCaptureJob(target_path);
        last_state_.store(state);
        logger_.Info("camera capture job finished",
                     {{"target", target_path.string()}, {"state", ToString(state)}});
      },
      error);
}

std::string CameraCaptureDevice::Name() const {
  return "camera";
}

void CameraCaptureDevice::WaitIdle() {
  worker_.WaitIdle();
}

CaptureJobState CameraCaptureDevice::LastJobState() const {
  return last_state_.load();
}

CaptureJobState CameraCaptureDevice::RunCaptureJob(const std::filesystem::path& target_path) {
  std::string detail;
  const CameraAccess access = source_->CheckAccess(options_.camera_index, detail);
  if (access == CameraAccess::kDenied) {
    logger_.Warn("camera permission denied", {{"detail", detail}});
    return FallBack(target_path, "camera permission denied");
  }
  if (access == CameraAccess::kMissing) {
    logger_.Warn("camera device node not found, trying to open anyway", {{"detail", detail}});
  }

  bool opened = false;
  std::string open_error;
  for (const OpenAttempt& attempt : kOpenPlan) {
    if (attempt.apply_backoff) {
      logger_.Info("retrying camera open after backoff",
                   {{"backoff_ms", std::to_string(options_.open_retry_backoff.count())}});
      std::this_thread::sleep_for(options_.open_retry_backoff);
    }
    if (source_->Open(options_.camera_index, open_error)) {
      logger_.Info("camera opened", {{"attempt", attempt.label}});
      opened = true;
      break;
    }
    logger_.Warn("camera open failed", {{"attempt", attempt.label}, {"error", open_error}});
  }
  if (!opened) {
    source_->Release();
    return FallBack(target_path, "camera open failed: " + open_error);
  }

  std::string jpeg_bytes;
  std::string capture_error;
  const bool captured = source_->CaptureJpeg(jpeg_bytes, capture_error);
  source_->Release();
  if (!captured) {
    logger_.Warn("camera capture failed", {{"error", capture_error}});
    return FallBack(target_path, "camera capture failed: " + capture_error);
  }

  std::string write_error;
  if (!core::WriteFileAtomic(target_path, jpeg_bytes, write_error)) {
    logger_.Error("failed to save photo", {{"error", write_error}});
    return FallBack(target_path, "photo save failed");
  }

  logger_.Info("photo saved",
               {{"target", target_path.string()}, {"bytes", std::to_string(jpeg_bytes.size())}});
  return CaptureJobState::kSucceeded;
}

CaptureJobState CameraCaptureDevice::FallBack(const std::filesystem::path& target_path,
                                              std::string_view reason) {
  if (WritePlaceholderArtifact(options_.placeholder_path, target_path, reason, logger_)) {
    return CaptureJobState::kFellBackToPlaceholder;
  }
  return CaptureJobState::kFailed;
}

} // namespace camgate::capture
