#pragma once

#include "capture/camera_source.hpp"
#include "capture/capture_worker.hpp"
#include "capture/native_capture_device.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {

struct CameraCaptureOptions {
  std::size_t camera_index = 0U;
  std::filesystem::path placeholder_path;
  // Fixed backoff before the single retry of a failed camera open.
  std::chrono::milliseconds open_retry_backoff{500};
};

// Terminal (and transient) states of one capture job.
enum class CaptureJobState {
  kAttempting = 0,
  kSucceeded,
  kFellBackToPlaceholder,
  kFailed,
};

const char* ToString(CaptureJobState state);

// Real-camera device.
//
// Each capture job walks an ordered attempt plan on the worker thread:
//   permission probe -> open (primary) -> open (retry after backoff)
// The first attempt that opens the camera reads and publishes one JPEG. A
// denied permission, two failed opens, or a failed read/publish all fall back
// to the placeholder artifact. The camera is released at the end of every job.
class CameraCaptureDevice final : public INativeCaptureDevice {
public:
  CameraCaptureDevice(std::unique_ptr<ICameraSource> source, CameraCaptureOptions options,
                      core::logging::Logger& logger);
  ~CameraCaptureDevice() override;

  bool StartCapture(const std::filesystem::path& target_path, std::string& error) override;
  std::string Name() const override;

  void WaitIdle();

  // State reached by the most recently finished job.
  CaptureJobState LastJobState() const;

private:
  CaptureJobState RunCaptureJob(const std::filesystem::path& target_path);
  CaptureJobState FallBack(const std::filesystem::path& target_path, std::string_view reason);

  std::unique_ptr<ICameraSource> source_;
  CameraCaptureOptions options_;
  core::logging::Logger& logger_;
  std::atomic<CaptureJobState> last_state_{CaptureJobState::kAttempting};
  CaptureWorker worker_;
};

} // namespace camgate::capture
