#pragma once

#include "capture/capture_worker.hpp"
#include "capture/native_capture_device.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {

// Capture device for hosts without a usable camera.
//
// Every capture publishes the configured placeholder image at the target path
// from the device worker thread, optionally after a fixed delay.
class PlaceholderCaptureDevice final : public INativeCaptureDevice {
public:
  PlaceholderCaptureDevice(std::filesystem::path placeholder_path, core::logging::Logger& logger,
                           std::chrono::milliseconds delay = std::chrono::milliseconds::zero());

  bool StartCapture(const std::filesystem::path& target_path, std::string& error) override;
  std::string Name() const override;

  void WaitIdle();

private:
  std::filesystem::path placeholder_path_;
  core::logging::Logger& logger_;
  std::chrono::milliseconds delay_;
  CaptureWorker worker_;
};

} // namespace camgate::capture
