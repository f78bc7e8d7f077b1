#include "capture/placeholder_capture_device.hpp"

#include "capture/placeholder_artifact.hpp"
#include "core/logging/logger.hpp"

#include <thread>
#include <utility>

namespace camgate::capture {

PlaceholderCaptureDevice::PlaceholderCaptureDevice(std::filesystem::path placeholder_path,
                                                   core::logging::Logger& logger,
                                                   std::chrono::milliseconds delay)
    : placeholder_path_(std::move(placeholder_path)),
      logger_(logger),
      delay_(delay),
      worker_("placeholder", logger) {}

bool PlaceholderCaptureDevice::StartCapture(const std::filesystem::path& target_path,
                                            std::string& error) {
  logger_.Info("no camera on this host, scheduling placeholder photo",
               {{"target", target_path.string()}});
  return worker_.Post(
      [this, target_path] {
        if (delay_ > std::chrono::milliseconds::zero()) {
          std::this_thread::sleep_for(delay_);
        }
        (void)WritePlaceholderArtifact(placeholder_path_, target_path, "no camera device",
                                       logger_);
      },
      error);
}

std::string PlaceholderCaptureDevice::Name() const {
  return "placeholder";
}

void PlaceholderCaptureDevice::WaitIdle() {
  worker_.WaitIdle();
}

} // namespace camgate::capture
