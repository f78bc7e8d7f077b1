#pragma once

#include "capture/native_capture_device.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {

struct DeviceSelection {
  std::size_t camera_index = 0U;
  std::filesystem::path placeholder_path;
};

// Picks the capture device for this host: the OpenCV camera device when
// OpenCV is compiled in and `camera_index` can be opened, otherwise the
// placeholder device. The choice and its reason are logged.
std::unique_ptr<INativeCaptureDevice> CreateCaptureDevice(const DeviceSelection& selection,
                                                          core::logging::Logger& logger);

} // namespace camgate::capture
