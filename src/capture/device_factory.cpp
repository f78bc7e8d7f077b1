#include "capture/device_factory.hpp"

#include "capture/camera_capture_device.hpp"
#include "capture/opencv_camera_source.hpp"
#include "capture/placeholder_capture_device.hpp"
#include "core/logging/logger.hpp"

#include <utility>

namespace camgate::capture {

std::unique_ptr<INativeCaptureDevice> CreateCaptureDevice(const DeviceSelection& selection,
                                                          core::logging::Logger& logger) {
  const std::string index_text = std::to_string(selection.camera_index);
  if (!IsOpenCvCaptureEnabled()) {
    logger.Info("capture device selected",
                {{"device", "placeholder"}, {"reason", OpenCvCaptureDetail()}});
    return std::make_unique<PlaceholderCaptureDevice>(selection.placeholder_path, logger);
  }

  if (!OpenCvCameraSource::Probe(selection.camera_index)) {
    logger.Warn("camera probe failed, using placeholder device",
                {{"camera_index", index_text}, {"detail", OpenCvCaptureDetail()}});
    return std::make_unique<PlaceholderCaptureDevice>(selection.placeholder_path, logger);
  }

  CameraCaptureOptions options;
  options.camera_index = selection.camera_index;
  options.placeholder_path = selection.placeholder_path;
  logger.Info("capture device selected",
              {{"device", "camera"}, {"camera_index", index_text},
               {"detail", OpenCvCaptureDetail()}});
  return std::make_unique<CameraCaptureDevice>(std::make_unique<OpenCvCameraSource>(),
                                               std::move(options), logger);
}

} // namespace camgate::capture
