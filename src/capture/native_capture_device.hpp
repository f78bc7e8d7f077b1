#pragma once

#include <filesystem>
#include <string>

namespace camgate::capture {

// Narrow contract for whatever produces the image bytes.
//
// `StartCapture` only schedules work and returns immediately. Completion is
// never reported back through this interface: the device publishes either a
// real image or a placeholder artifact at `target_path`, and callers observe
// the file appearing. Implementations may finish on any thread, may retry
// internally and must release the camera themselves.
//
// A `false` return means the capture could not even be scheduled.
class INativeCaptureDevice {
public:
  virtual ~INativeCaptureDevice() = default;

  virtual bool StartCapture(const std::filesystem::path& target_path, std::string& error) = 0;

  // Short identifier for logs (`placeholder`, `opencv`, ...).
  virtual std::string Name() const = 0;
};

} // namespace camgate::capture
