#pragma once

#include <cstddef>
#include <string>

namespace camgate::capture {

enum class CameraAccess {
  kGranted = 0,
  kDenied,
  kMissing,
};

const char* ToString(CameraAccess access);

// Blocking single-frame camera access used by `CameraCaptureDevice`.
//
// Kept separate from the device so the retry/fallback policy can be exercised
// with scripted sources and no camera hardware. All calls happen on the
// device worker thread.
class ICameraSource {
public:
  virtual ~ICameraSource() = default;

  // Permission probe performed before the device is opened.
  virtual CameraAccess CheckAccess(std::size_t camera_index, std::string& detail) = 0;

  virtual bool Open(std::size_t camera_index, std::string& error) = 0;

  // Reads one frame from the opened camera and encodes it as JPEG.
  virtual bool CaptureJpeg(std::string& jpeg_bytes, std::string& error) = 0;

  // Releases the camera. Safe to call when nothing is open.
  virtual void Release() = 0;
};

} // namespace camgate::capture
