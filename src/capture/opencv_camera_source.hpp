#pragma once

#include "capture/camera_source.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace camgate::capture {

// Reports whether the OpenCV capture path was compiled into this binary.
bool IsOpenCvCaptureEnabled();

// Human-readable build detail for startup logs.
std::string OpenCvCaptureDetail();

// OpenCV `VideoCapture` implementation of `ICameraSource`.
//
// Opening requests the largest frame size the driver accepts, and a few
// warm-up frames are discarded before the captured one so auto-exposure can
// settle. Frames are encoded as JPEG at quality 100.
class OpenCvCameraSource final : public ICameraSource {
public:
  OpenCvCameraSource();
  ~OpenCvCameraSource() override;

  OpenCvCameraSource(const OpenCvCameraSource&) = delete;
  OpenCvCameraSource& operator=(const OpenCvCameraSource&) = delete;

  CameraAccess CheckAccess(std::size_t camera_index, std::string& detail) override;
  bool Open(std::size_t camera_index, std::string& error) override;
  bool CaptureJpeg(std::string& jpeg_bytes, std::string& error) override;
  void Release() override;

  // Opens and immediately releases `camera_index`; used for device selection.
  static bool Probe(std::size_t camera_index);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace camgate::capture
