#pragma once

#include "capture/camera_source.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace camgate::capture::testing {

// Camera source driven by a fixed script, for exercising the
// permission/retry/fallback policy of `CameraCaptureDevice` without hardware.
class ScriptedCameraSource final : public ICameraSource {
public:
  // `open_results` is consumed one entry per `Open` call; once exhausted every
  // further open fails.
  ScriptedCameraSource(CameraAccess access, std::deque<bool> open_results, bool capture_ok,
                       std::string jpeg_bytes);

  CameraAccess CheckAccess(std::size_t camera_index, std::string& detail) override;
  bool Open(std::size_t camera_index, std::string& error) override;
  bool CaptureJpeg(std::string& jpeg_bytes, std::string& error) override;
  void Release() override;

  std::size_t open_calls() const;
  std::size_t capture_calls() const;
  std::size_t release_calls() const;
  bool is_open() const;

private:
  CameraAccess access_;
  mutable std::mutex mutex_;
  std::deque<bool> open_results_;
  bool capture_ok_;
  std::string jpeg_bytes_;
  bool open_ = false;
  std::atomic<std::size_t> open_calls_{0U};
  std::atomic<std::size_t> capture_calls_{0U};
  std::atomic<std::size_t> release_calls_{0U};
};

} // namespace camgate::capture::testing
