#include "capture/testing/scripted_camera_source.hpp"

#include <utility>

namespace camgate::capture::testing {

ScriptedCameraSource::ScriptedCameraSource(CameraAccess access, std::deque<bool> open_results,
                                           bool capture_ok, std::string jpeg_bytes)
    : access_(access), open_results_(std::move(open_results)), capture_ok_(capture_ok),
      jpeg_bytes_(std::move(jpeg_bytes)) {}

CameraAccess ScriptedCameraSource::CheckAccess(std::size_t camera_index, std::string& detail) {
  detail = "scripted access for camera " + std::to_string(camera_index) + ": " + ToString(access_);
  return access_;
}

bool ScriptedCameraSource::Open(std::size_t camera_index, std::string& error) {
  open_calls_.fetch_add(1U);
  std::lock_guard<std::mutex> lock(mutex_);
  bool ok = false;
  if (!open_results_.empty()) {
    ok = open_results_.front();
    open_results_.pop_front();
  }
  if (!ok) {
    error = "scripted camera " + std::to_string(camera_index) + " is busy";
    return false;
  }
  open_ = true;
  return true;
}

bool ScriptedCameraSource::CaptureJpeg(std::string& jpeg_bytes, std::string& error) {
  capture_calls_.fetch_add(1U);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    error = "camera is not open";
    return false;
  }
  if (!capture_ok_) {
    error = "scripted frame read failure";
    return false;
  }
  jpeg_bytes = jpeg_bytes_;
  return true;
}

void ScriptedCameraSource::Release() {
  release_calls_.fetch_add(1U);
  std::lock_guard<std::mutex> lock(mutex_);
  open_ = false;
}

std::size_t ScriptedCameraSource::open_calls() const {
  return open_calls_.load();
}

std::size_t ScriptedCameraSource::capture_calls() const {
  return capture_calls_.load();
}

std::size_t ScriptedCameraSource::release_calls() const {
  return release_calls_.load();
}

bool ScriptedCameraSource::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

} // namespace camgate::capture::testing
