#include "capture/opencv_camera_source.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <unistd.h>
#endif

#if CAMGATE_ENABLE_OPENCV
#include <opencv2/core/mat.hpp>
#include <opencv2/core/version.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#endif

namespace camgate::capture {

namespace {

constexpr int kWarmupFrames = 5;
constexpr int kJpegQuality = 100;
// Oversized request; drivers clamp it to the largest supported frame size.
constexpr double kRequestedFrameEdge = 10000.0;

} // namespace

const char* ToString(CameraAccess access) {
  switch (access) {
  case CameraAccess::kGranted:
    return "granted";
  case CameraAccess::kDenied:
    return "denied";
  case CameraAccess::kMissing:
    return "missing";
  }
  return "missing";
}

bool IsOpenCvCaptureEnabled() {
#if CAMGATE_ENABLE_OPENCV
  return true;
#else
  return false;
#endif
}

std::string OpenCvCaptureDetail() {
#if CAMGATE_ENABLE_OPENCV
  return std::string("OpenCV capture compiled (OpenCV ") + CV_VERSION + ")";
#else
  return "OpenCV capture not compiled";
#endif
}

struct OpenCvCameraSource::Impl {
#if CAMGATE_ENABLE_OPENCV
  cv::VideoCapture capture;
#endif
};

OpenCvCameraSource::OpenCvCameraSource() : impl_(std::make_unique<Impl>()) {}

OpenCvCameraSource::~OpenCvCameraSource() {
  Release();
}

CameraAccess OpenCvCameraSource::CheckAccess(const std::size_t camera_index,
                                             std::string& detail) {
  detail.clear();
#if defined(__linux__)
  const std::filesystem::path node = "/dev/video" + std::to_string(camera_index);
  std::error_code ec;
  if (!std::filesystem::exists(node, ec) || ec) {
    detail = node.string() + " does not exist";
    return CameraAccess::kMissing;
  }
  if (::access(node.c_str(), R_OK | W_OK) != 0) {
    const int access_errno = errno;
    detail = node.string() + ": " + std::strerror(access_errno);
    if (access_errno == EACCES || access_errno == EPERM) {
      return CameraAccess::kDenied;
    }
    return CameraAccess::kMissing;
  }
  return CameraAccess::kGranted;
#else
  (void)camera_index;
  return CameraAccess::kGranted;
#endif
}

bool OpenCvCameraSource::Open(const std::size_t camera_index, std::string& error) {
  error.clear();
#if CAMGATE_ENABLE_OPENCV
  if (camera_index > static_cast<std::size_t>(INT_MAX)) {
    error = "camera index is out of range for OpenCV";
    return false;
  }
  cv::VideoCapture capture;
  if (!capture.open(static_cast<int>(camera_index), cv::CAP_ANY)) {
    error = "OpenCV could not open camera index " + std::to_string(camera_index);
    return false;
  }
  // Best-effort: a driver that rejects the request keeps its default size.
  (void)capture.set(cv::CAP_PROP_FRAME_WIDTH, kRequestedFrameEdge);
  (void)capture.set(cv::CAP_PROP_FRAME_HEIGHT, kRequestedFrameEdge);
  impl_->capture.release();
  impl_->capture = std::move(capture);
  return true;
#else
  (void)camera_index;
  error = "OpenCV capture is not compiled in this build";
  return false;
#endif
}

bool OpenCvCameraSource::CaptureJpeg(std::string& jpeg_bytes, std::string& error) {
  jpeg_bytes.clear();
  error.clear();
#if CAMGATE_ENABLE_OPENCV
  if (!impl_->capture.isOpened()) {
    error = "camera must be open before capturing";
    return false;
  }
  for (int i = 0; i < kWarmupFrames; ++i) {
    (void)impl_->capture.grab();
  }

  cv::Mat frame;
  if (!impl_->capture.read(frame) || frame.empty()) {
    error = "OpenCV returned no frame";
    return false;
  }

  std::vector<uchar> encoded;
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, kJpegQuality};
  if (!cv::imencode(".jpg", frame, encoded, params) || encoded.empty()) {
    error = "JPEG encoding failed";
    return false;
  }
  jpeg_bytes.assign(encoded.begin(), encoded.end());
  return true;
#else
  error = "OpenCV capture is not compiled in this build";
  return false;
#endif
}

void OpenCvCameraSource::Release() {
#if CAMGATE_ENABLE_OPENCV
  if (impl_ != nullptr && impl_->capture.isOpened()) {
    impl_->capture.release();
  }
#endif
}

bool OpenCvCameraSource::Probe(const std::size_t camera_index) {
#if CAMGATE_ENABLE_OPENCV
  if (camera_index > static_cast<std::size_t>(INT_MAX)) {
    return false;
  }
  cv::VideoCapture capture;
  if (!capture.open(static_cast<int>(camera_index), cv::CAP_ANY)) {
    return false;
  }
  capture.release();
  return true;
#else
  (void)camera_index;
  return false;
#endif
}

} // namespace camgate::capture
