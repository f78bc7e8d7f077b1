#pragma once

#include "capture/capture_worker.hpp"
#include "capture/native_capture_device.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace camgate::capture::testing {

struct ScriptedCaptureBehavior {
  // Delay between `StartCapture` and publishing the file.
  std::chrono::milliseconds delay{0};
  // Bytes written to the target; 0 means the device never writes anything.
  std::size_t bytes_to_write = 0U;
  // When set, `StartCapture` refuses to schedule anything.
  bool refuse_start = false;
};

// Device double for orchestrator tests. Jobs run on a real worker thread so
// completion crosses threads the same way a camera callback would.
// Overlapping captures (a new start while a previous job has not yet
// published) are counted instead of asserted.
class ScriptedCaptureDevice final : public INativeCaptureDevice {
public:
  ScriptedCaptureDevice(ScriptedCaptureBehavior behavior, core::logging::Logger& logger);

  bool StartCapture(const std::filesystem::path& target_path, std::string& error) override;
  std::string Name() const override;

  void WaitIdle();

  std::size_t start_count() const;
  std::size_t overlap_count() const;

private:
  ScriptedCaptureBehavior behavior_;
  std::atomic<std::size_t> start_count_{0U};
  std::atomic<std::size_t> overlap_count_{0U};
  std::atomic<bool> in_flight_{false};
  CaptureWorker worker_;
};

} // namespace camgate::capture::testing
