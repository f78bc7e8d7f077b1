#include "capture/testing/scripted_capture_device.hpp"

#include "core/fs_utils.hpp"

#include <thread>
#include <utility>

namespace camgate::capture::testing {

ScriptedCaptureDevice::ScriptedCaptureDevice(ScriptedCaptureBehavior behavior,
                                             core::logging::Logger& logger)
    : behavior_(behavior), worker_("scripted", logger) {}

bool ScriptedCaptureDevice::StartCapture(const std::filesystem::path& target_path,
                                         std::string& error) {
  start_count_.fetch_add(1U);
  if (behavior_.refuse_start) {
    error = "scripted device refused to start";
    return false;
  }
  if (in_flight_.exchange(true)) {
    overlap_count_.fetch_add(1U);
  }

  return worker_.Post(
      [this, target_path] {
        if (behavior_.delay > std::chrono::milliseconds::zero()) {
          std::this_thread::sleep_for(behavior_.delay);
        }
        // Cleared before publishing: the orchestrator may start the next
        // capture as soon as the file becomes visible.
        in_flight_.store(false);
        if (behavior_.bytes_to_write == 0U) {
          return;
        }
        std::string write_error;
        (void)core::WriteFileAtomic(target_path, std::string(behavior_.bytes_to_write, 'x'),
                                    write_error);
      },
      error);
}

std::string ScriptedCaptureDevice::Name() const {
  return "scripted";
}

void ScriptedCaptureDevice::WaitIdle() {
  worker_.WaitIdle();
}

std::size_t ScriptedCaptureDevice::start_count() const {
  return start_count_.load();
}

std::size_t ScriptedCaptureDevice::overlap_count() const {
  return overlap_count_.load();
}

} // namespace camgate::capture::testing
