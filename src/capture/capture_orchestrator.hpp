#pragma once

#include "capture/capture_types.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {

class ForegroundChain;
class INativeCaptureDevice;

struct CaptureOrchestratorOptions {
  std::filesystem::path photo_root;
  std::string file_prefix = "CamGate";
  std::chrono::milliseconds default_timeout{60'000};
  std::chrono::milliseconds poll_interval{200};
};

// Turns the asynchronous, callback-driven device capture into one bounded
// synchronous call.
//
// Contract for `CaptureSync(id, timeout)`:
// - builds the target path from the id and the current time and removes any
//   stale file there
// - asks the foreground chain to raise the capture surface (best-effort)
// - schedules the device capture and polls the target until it exists with a
//   non-zero size, or until `timeout` has elapsed
// - always returns a `CaptureResult`; nothing is thrown past this boundary
//
// Captures are single-flight. A concurrent caller waits for the camera slot,
// and that wait counts against its own deadline, so no call blocks longer
// than `timeout + poll_interval`. A caller that cannot get the slot in time
// receives `kCaptureBusyMessage`.
class CaptureOrchestrator {
public:
  CaptureOrchestrator(INativeCaptureDevice& device, ForegroundChain& foreground,
                      CaptureOrchestratorOptions options, core::logging::Logger& logger);

  CaptureOrchestrator(const CaptureOrchestrator&) = delete;
  CaptureOrchestrator& operator=(const CaptureOrchestrator&) = delete;

  CaptureResult CaptureSync(std::string_view id,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::filesystem::path BuildTargetPath(std::string_view id,
                                        std::chrono::system_clock::time_point captured_at) const;

  const CaptureOrchestratorOptions& options() const {
    return options_;
  }

private:
  CaptureResult RunSession(CaptureSession& session);

  INativeCaptureDevice& device_;
  ForegroundChain& foreground_;
  CaptureOrchestratorOptions options_;
  core::logging::Logger& logger_;
  std::timed_mutex capture_slot_;
};

} // namespace camgate::capture
