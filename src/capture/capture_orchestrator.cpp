#include "capture/capture_orchestrator.hpp"

#include "capture/capture_naming.hpp"
#include "capture/foreground_chain.hpp"
#include "capture/native_capture_device.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace camgate::capture {

namespace {

std::string ToMillisText(std::chrono::milliseconds value) {
  return std::to_string(value.count());
}

CaptureResult MakeFailure(std::filesystem::path file_path, std::string message) {
  CaptureResult result;
  result.success = false;
  result.file_path = std::move(file_path);
  result.file_size_bytes = 0;
  result.error_message = std::move(message);
  return result;
}

} // namespace

CaptureOrchestrator::CaptureOrchestrator(INativeCaptureDevice& device, ForegroundChain& foreground,
                                         CaptureOrchestratorOptions options,
                                         core::logging::Logger& logger)
    : device_(device), foreground_(foreground), options_(std::move(options)), logger_(logger) {
  if (options_.poll_interval <= std::chrono::milliseconds::zero()) {
    options_.poll_interval = std::chrono::milliseconds(200);
  }
  if (options_.default_timeout <= std::chrono::milliseconds::zero()) {
    options_.default_timeout = std::chrono::milliseconds(60'000);
  }
}

std::filesystem::path CaptureOrchestrator::BuildTargetPath(
    std::string_view id, std::chrono::system_clock::time_point captured_at) const {
  return options_.photo_root / BuildCaptureFileName(options_.file_prefix, captured_at, id);
}

CaptureResult CaptureOrchestrator::CaptureSync(std::string_view id,
                                               std::optional<std::chrono::milliseconds> timeout) {
  CaptureSession session;
  session.request_id = std::string(id);
  CaptureResult result;
  try {
    const std::chrono::milliseconds effective_timeout =
        timeout.has_value() && *timeout > std::chrono::milliseconds::zero()
            ? *timeout
            : options_.default_timeout;

    session.started_at = std::chrono::steady_clock::now();
    session.deadline = session.started_at + effective_timeout;

    logger_.Info("synchronous capture requested",
                 {{"id", session.request_id}, {"timeout_ms", ToMillisText(effective_timeout)}});

    std::unique_lock<std::timed_mutex> slot(capture_slot_, std::defer_lock);
    if (slot.try_lock_until(session.deadline)) {
      result = RunSession(session);
    } else {
      session.outcome = CaptureOutcome::kDenied;
      logger_.Warn("capture slot not available before deadline", {{"id", session.request_id}});
      result = MakeFailure({}, kCaptureBusyMessage);
    }
  } catch (const std::exception& ex) {
    session.outcome = CaptureOutcome::kDenied;
    logger_.Error("capture failed with internal error", {{"error", ex.what()}});
    result = MakeFailure({}, std::string("internal capture error: ") + ex.what());
  }

  logger_.Info("capture session ended",
               {{"id", session.request_id}, {"outcome", ToString(session.outcome)}});
  return result;
}

CaptureResult CaptureOrchestrator::RunSession(CaptureSession& session) {
  session.target_path = BuildTargetPath(session.request_id, std::chrono::system_clock::now());
  const std::string target_text = session.target_path.string();

  std::string error;
  if (!core::EnsureDirectory(options_.photo_root, error)) {
    session.outcome = CaptureOutcome::kDenied;
    logger_.Error("photo folder unavailable", {{"error", error}});
    return MakeFailure(session.target_path, error);
  }

  // A stale file from an earlier attempt would be mistaken for this capture.
  core::RemoveFileBestEffort(session.target_path);

  // Bounded by the session deadline; a hung strategy cannot stretch the call.
  (void)foreground_.Request(session.deadline);

  if (!device_.StartCapture(session.target_path, error)) {
    session.outcome = CaptureOutcome::kDenied;
    logger_.Error("capture could not be started",
                  {{"device", device_.Name()}, {"target", target_text}, {"error", error}});
    return MakeFailure(session.target_path, "capture could not be started: " + error);
  }
  logger_.Info("capture scheduled", {{"device", device_.Name()}, {"target", target_text}});

  while (true) {
    if (const auto size = core::NonEmptyFileSize(session.target_path); size.has_value()) {
      session.outcome = CaptureOutcome::kSucceeded;
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - session.started_at);
      logger_.Info("capture succeeded",
                   {{"target", target_text}, {"bytes", std::to_string(*size)},
                    {"elapsed_ms", ToMillisText(elapsed)}});

      CaptureResult result;
      result.success = true;
      result.file_path = session.target_path;
      result.file_size_bytes = *size;
      return result;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= session.deadline) {
      break;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(session.deadline - now);
    std::this_thread::sleep_for(std::max(std::min(options_.poll_interval, remaining),
                                         std::chrono::milliseconds(1)));
  }

  session.outcome = CaptureOutcome::kTimedOut;
  logger_.Warn("capture timed out waiting for file", {{"target", target_text}});
  return MakeFailure(session.target_path, kCaptureSurfaceUnreachableMessage);
}

} // namespace camgate::capture
