#include "camgate/cli/service_runtime.hpp"

#include "capture/device_factory.hpp"
#include "core/fs_utils.hpp"

#include <chrono>
#include <utility>

namespace camgate::cli {

ServiceRuntime::ServiceRuntime(ConstructionTag, config::ServiceConfig config)
    : config_(std::move(config)) {}

std::unique_ptr<ServiceRuntime> ServiceRuntime::Create(const config::ServiceConfig& config,
                                                       core::logging::LogLevel log_level,
                                                       std::ostream& console,
                                                       std::string& error) {
  auto runtime = std::make_unique<ServiceRuntime>(ConstructionTag{}, config);
  const config::ServiceConfig& cfg = runtime->config_;

  runtime->journal_ = cfg.log_file_path.empty()
                          ? std::make_unique<core::logging::LogJournal>(console)
                          : std::make_unique<core::logging::LogJournal>(cfg.log_file_path, console);
  runtime->logger_ = std::make_unique<core::logging::Logger>(*runtime->journal_, log_level);
  core::logging::Logger& logger = *runtime->logger_;

  for (const std::string& warning : cfg.warnings) {
    logger.Warn("config warning", {{"detail", warning}});
  }
  logger.Info("config loaded",
              {{"config", cfg.config_path.string()},
               {"photo_root", cfg.photo_root.string()},
               {"timeout_s", std::to_string(cfg.capture_timeout.count())},
               {"placeholder", cfg.placeholder_image_path.string()}});

  if (!core::EnsureDirectory(cfg.photo_root, error)) {
    logger.Error("failed to prepare photo folder", {{"error", error}});
    return nullptr;
  }

  capture::DeviceSelection selection;
  selection.camera_index = cfg.camera_index;
  selection.placeholder_path = cfg.placeholder_image_path;
  runtime->device_ = capture::CreateCaptureDevice(selection, logger);
  runtime->foreground_ = capture::BuildShellForegroundChain(cfg.foreground_commands, logger);

  capture::CaptureOrchestratorOptions orchestrator_options;
  orchestrator_options.photo_root = cfg.photo_root;
  orchestrator_options.file_prefix = cfg.file_prefix;
  orchestrator_options.default_timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(cfg.capture_timeout);
  runtime->orchestrator_ = std::make_unique<capture::CaptureOrchestrator>(
      *runtime->device_, *runtime->foreground_, orchestrator_options, logger);

  runtime->transfer_ = std::make_unique<transfer::ChunkedTransferService>(cfg.photo_root, logger);

  api::ControlApiOptions api_options;
  api_options.placeholder_image_path = cfg.placeholder_image_path;
  api_options.capture_timeout = orchestrator_options.default_timeout;
  runtime->api_ = std::make_unique<api::ControlApi>(*runtime->orchestrator_, *runtime->transfer_,
                                                    api_options, logger);
  return runtime;
}

} // namespace camgate::cli
