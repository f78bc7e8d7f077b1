#pragma once

#include "api/control_api.hpp"
#include "capture/capture_orchestrator.hpp"
#include "capture/foreground_chain.hpp"
#include "capture/native_capture_device.hpp"
#include "config/service_config.hpp"
#include "core/logging/log_journal.hpp"
#include "core/logging/logger.hpp"
#include "transfer/chunked_transfer.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace camgate::cli {

// Every long-lived component of one camgate process, wired from a loaded
// `ServiceConfig`. Members are declared in dependency order so destruction
// runs front-end first and the journal last.
class ServiceRuntime {
  struct ConstructionTag {
    explicit ConstructionTag() = default;
  };

public:
  static std::unique_ptr<ServiceRuntime> Create(const config::ServiceConfig& config,
                                                core::logging::LogLevel log_level,
                                                std::ostream& console, std::string& error);

  // Only reachable through `Create`; the tag type is private.
  ServiceRuntime(ConstructionTag, config::ServiceConfig config);

  ServiceRuntime(const ServiceRuntime&) = delete;
  ServiceRuntime& operator=(const ServiceRuntime&) = delete;

  const config::ServiceConfig& config() const {
    return config_;
  }
  core::logging::Logger& logger() {
    return *logger_;
  }
  capture::CaptureOrchestrator& orchestrator() {
    return *orchestrator_;
  }
  api::ControlApi& control_api() {
    return *api_;
  }

private:
  config::ServiceConfig config_;
  std::unique_ptr<core::logging::LogJournal> journal_;
  std::unique_ptr<core::logging::Logger> logger_;
  std::unique_ptr<capture::INativeCaptureDevice> device_;
  std::unique_ptr<capture::ForegroundChain> foreground_;
  std::unique_ptr<capture::CaptureOrchestrator> orchestrator_;
  std::unique_ptr<transfer::ChunkedTransferService> transfer_;
  std::unique_ptr<api::ControlApi> api_;
};

} // namespace camgate::cli
