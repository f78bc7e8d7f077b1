#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace camgate::cli {

// Options shared by the commands that load the service configuration.
struct ServiceOptions {
  std::filesystem::path config_path;
  std::optional<std::uint16_t> port_override;
  std::optional<std::int64_t> timeout_seconds_override;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `camgate` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => configuration file invalid
//   20 => control surface could not bind its port
int Dispatch(int argc, char** argv);

} // namespace camgate::cli
