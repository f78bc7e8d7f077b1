#include "camgate/cli/router.hpp"

#include "api/http_server.hpp"
#include "camgate/cli/fetch_client.hpp"
#include "camgate/cli/service_runtime.hpp"
#include "config/service_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace camgate::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitBindFailed = core::errors::ToInt(core::errors::ExitCode::kBindFailed);

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleStopSignal(int) {
  g_stop_requested = 1;
}

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camgate serve [--config <camgate.ini>] [--port <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  camgate capture --id <id> [--config <camgate.ini>] [--timeout <seconds>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  camgate fetch --host <host> --port <n> --id <id> --out <dir> "
         "[--chunk-size <bytes>] [--timeout <seconds>]\n"
      << "  camgate version\n";
}

template <typename T>
bool ParseNumber(std::string_view raw, T& value) {
  if (raw.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  return ec == std::errc() && ptr == raw.data() + raw.size();
}

bool ParsePort(std::string_view raw, std::uint16_t& port, std::string& error) {
  std::uint32_t value = 0;
  if (!ParseNumber(raw, value) || value == 0U ||
      value > std::numeric_limits<std::uint16_t>::max()) {
    error = "invalid port '" + std::string(raw) + "' (expected 1..65535)";
    return false;
  }
  port = static_cast<std::uint16_t>(value);
  return true;
}

bool ParsePositiveSeconds(std::string_view raw, std::int64_t& seconds, std::string& error) {
  if (!ParseNumber(raw, seconds) || seconds <= 0) {
    error = "invalid --timeout '" + std::string(raw) + "' (expected positive seconds)";
    return false;
  }
  return true;
}

// Takes the value that follows `args[i]`, advancing `i`.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[++i];
  return true;
}

bool ParseServiceOption(const std::vector<std::string_view>& args, std::size_t& i,
                        ServiceOptions& options, bool& handled, std::string& error) {
  handled = true;
  const std::string_view token = args[i];
  std::string_view value;
  if (token == "--config") {
    if (!TakeValue(args, i, value, error)) {
      return false;
    }
    options.config_path = fs::path(value);
    return true;
  }
  if (token == "--log-level") {
    if (!TakeValue(args, i, value, error)) {
      return false;
    }
    return core::logging::ParseLogLevel(value, options.log_level, error);
  }
  handled = false;
  return true;
}

bool ParseServeOptions(const std::vector<std::string_view>& args, ServiceOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool handled = false;
    if (!ParseServiceOption(args, i, options, handled, error)) {
      return false;
    }
    if (handled) {
      continue;
    }
    if (args[i] == "--port") {
      std::string_view value;
      std::uint16_t port = 0;
      if (!TakeValue(args, i, value, error) || !ParsePort(value, port, error)) {
        return false;
      }
      options.port_override = port;
      continue;
    }
    error = "unknown option: " + std::string(args[i]);
    return false;
  }
  return true;
}

bool ParseCaptureOptions(const std::vector<std::string_view>& args, ServiceOptions& options,
                         std::string& id, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool handled = false;
    if (!ParseServiceOption(args, i, options, handled, error)) {
      return false;
    }
    if (handled) {
      continue;
    }
    std::string_view value;
    if (args[i] == "--id") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      id = std::string(value);
      continue;
    }
    if (args[i] == "--timeout") {
      std::int64_t seconds = 0;
      if (!TakeValue(args, i, value, error) || !ParsePositiveSeconds(value, seconds, error)) {
        return false;
      }
      options.timeout_seconds_override = seconds;
      continue;
    }
    error = "unknown option: " + std::string(args[i]);
    return false;
  }
  if (id.empty()) {
    error = "capture requires --id <id>";
    return false;
  }
  return true;
}

bool ParseFetchOptions(const std::vector<std::string_view>& args, FetchOptions& options,
                       std::string& error) {
  bool has_port = false;
  bool has_out = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--host") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.host = std::string(value);
      continue;
    }
    if (token == "--port") {
      if (!TakeValue(args, i, value, error) || !ParsePort(value, options.port, error)) {
        return false;
      }
      has_port = true;
      continue;
    }
    if (token == "--id") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.id = std::string(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      has_out = true;
      continue;
    }
    if (token == "--chunk-size") {
      if (!TakeValue(args, i, value, error) ||
          !ParseNumber(value, options.chunk_size_bytes) || options.chunk_size_bytes <= 0) {
        if (error.empty()) {
          error = "invalid --chunk-size '" + std::string(value) + "'";
        }
        return false;
      }
      continue;
    }
    if (token == "--timeout") {
      std::int64_t seconds = 0;
      if (!TakeValue(args, i, value, error) || !ParsePositiveSeconds(value, seconds, error)) {
        return false;
      }
      options.capture_timeout = std::chrono::seconds(seconds);
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.host.empty() || !has_port || options.id.empty() || !has_out) {
    error = "fetch requires --host <host> --port <n> --id <id> --out <dir>";
    return false;
  }
  return true;
}

// Loads the config named by `options` and applies command-line overrides.
int LoadConfig(const ServiceOptions& options, config::ServiceConfig& config) {
  const fs::path path =
      options.config_path.empty() ? fs::path(config::kDefaultConfigFileName) : options.config_path;
  std::string error;
  if (!config::LoadServiceConfig(path, config, error)) {
    std::cerr << "error: invalid config: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (options.port_override.has_value()) {
    config.port = *options.port_override;
  }
  if (options.timeout_seconds_override.has_value()) {
    config.capture_timeout = std::chrono::seconds(*options.timeout_seconds_override);
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "camgate 0.1.0\n";
  return kExitSuccess;
}

int CommandServe(const std::vector<std::string_view>& args) {
  ServiceOptions options;
  std::string error;
  if (!ParseServeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::ServiceConfig config;
  if (const int code = LoadConfig(options, config); code != kExitSuccess) {
    return code;
  }

  std::unique_ptr<ServiceRuntime> runtime =
      ServiceRuntime::Create(config, options.log_level, std::cout, error);
  if (runtime == nullptr) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  core::logging::Logger& logger = runtime->logger();

  if (runtime->config().preview_last_photo) {
    runtime->control_api().SetCaptureObserver([&logger](const capture::CaptureResult& result) {
      if (result.success) {
        logger.Info("latest photo", {{"file", result.file_path.string()},
                                     {"bytes", std::to_string(result.file_size_bytes)}});
      } else {
        logger.Warn("latest capture failed", {{"error", result.error_message}});
      }
    });
  }

  api::HttpControlServer server(runtime->control_api(), logger);
  if (!server.Bind(runtime->config().bind_address, runtime->config().port, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitBindFailed;
  }

  g_stop_requested = 0;
  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);

  std::atomic<bool> serve_finished{false};
  bool serve_ok = true;
  std::string serve_error;
  std::thread serve_thread([&] {
    serve_ok = server.Serve(serve_error);
    serve_finished.store(true);
  });

  while (!serve_finished.load() && g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (g_stop_requested != 0) {
    logger.Info("stop signal received, shutting down");
  }
  while (!serve_finished.load()) {
    server.Stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  serve_thread.join();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  if (!serve_ok) {
    std::cerr << "error: " << serve_error << '\n';
    return kExitFailure;
  }
  return kExitSuccess;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  ServiceOptions options;
  std::string id;
  std::string error;
  if (!ParseCaptureOptions(args, options, id, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::ServiceConfig config;
  if (const int code = LoadConfig(options, config); code != kExitSuccess) {
    return code;
  }

  // Journal lines go to stderr so stdout carries only the JSON result.
  std::unique_ptr<ServiceRuntime> runtime =
      ServiceRuntime::Create(config, options.log_level, std::cerr, error);
  if (runtime == nullptr) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  const capture::CaptureResult result = runtime->orchestrator().CaptureSync(id);
  std::cout << "{\"success\": " << core::JsonBool(result.success)
            << ", \"id\": " << core::JsonString(id)
            << ", \"file_path\": " << core::JsonString(result.file_path.string())
            << ", \"file_size_in_bytes\": " << result.file_size_bytes
            << ", \"error_message\": " << core::JsonString(result.error_message) << "}\n";
  return result.success ? kExitSuccess : kExitFailure;
}

int CommandFetch(const std::vector<std::string_view>& args) {
  FetchOptions options;
  std::string error;
  if (!ParseFetchOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  FetchResult result;
  if (!FetchCapture(options, result, error)) {
    std::cerr << "error: fetch failed: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "remote_file: " << result.remote_file_path << '\n';
  std::cout << "saved: " << result.local_file_path.string() << '\n';
  std::cout << "bytes: " << result.file_size_bytes << '\n';
  std::cout << "chunks: " << result.chunk_count << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "serve") {
    return CommandServe(args);
  }
  if (command == "capture") {
    return CommandCapture(args);
  }
  if (command == "fetch") {
    return CommandFetch(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camgate::cli
