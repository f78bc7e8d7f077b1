#pragma once

#include "capture/capture_worker.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {

enum class ForegroundOutcome {
  kRequested = 0,
  kUnavailable,
  kFailed,
};

// One way of bringing the capture surface to the foreground.
class IForegroundStrategy {
public:
  virtual ~IForegroundStrategy() = default;
  virtual std::string Name() const = 0;
  virtual ForegroundOutcome Attempt(std::string& detail) = 0;
};

// Runs one shell command; exit status 0 counts as a successful request.
class ShellCommandForegroundStrategy final : public IForegroundStrategy {
public:
  explicit ShellCommandForegroundStrategy(std::string command);

  std::string Name() const override;
  ForegroundOutcome Attempt(std::string& detail) override;

private:
  std::string command_;
};

// Ordered best-effort fallback chain. Strategies run in order until one
// reports `kRequested`; `kUnavailable` and `kFailed` move on to the next.
// Nothing here is ever fatal to a capture.
//
// Strategies run on the chain's own worker thread. `Request(deadline)` waits
// for the outcome only until `deadline`; a strategy still running then keeps
// running in the background, strategies not yet started are skipped, and
// further requests are refused until it finishes.
class ForegroundChain {
public:
  explicit ForegroundChain(core::logging::Logger& logger);

  ForegroundChain(const ForegroundChain&) = delete;
  ForegroundChain& operator=(const ForegroundChain&) = delete;

  void Add(std::unique_ptr<IForegroundStrategy> strategy);
  std::size_t size() const;

  // Returns true when some strategy reported `kRequested` before `deadline`.
  bool Request(std::chrono::steady_clock::time_point deadline);

private:
  bool RunStrategies(std::chrono::steady_clock::time_point deadline);

  core::logging::Logger& logger_;
  std::vector<std::unique_ptr<IForegroundStrategy>> strategies_;
  std::atomic<bool> in_flight_{false};
  CaptureWorker worker_;
};

// Chain of `ShellCommandForegroundStrategy` in configuration order.
std::unique_ptr<ForegroundChain> BuildShellForegroundChain(
    const std::vector<std::string>& commands, core::logging::Logger& logger);

} // namespace camgate::capture
