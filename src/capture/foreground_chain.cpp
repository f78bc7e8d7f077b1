#include "capture/foreground_chain.hpp"

#include "core/logging/logger.hpp"

#include <condition_variable>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace camgate::capture {

namespace {

const char* ToString(ForegroundOutcome outcome) {
  switch (outcome) {
  case ForegroundOutcome::kRequested:
    return "requested";
  case ForegroundOutcome::kUnavailable:
    return "unavailable";
  case ForegroundOutcome::kFailed:
    return "failed";
  }
  return "failed";
}

bool RunShellCommandNoCapture(const std::string& command, int& exit_code, std::string& error) {
  error.clear();
  exit_code = -1;
  const int raw_status = std::system(command.c_str());
  if (raw_status == -1) {
    error = "failed to execute shell command";
    return false;
  }

#if defined(_WIN32)
  exit_code = raw_status;
#else
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif
  return true;
}

struct RequestState {
  std::mutex mutex;
  std::condition_variable done_cv;
  bool done = false;
  bool requested = false;
};

} // namespace

ShellCommandForegroundStrategy::ShellCommandForegroundStrategy(std::string command)
    : command_(std::move(command)) {}

std::string ShellCommandForegroundStrategy::Name() const {
  return "shell: " + command_;
}

ForegroundOutcome ShellCommandForegroundStrategy::Attempt(std::string& detail) {
  detail.clear();
  if (command_.empty()) {
    detail = "empty command";
    return ForegroundOutcome::kUnavailable;
  }
  int exit_code = -1;
  if (!RunShellCommandNoCapture(command_, exit_code, detail)) {
    return ForegroundOutcome::kUnavailable;
  }
  if (exit_code != 0) {
    detail = "exit code " + std::to_string(exit_code);
    return ForegroundOutcome::kFailed;
  }
  return ForegroundOutcome::kRequested;
}

ForegroundChain::ForegroundChain(core::logging::Logger& logger)
    : logger_(logger), worker_("foreground", logger) {}

void ForegroundChain::Add(std::unique_ptr<IForegroundStrategy> strategy) {
  if (strategy != nullptr) {
    strategies_.push_back(std::move(strategy));
  }
}

std::size_t ForegroundChain::size() const {
  return strategies_.size();
}

bool ForegroundChain::Request(std::chrono::steady_clock::time_point deadline) {
  if (strategies_.empty()) {
    logger_.Debug("no foreground strategies configured");
    return false;
  }
  if (in_flight_.exchange(true)) {
    logger_.Warn("previous foreground request still running, skipping");
    return false;
  }

  auto state = std::make_shared<RequestState>();
  std::string error;
  const bool posted = worker_.Post(
      [this, state, deadline] {
        const bool requested = RunStrategies(deadline);
        in_flight_.store(false);
        {
          std::lock_guard<std::mutex> lock(state->mutex);
          state->done = true;
          state->requested = requested;
        }
        state->done_cv.notify_all();
      },
      error);
  if (!posted) {
    in_flight_.store(false);
    logger_.Warn("foreground request could not be scheduled", {{"error", error}});
    return false;
  }

  std::unique_lock<std::mutex> lock(state->mutex);
  if (!state->done_cv.wait_until(lock, deadline, [&state] { return state->done; })) {
    logger_.Warn("foreground request still running at capture deadline");
    return false;
  }
  return state->requested;
}

bool ForegroundChain::RunStrategies(std::chrono::steady_clock::time_point deadline) {
  for (const auto& strategy : strategies_) {
    if (std::chrono::steady_clock::now() >= deadline) {
      logger_.Warn("foreground deadline reached, skipping remaining strategies",
                   {{"next_strategy", strategy->Name()}});
      return false;
    }
    std::string detail;
    const ForegroundOutcome outcome = strategy->Attempt(detail);
    if (outcome == ForegroundOutcome::kRequested) {
      logger_.Info("requested capture surface foreground", {{"strategy", strategy->Name()}});
      return true;
    }
    logger_.Warn("foreground strategy did not succeed",
                 {{"strategy", strategy->Name()}, {"outcome", ToString(outcome)},
                  {"detail", detail}});
  }

  logger_.Warn("unable to bring capture surface to foreground");
  return false;
}

std::unique_ptr<ForegroundChain> BuildShellForegroundChain(
    const std::vector<std::string>& commands, core::logging::Logger& logger) {
  auto chain = std::make_unique<ForegroundChain>(logger);
  for (const auto& command : commands) {
    chain->Add(std::make_unique<ShellCommandForegroundStrategy>(command));
  }
  return chain;
}

} // namespace camgate::capture
