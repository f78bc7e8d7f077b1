#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/test_logging.hpp"
#include "capture/capture_orchestrator.hpp"
#include "capture/foreground_chain.hpp"
#include "capture/testing/scripted_capture_device.hpp"
#include "core/fs_utils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace {

using camgate::tests::common::AssertContains;
using camgate::tests::common::Fail;

class CountingForegroundStrategy final : public camgate::capture::IForegroundStrategy {
public:
  CountingForegroundStrategy(camgate::capture::ForegroundOutcome outcome, int& calls)
      : outcome_(outcome), calls_(calls) {}

  std::string Name() const override {
    return "counting";
  }

  camgate::capture::ForegroundOutcome Attempt(std::string& detail) override {
    ++calls_;
    detail = "scripted";
    return outcome_;
  }

private:
  camgate::capture::ForegroundOutcome outcome_;
  int& calls_;
};

// Blocks like a hung foreground command before reporting failure.
class SlowForegroundStrategy final : public camgate::capture::IForegroundStrategy {
public:
  explicit SlowForegroundStrategy(std::chrono::milliseconds delay) : delay_(delay) {}

  std::string Name() const override {
    return "slow";
  }

  camgate::capture::ForegroundOutcome Attempt(std::string& detail) override {
    std::this_thread::sleep_for(delay_);
    detail = "gave up";
    return camgate::capture::ForegroundOutcome::kFailed;
  }

private:
  std::chrono::milliseconds delay_;
};

camgate::capture::CaptureOrchestratorOptions MakeOptions(const std::filesystem::path& root) {
  camgate::capture::CaptureOrchestratorOptions options;
  options.photo_root = root;
  options.file_prefix = "CamGate";
  options.default_timeout = std::chrono::milliseconds(2'000);
  options.poll_interval = std::chrono::milliseconds(200);
  return options;
}

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start)
      .count();
}

void RunSuccessScenario(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  camgate::capture::testing::ScriptedCaptureBehavior behavior;
  behavior.delay = std::chrono::milliseconds(500);
  behavior.bytes_to_write = 10U;
  camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);

  int failing_calls = 0;
  int requested_calls = 0;
  camgate::capture::ForegroundChain chain(logging.logger);
  chain.Add(std::make_unique<CountingForegroundStrategy>(
      camgate::capture::ForegroundOutcome::kFailed, failing_calls));
  chain.Add(std::make_unique<CountingForegroundStrategy>(
      camgate::capture::ForegroundOutcome::kRequested, requested_calls));

  camgate::capture::CaptureOrchestrator orchestrator(device, chain, MakeOptions(root),
                                                     logging.logger);

  const auto start = std::chrono::steady_clock::now();
  const camgate::capture::CaptureResult result =
      orchestrator.CaptureSync("T1", std::chrono::milliseconds(2'000));
  const long long elapsed = ElapsedMs(start);

  if (!result.success) {
    Fail("T1 capture should succeed: " + result.error_message);
  }
  if (result.file_size_bytes != 10U) {
    Fail("T1 capture should report 10 bytes");
  }
  if (!result.error_message.empty()) {
    Fail("successful capture must not carry an error message");
  }
  const auto on_disk = camgate::core::NonEmptyFileSize(result.file_path);
  if (!on_disk.has_value() || *on_disk != result.file_size_bytes) {
    Fail("reported size must match the file on disk");
  }
  if (result.file_path.parent_path() != root) {
    Fail("capture file must be written under the photo root");
  }
  AssertContains(result.file_path.filename().string(), "CamGate_");
  AssertContains(result.file_path.filename().string(), "_T1.jpg");
  if (elapsed < 450 || elapsed > 2'000) {
    Fail("T1 capture should complete shortly after the device publishes, took " +
         std::to_string(elapsed) + "ms");
  }
  if (failing_calls != 1 || requested_calls != 1) {
    Fail("foreground chain should try strategies in order until one succeeds");
  }

  const std::string log = logging.Body();
  AssertContains(log, "synchronous capture requested");
  AssertContains(log, "capture scheduled");
  AssertContains(log, "capture succeeded");
  AssertContains(log, "outcome=\"succeeded\"");
}

void RunTimeoutScenario(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  camgate::capture::testing::ScriptedCaptureBehavior behavior;
  behavior.bytes_to_write = 0U;
  camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);
  camgate::capture::ForegroundChain chain(logging.logger);
  camgate::capture::CaptureOrchestrator orchestrator(device, chain, MakeOptions(root),
                                                     logging.logger);

  const auto start = std::chrono::steady_clock::now();
  const camgate::capture::CaptureResult result =
      orchestrator.CaptureSync("T2", std::chrono::milliseconds(1'000));
  const long long elapsed = ElapsedMs(start);

  if (result.success) {
    Fail("T2 capture must time out");
  }
  if (result.file_size_bytes != 0U) {
    Fail("timed out capture must report zero bytes");
  }
  if (result.error_message != camgate::capture::kCaptureSurfaceUnreachableMessage) {
    Fail("unexpected timeout message: " + result.error_message);
  }
  if (result.file_path.empty()) {
    Fail("timed out capture should still name its target path");
  }
  // timeout + poll interval, plus scheduling slack.
  if (elapsed < 950 || elapsed > 1'200 + 150) {
    Fail("timeout bound violated, took " + std::to_string(elapsed) + "ms");
  }
  AssertContains(logging.Body(), "capture timed out");
  AssertContains(logging.Body(), "outcome=\"timed_out\"");
}

void RunHungForegroundScenario(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  int later_calls = 0;
  long long elapsed = 0;
  camgate::capture::CaptureResult result;
  {
    camgate::capture::testing::ScriptedCaptureBehavior behavior;
    behavior.bytes_to_write = 0U;
    camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);
    camgate::capture::ForegroundChain chain(logging.logger);
    chain.Add(std::make_unique<SlowForegroundStrategy>(std::chrono::milliseconds(2'500)));
    chain.Add(std::make_unique<CountingForegroundStrategy>(
        camgate::capture::ForegroundOutcome::kRequested, later_calls));
    camgate::capture::CaptureOrchestrator orchestrator(device, chain, MakeOptions(root),
                                                       logging.logger);

    const auto start = std::chrono::steady_clock::now();
    result = orchestrator.CaptureSync("hung-foreground", std::chrono::milliseconds(1'000));
    elapsed = ElapsedMs(start);
  }

  if (result.success ||
      result.error_message != camgate::capture::kCaptureSurfaceUnreachableMessage) {
    Fail("capture behind a hung foreground strategy must time out");
  }
  // timeout + poll interval, plus scheduling slack.
  if (elapsed > 1'200 + 150) {
    Fail("hung foreground strategy stretched the capture to " + std::to_string(elapsed) + "ms");
  }
  if (later_calls != 0) {
    Fail("strategies after the deadline must be skipped");
  }
  const std::string log = logging.Body();
  AssertContains(log, "foreground request still running at capture deadline");
  AssertContains(log, "foreground deadline reached, skipping remaining strategies");
}

void RunRefusedStartScenario(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  camgate::capture::testing::ScriptedCaptureBehavior behavior;
  behavior.refuse_start = true;
  camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);
  camgate::capture::ForegroundChain chain(logging.logger);
  camgate::capture::CaptureOrchestrator orchestrator(device, chain, MakeOptions(root),
                                                     logging.logger);

  const auto start = std::chrono::steady_clock::now();
  const auto result = orchestrator.CaptureSync("refused");
  if (result.success) {
    Fail("refused start must fail");
  }
  AssertContains(result.error_message, "capture could not be started");
  AssertContains(logging.Body(), "outcome=\"denied\"");
  if (ElapsedMs(start) > 500) {
    Fail("refused start should not wait for the deadline");
  }
}

void RunStaleFileScenario(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  camgate::capture::testing::ScriptedCaptureBehavior behavior;
  behavior.bytes_to_write = 0U;
  camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);
  camgate::capture::ForegroundChain chain(logging.logger);
  camgate::capture::CaptureOrchestrator orchestrator(device, chain, MakeOptions(root),
                                                     logging.logger);

  // Plant a file at every target name this call could produce within the
  // next few seconds; none of them may be mistaken for the capture.
  const auto now = std::chrono::system_clock::now();
  for (int offset_s = 0; offset_s < 3; ++offset_s) {
    const auto path = orchestrator.BuildTargetPath("stale", now + std::chrono::seconds(offset_s));
    camgate::tests::common::WriteStringToFile(path, "old-bytes");
  }

  const auto result = orchestrator.CaptureSync("stale", std::chrono::milliseconds(400));
  if (result.success) {
    Fail("a pre-existing file must be removed before the capture starts");
  }
  if (std::filesystem::exists(result.file_path)) {
    Fail("stale file at the target path should have been deleted");
  }
}

void RunDefaultTimeoutScenario(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  camgate::capture::testing::ScriptedCaptureBehavior behavior;
  camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);
  camgate::capture::ForegroundChain chain(logging.logger);
  auto options = MakeOptions(root);
  options.default_timeout = std::chrono::milliseconds(300);
  camgate::capture::CaptureOrchestrator orchestrator(device, chain, options, logging.logger);

  const auto start = std::chrono::steady_clock::now();
  const auto result = orchestrator.CaptureSync("default-timeout");
  const long long elapsed = ElapsedMs(start);
  if (result.success || elapsed < 250 || elapsed > 300 + 200 + 150) {
    Fail("unspecified timeout should fall back to the configured default");
  }
}

} // namespace

int main() {
  const std::filesystem::path root =
      camgate::tests::common::CreateUniqueTempDir("camgate-orchestrator-smoke");

  RunSuccessScenario(root);
  RunTimeoutScenario(root);
  RunHungForegroundScenario(root);
  RunRefusedStartScenario(root);
  RunStaleFileScenario(root);
  RunDefaultTimeoutScenario(root);

  camgate::tests::common::RemovePathBestEffort(root);
  return 0;
}
