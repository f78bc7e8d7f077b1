#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/test_logging.hpp"
#include "capture/capture_orchestrator.hpp"
#include "capture/foreground_chain.hpp"
#include "capture/testing/scripted_capture_device.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using camgate::tests::common::Fail;

camgate::capture::CaptureOrchestratorOptions MakeOptions(const std::filesystem::path& root) {
  camgate::capture::CaptureOrchestratorOptions options;
  options.photo_root = root;
  options.poll_interval = std::chrono::milliseconds(50);
  options.default_timeout = std::chrono::milliseconds(3'000);
  return options;
}

void RunSerializedCaptures(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  camgate::capture::testing::ScriptedCaptureBehavior behavior;
  behavior.delay = std::chrono::milliseconds(300);
  behavior.bytes_to_write = 5U;
  camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);
  camgate::capture::ForegroundChain chain(logging.logger);
  camgate::capture::CaptureOrchestrator orchestrator(device, chain, MakeOptions(root),
                                                     logging.logger);

  constexpr int kCallers = 3;
  std::vector<camgate::capture::CaptureResult> results(kCallers);
  std::vector<std::thread> callers;
  for (int i = 0; i < kCallers; ++i) {
    callers.emplace_back([&orchestrator, &results, i] {
      results[static_cast<std::size_t>(i)] =
          orchestrator.CaptureSync("concurrent-" + std::to_string(i));
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }

  std::set<std::string> paths;
  for (const auto& result : results) {
    if (!result.success) {
      Fail("serialized capture should succeed: " + result.error_message);
    }
    paths.insert(result.file_path.string());
  }
  if (paths.size() != static_cast<std::size_t>(kCallers)) {
    Fail("each caller should receive its own capture file");
  }
  if (device.start_count() != static_cast<std::size_t>(kCallers)) {
    Fail("each caller should start exactly one native capture");
  }
  if (device.overlap_count() != 0U) {
    Fail("native captures must never overlap");
  }
}

void RunBusyRejection(const std::filesystem::path& root) {
  camgate::tests::common::TestLogging logging;
  camgate::capture::testing::ScriptedCaptureBehavior behavior;
  behavior.delay = std::chrono::milliseconds(1'500);
  behavior.bytes_to_write = 5U;
  camgate::capture::testing::ScriptedCaptureDevice device(behavior, logging.logger);
  camgate::capture::ForegroundChain chain(logging.logger);
  camgate::capture::CaptureOrchestrator orchestrator(device, chain, MakeOptions(root),
                                                     logging.logger);

  camgate::capture::CaptureResult first;
  std::thread first_caller([&] { first = orchestrator.CaptureSync("slow"); });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  const auto start = std::chrono::steady_clock::now();
  const camgate::capture::CaptureResult second =
      orchestrator.CaptureSync("impatient", std::chrono::milliseconds(300));
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();
  first_caller.join();

  if (!first.success) {
    Fail("the in-flight capture should complete: " + first.error_message);
  }
  if (second.success || second.error_message != camgate::capture::kCaptureBusyMessage) {
    Fail("a caller that cannot get the camera in time must be told it is busy");
  }
  if (!second.file_path.empty()) {
    Fail("a rejected caller has no target path");
  }
  if (elapsed > 300 + 50 + 150) {
    Fail("busy rejection must respect the caller's own timeout, took " +
         std::to_string(elapsed) + "ms");
  }
  if (device.start_count() != 1U) {
    Fail("the rejected caller must not start a native capture");
  }
}

} // namespace

int main() {
  const std::filesystem::path root =
      camgate::tests::common::CreateUniqueTempDir("camgate-orchestrator-concurrency");

  RunSerializedCaptures(root);
  RunBusyRejection(root);

  camgate::tests::common::RemovePathBestEffort(root);
  return 0;
}
