#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/test_logging.hpp"
#include "capture/device_factory.hpp"
#include "capture/placeholder_capture_device.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace {

using camgate::tests::common::AssertContains;
using camgate::tests::common::Fail;

} // namespace

int main() {
  const std::filesystem::path root =
      camgate::tests::common::CreateUniqueTempDir("camgate-placeholder-device-smoke");
  const std::filesystem::path placeholder = root / "dummy.jpg";
  camgate::tests::common::WriteStringToFile(placeholder, "DUMMY");

  {
    camgate::tests::common::TestLogging logging;
    camgate::capture::PlaceholderCaptureDevice device(placeholder, logging.logger,
                                                      std::chrono::milliseconds(20));
    if (device.Name() != "placeholder") {
      Fail("unexpected placeholder device name");
    }

    std::string error;
    const auto target = root / "photos" / "capture.jpg";
    if (!device.StartCapture(target, error)) {
      Fail("placeholder device should schedule: " + error);
    }
    device.WaitIdle();
    if (camgate::tests::common::ReadFileToString(target) != "DUMMY") {
      Fail("placeholder content should be copied to the target");
    }
    AssertContains(logging.Body(), "placeholder photo written");
  }

  {
    camgate::tests::common::TestLogging logging;
    camgate::capture::PlaceholderCaptureDevice device(root / "missing.jpg", logging.logger);
    std::string error;
    const auto target = root / "never.jpg";
    if (!device.StartCapture(target, error)) {
      Fail("scheduling must succeed even when the placeholder is missing");
    }
    device.WaitIdle();
    if (std::filesystem::exists(target)) {
      Fail("no file may appear without a placeholder image");
    }
    AssertContains(logging.Body(), "placeholder image not found");
  }

  {
    // Without a usable camera the factory must hand out the placeholder device.
    camgate::tests::common::TestLogging logging;
    camgate::capture::DeviceSelection selection;
    selection.camera_index = 250U;
    selection.placeholder_path = placeholder;
    const std::unique_ptr<camgate::capture::INativeCaptureDevice> device =
        camgate::capture::CreateCaptureDevice(selection, logging.logger);
    if (device == nullptr || device->Name() != "placeholder") {
      Fail("factory should fall back to the placeholder device");
    }
    AssertContains(logging.Body(), "placeholder");
  }

  camgate::tests::common::RemovePathBestEffort(root);
  return 0;
}
