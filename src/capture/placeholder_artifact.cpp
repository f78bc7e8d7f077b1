#include "capture/placeholder_artifact.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"

namespace camgate::capture {

bool WritePlaceholderArtifact(const std::filesystem::path& placeholder_path,
                              const std::filesystem::path& target_path,
                              std::string_view reason, core::logging::Logger& logger) {
  logger.Info("writing placeholder photo",
              {{"target", target_path.string()}, {"reason", reason}});

  std::error_code ec;
  if (!std::filesystem::is_regular_file(placeholder_path, ec) || ec) {
    logger.Error("placeholder image not found",
                 {{"placeholder", placeholder_path.string()}, {"target", target_path.string()}});
    return false;
  }

  std::string error;
  if (!core::CopyFileAtomic(placeholder_path, target_path, error)) {
    logger.Error("failed to copy placeholder photo", {{"error", error}});
    return false;
  }

  logger.Info("placeholder photo written",
              {{"source", placeholder_path.string()}, {"target", target_path.string()}});
  return true;
}

} // namespace camgate::capture
