#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {

// Publishes a copy of the placeholder image at `target_path` so a capture
// attempt that cannot reach a real camera still completes deterministically.
// The copy is atomic: pollers never see a partially written target.
bool WritePlaceholderArtifact(const std::filesystem::path& placeholder_path,
                              const std::filesystem::path& target_path,
                              std::string_view reason, core::logging::Logger& logger);

} // namespace camgate::capture
