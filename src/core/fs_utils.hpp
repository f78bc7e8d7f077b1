#ifndef CAMGATE_CORE_FS_UTILS_HPP_
#define CAMGATE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace camgate::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }
  return EnsureDirectory(parent_dir, error);
}

// Best-effort atomic file publish:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// Readers polling the destination either see nothing or the complete file,
// never a partially written one. Where rename-overwrite is restricted we try a
// remove+rename fallback and still never publish partial output.
inline bool WriteFileAtomic(const std::filesystem::path& output_path, std::string_view bytes,
                            std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

inline bool ReadFileBytes(const std::filesystem::path& path, std::string& bytes,
                          std::string& error) {
  bytes.clear();
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open file '" + path.string() + "'";
    return false;
  }
  bytes.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  return true;
}

inline bool CopyFileAtomic(const std::filesystem::path& source,
                           const std::filesystem::path& destination, std::string& error) {
  std::string bytes;
  if (!ReadFileBytes(source, bytes, error)) {
    return false;
  }
  return WriteFileAtomic(destination, bytes, error);
}

inline void RemoveFileBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  (void)std::filesystem::remove(path, ec);
}

// Size of `path` when it is a regular file with at least one byte.
inline std::optional<std::uint64_t> NonEmptyFileSize(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    return std::nullopt;
  }
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec || size == 0U) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(size);
}

// Root containment check.
//
// Relative candidates are resolved against `root`. Both sides are normalized
// with `weakly_canonical`, so `..` segments and symlinks are followed before
// the comparison. The candidate must be a strict descendant of the root.
inline bool ResolveWithinRoot(const std::filesystem::path& root,
                              const std::filesystem::path& candidate,
                              std::filesystem::path& resolved) {
  resolved.clear();
  if (root.empty() || candidate.empty()) {
    return false;
  }

  std::error_code ec;
  const std::filesystem::path absolute_root = std::filesystem::absolute(root, ec);
  if (ec) {
    return false;
  }
  const std::filesystem::path normalized_root =
      std::filesystem::weakly_canonical(absolute_root, ec).lexically_normal();
  if (ec) {
    return false;
  }

  const std::filesystem::path joined =
      candidate.is_absolute() ? candidate : absolute_root / candidate;
  const std::filesystem::path normalized_candidate =
      std::filesystem::weakly_canonical(joined, ec).lexically_normal();
  if (ec) {
    return false;
  }

  auto root_it = normalized_root.begin();
  auto candidate_it = normalized_candidate.begin();
  for (; root_it != normalized_root.end(); ++root_it, ++candidate_it) {
    // A trailing separator on the root shows up as an empty final element.
    if (root_it->empty() && std::next(root_it) == normalized_root.end()) {
      break;
    }
    if (candidate_it == normalized_candidate.end() || *root_it != *candidate_it) {
      return false;
    }
  }

  bool has_descendant_part = false;
  for (; candidate_it != normalized_candidate.end(); ++candidate_it) {
    if (!candidate_it->empty()) {
      has_descendant_part = true;
      break;
    }
  }
  if (!has_descendant_part) {
    return false;
  }

  resolved = normalized_candidate;
  return true;
}

} // namespace camgate::core

#endif // CAMGATE_CORE_FS_UTILS_HPP_
