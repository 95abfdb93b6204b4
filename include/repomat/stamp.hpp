#pragma once
#include <chrono>
#include <filesystem>
#include <optional>

namespace repomat {

// Per-checkout record of the last clone or fetch, kept as the mtime of a
// marker file inside the checkout's .git directory.
struct FetchStamp {
  static std::filesystem::path file(const std::filesystem::path &repo_path);

  // Time since the last recorded fetch, nullopt if never recorded.
  static std::optional<std::chrono::seconds>
  age(const std::filesystem::path &repo_path);

  static bool is_stale(const std::filesystem::path &repo_path,
                       std::chrono::seconds max_age);

  // Returns false (and logs) when the marker cannot be written.
  static bool touch(const std::filesystem::path &repo_path);
};

} // namespace repomat
