#pragma once
#include <repomat/process.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace repomat {

// Diagnostics git prints when a branch is missing on the remote. Matched
// against combined output; `{}` is the branch name.
inline constexpr std::string_view kCloneBranchNotFound =
    "Remote branch {} not found";
inline constexpr std::string_view kFetchRefNotFound =
    "couldn't find remote ref {}";

struct ReconcilerOptions {
  std::string git = "git";
  std::chrono::seconds stale_after{60};
  std::chrono::seconds clone_timeout{900};
  std::chrono::seconds fetch_timeout{300};
  std::chrono::seconds reset_timeout{60};
  const std::atomic_bool *cancel{nullptr};
};

// Drives a destination directory to a clean checkout of one branch of one
// remote: clone if absent, prune-fetch if stale, then hard reset to
// origin/<branch>. Holds no repository state; everything is read from disk.
class Reconciler {
public:
  explicit Reconciler(ReconcilerOptions opts = {},
                      CommandRunner runner = run_command);

  /// Clone or update `dest_path` and force it onto `branch`.
  /// Throws InvalidBranchName, BranchNotFound, OperationFailed, Timeout or
  /// Cancelled. On BranchNotFound `dest_path` is deleted first when
  /// `remove_on_error` is set.
  void enforce_repo_state(const std::string &repo_url,
                          const std::filesystem::path &dest_path,
                          const std::string &branch,
                          bool remove_on_error = true) const;

  void clone_repo(const std::string &repo_url,
                  const std::filesystem::path &dest_path,
                  const std::string &branch) const;

  /// git fetch -p origin
  void fetch(const std::filesystem::path &repo_path) const;

  /// git fetch -p origin <branch>
  void fetch_branch(const std::filesystem::path &repo_path,
                    const std::string &branch) const;

  void reset_repo(const std::string &repo_url,
                  const std::filesystem::path &dest_path,
                  const std::string &branch) const;

  bool is_stale(const std::filesystem::path &repo_path) const;

  static void validate_branch(const std::string &branch);

  const ReconcilerOptions &options() const { return opts_; }

private:
  CmdResult run_git(std::vector<std::string> args,
                    const std::filesystem::path &cwd,
                    std::chrono::seconds timeout) const;

  ReconcilerOptions opts_;
  CommandRunner runner_;
};

} // namespace repomat
