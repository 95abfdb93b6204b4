#include <repomat/errors.hpp>

#include <fmt/format.h>

namespace repomat {

InvalidBranchName::InvalidBranchName(std::string branch)
    : Error(fmt::format("Illegal branch name: '{}'", branch)),
      branch_(std::move(branch)) {}

static std::string not_found_message(const std::string &branch,
                                     const std::optional<std::string> &url) {
  if (url)
    return fmt::format("Branch '{}' not found in repo: {}", branch, *url);
  return fmt::format("Branch '{}' not found", branch);
}

BranchNotFound::BranchNotFound(std::string branch,
                               std::optional<std::string> repo_url)
    : Error(not_found_message(branch, repo_url)), branch_(std::move(branch)),
      repo_url_(std::move(repo_url)) {}

OperationFailed::OperationFailed(std::string command, int exit_code,
                                 std::string output)
    : Error(fmt::format("{} failed (rc={})", command, exit_code)),
      command_(std::move(command)), exit_code_(exit_code),
      output_(std::move(output)) {}

Timeout::Timeout(std::string command, std::chrono::milliseconds limit)
    : Error(fmt::format("{} timed out after {}ms", command, limit.count())),
      command_(std::move(command)), limit_(limit) {}

Cancelled::Cancelled(std::string command)
    : Error(fmt::format("{} cancelled", command)),
      command_(std::move(command)) {}

} // namespace repomat
