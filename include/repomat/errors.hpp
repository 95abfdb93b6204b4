#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace repomat {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct InvalidBranchName : Error {
  explicit InvalidBranchName(std::string branch);
  const std::string &branch() const { return branch_; }

private:
  std::string branch_;
};

// The branch has no ref on the remote, or no remote-tracking ref locally.
struct BranchNotFound : Error {
  explicit BranchNotFound(std::string branch,
                          std::optional<std::string> repo_url = std::nullopt);
  const std::string &branch() const { return branch_; }
  const std::optional<std::string> &repo_url() const { return repo_url_; }

private:
  std::string branch_;
  std::optional<std::string> repo_url_;
};

struct OperationFailed : Error {
  OperationFailed(std::string command, int exit_code, std::string output);
  const std::string &command() const { return command_; }
  int exit_code() const { return exit_code_; }
  const std::string &output() const { return output_; }

private:
  std::string command_;
  int exit_code_;
  std::string output_;
};

struct Timeout : Error {
  Timeout(std::string command, std::chrono::milliseconds limit);
  const std::string &command() const { return command_; }
  std::chrono::milliseconds limit() const { return limit_; }

private:
  std::string command_;
  std::chrono::milliseconds limit_;
};

struct Cancelled : Error {
  explicit Cancelled(std::string command);
  const std::string &command() const { return command_; }

private:
  std::string command_;
};

struct ConfigError : Error {
  using Error::Error;
};

} // namespace repomat
