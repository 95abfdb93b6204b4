#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace repomat {

struct RunOptions {
  std::filesystem::path cwd;
  // added on top of the inherited environment
  std::unordered_map<std::string, std::string> env;
  // zero means no limit
  std::chrono::milliseconds timeout{0};
  const std::atomic_bool *cancel{nullptr};
};

struct CmdResult {
  int exit_code{-1};
  std::string out; // stdout and stderr interleaved
  bool timed_out{false};
  bool cancelled{false};
};

// Runs argv[0] (PATH lookup) and waits for it. The child gets its own process
// group; on timeout or cancellation the whole group is killed with SIGKILL.
// exit_code is 128+signal for a signalled child and 127 if exec failed.
CmdResult run_command(const std::vector<std::string> &argv,
                      const RunOptions &opts);

using CommandRunner = std::function<CmdResult(const std::vector<std::string> &,
                                              const RunOptions &)>;

std::string join_command(const std::vector<std::string> &argv);

} // namespace repomat
