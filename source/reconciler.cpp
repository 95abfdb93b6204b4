#include <repomat/errors.hpp>
#include <repomat/reconciler.hpp>
#include <repomat/stamp.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace repomat {

static bool contains_nocase(const std::string &hay, const std::string &needle) {
  auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end(),
                        [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != hay.end();
}

static std::string trim_output(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

Reconciler::Reconciler(ReconcilerOptions opts, CommandRunner runner)
    : opts_(std::move(opts)), runner_(std::move(runner)) {}

void Reconciler::validate_branch(const std::string &branch) {
  if (branch.empty())
    throw InvalidBranchName(branch);
  for (char c : branch) {
    if (std::isspace(static_cast<unsigned char>(c)))
      throw InvalidBranchName(branch);
  }
}

CmdResult Reconciler::run_git(std::vector<std::string> args,
                              const fs::path &cwd,
                              std::chrono::seconds timeout) const {
  args.insert(args.begin(), opts_.git);
  RunOptions ro;
  ro.cwd = cwd;
  ro.env["GIT_TERMINAL_PROMPT"] = "0";
  ro.timeout = timeout;
  ro.cancel = opts_.cancel;

  CmdResult r = runner_(args, ro);
  if (r.cancelled)
    throw Cancelled(join_command(args));
  if (r.timed_out) {
    spdlog::error("[git] {} timed out after {}s", join_command(args),
                  timeout.count());
    throw Timeout(join_command(args), timeout);
  }
  return r;
}

bool Reconciler::is_stale(const fs::path &repo_path) const {
  return FetchStamp::is_stale(repo_path, opts_.stale_after);
}

void Reconciler::enforce_repo_state(const std::string &repo_url,
                                    const fs::path &dest_path,
                                    const std::string &branch,
                                    bool remove_on_error) const {
  validate_branch(branch);
  try {
    if (!fs::is_directory(dest_path)) {
      clone_repo(repo_url, dest_path, branch);
    } else if (is_stale(dest_path)) {
      fetch(dest_path);
      FetchStamp::touch(dest_path);
    } else {
      spdlog::info("[git] {} ({}) was just updated; assuming it is current",
                   dest_path.string(), branch);
    }

    reset_repo(repo_url, dest_path, branch);
  } catch (const BranchNotFound &) {
    if (remove_on_error) {
      std::error_code ec;
      fs::remove_all(dest_path, ec);
      if (ec)
        spdlog::warn("[git] cleanup of {} incomplete: {}", dest_path.string(),
                     ec.message());
      else
        spdlog::info("[git] removed {}", dest_path.string());
    }
    throw;
  }
}

void Reconciler::clone_repo(const std::string &repo_url,
                            const fs::path &dest_path,
                            const std::string &branch) const {
  validate_branch(branch);
  spdlog::info("[git] cloning {} {} from upstream", repo_url, branch);

  // relative urls and destinations resolve against the caller's cwd
  fs::path target = fs::absolute(dest_path);
  fs::create_directories(target.parent_path());

  std::vector<std::string> args{"clone", "--branch", branch, repo_url,
                                target.string()};
  CmdResult r = run_git(args, {}, opts_.clone_timeout);
  if (r.exit_code != 0) {
    spdlog::error("[git] clone failed (rc={}): {}", r.exit_code,
                  trim_output(r.out));
    auto not_found = fmt::format(fmt::runtime(kCloneBranchNotFound), branch);
    if (r.out.find(not_found) != std::string::npos)
      throw BranchNotFound(branch, repo_url);
    throw OperationFailed("git clone", r.exit_code, r.out);
  }
  FetchStamp::touch(dest_path);
}

void Reconciler::fetch(const fs::path &repo_path) const {
  spdlog::debug("[git] fetching from upstream into {}", repo_path.string());
  CmdResult r = run_git({"fetch", "-p", "origin"}, repo_path,
                        opts_.fetch_timeout);
  if (r.exit_code != 0) {
    spdlog::error("[git] fetch failed (rc={}): {}", r.exit_code,
                  trim_output(r.out));
    throw OperationFailed("git fetch", r.exit_code, r.out);
  }
}

void Reconciler::fetch_branch(const fs::path &repo_path,
                              const std::string &branch) const {
  validate_branch(branch);
  spdlog::info("[git] fetching {} from upstream", branch);
  CmdResult r = run_git({"fetch", "-p", "origin", branch}, repo_path,
                        opts_.fetch_timeout);
  if (r.exit_code != 0) {
    spdlog::error("[git] fetch of {} failed (rc={}): {}", branch, r.exit_code,
                  trim_output(r.out));
    auto not_found = fmt::format(fmt::runtime(kFetchRefNotFound), branch);
    if (contains_nocase(r.out, not_found))
      throw BranchNotFound(branch);
    throw OperationFailed("git fetch", r.exit_code, r.out);
  }
}

void Reconciler::reset_repo(const std::string &repo_url,
                            const fs::path &dest_path,
                            const std::string &branch) const {
  validate_branch(branch);
  spdlog::debug("[git] resetting {} to origin/{}", dest_path.string(), branch);
  // fails both for a branch that was never fetched and one deleted upstream
  CmdResult r = run_git({"reset", "--hard", "origin/" + branch}, dest_path,
                        opts_.reset_timeout);
  if (r.exit_code != 0) {
    spdlog::debug("[git] reset failed (rc={}): {}", r.exit_code,
                  trim_output(r.out));
    throw BranchNotFound(branch, repo_url);
  }
}

} // namespace repomat
