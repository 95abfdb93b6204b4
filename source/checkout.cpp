#include <repomat/checkout.hpp>
#include <repomat/errors.hpp>
#include <repomat/lock.hpp>

#include <spdlog/spdlog.h>

#include <sstream>

namespace fs = std::filesystem;

namespace repomat {

Checkouts::Checkouts(Config cfg, Reconciler rec, CommandRunner runner)
    : cfg_(std::move(cfg)), rec_(std::move(rec)), runner_(std::move(runner)) {}

fs::path Checkouts::dest_path(const fs::path &base, const std::string &prefix,
                              const std::string &branch) {
  return base / (prefix + "_" + branch);
}

fs::path Checkouts::lock_path(const fs::path &dest) {
  std::string s = dest.string();
  while (s.size() > 1 && s.back() == '/')
    s.pop_back();
  return fs::path(s + ".lock");
}

std::string Checkouts::repo_url(const std::string &base_url,
                                const std::string &name) {
  std::string base = base_url;
  while (!base.empty() && base.back() == '/')
    base.pop_back();
  size_t i = 0;
  while (i < name.size() && name[i] == '/')
    ++i;
  if (base.empty())
    return name.substr(i);
  return base + "/" + name.substr(i);
}

CheckoutKind Checkouts::suite_kind() const {
  return CheckoutKind{cfg_.suite_prefix, cfg_.suite_repo, false};
}

CheckoutKind Checkouts::tooling_kind() const {
  return CheckoutKind{cfg_.tooling_prefix, cfg_.tooling_repo, true};
}

fs::path Checkouts::fetch_suite(const std::string &branch, bool lock) const {
  return fetch(suite_kind(), branch, lock);
}

fs::path Checkouts::fetch_tooling(const std::string &branch, bool lock) const {
  return fetch(tooling_kind(), branch, lock);
}

fs::path Checkouts::fetch(const CheckoutKind &kind, const std::string &branch,
                          bool lock) const {
  Reconciler::validate_branch(branch);
  const fs::path dest = dest_path(cfg_.src_base_path, kind.prefix, branch);
  const std::string url = repo_url(cfg_.git_base_url, kind.repo_name);

  FileLock guard(lock_path(dest), lock);
  spdlog::info("[checkout] {} {} -> {}", url, branch, dest.string());
  rec_.enforce_repo_state(url, dest, branch);

  if (kind.bootstrap) {
    spdlog::debug("[checkout] bootstrapping {}", dest.string());
    run_bootstrap(dest, std::chrono::seconds(cfg_.bootstrap_timeout_sec),
                  rec_.options().cancel, runner_);
  }
  return dest;
}

int run_bootstrap(const fs::path &dest, std::chrono::seconds timeout,
                  const std::atomic_bool *cancel,
                  const CommandRunner &runner) {
  // the branch's bootstrap must check NO_CLOBBER itself to keep an existing
  // environment
  RunOptions ro;
  ro.cwd = dest;
  ro.env["NO_CLOBBER"] = "1";
  ro.timeout = timeout;
  ro.cancel = cancel;

  const std::vector<std::string> argv{"/bin/sh", "-c", "./bootstrap"};
  CmdResult r = runner(argv, ro);
  if (r.cancelled)
    throw Cancelled(join_command(argv));
  if (r.timed_out) {
    spdlog::warn("[bootstrap] {} timed out after {}s", dest.string(),
                 timeout.count());
    return -1;
  }
  if (r.exit_code != 0) {
    std::istringstream ss(r.out);
    std::string line;
    while (std::getline(ss, line)) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      spdlog::warn("[bootstrap] {}", line);
    }
  }
  spdlog::info("[bootstrap] exited with status {}", r.exit_code);
  return r.exit_code;
}

} // namespace repomat
