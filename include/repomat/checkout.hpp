#pragma once
#include <repomat/config.hpp>
#include <repomat/process.hpp>
#include <repomat/reconciler.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

namespace repomat {

// One kind of checkout kept under src_base_path.
struct CheckoutKind {
  std::string prefix;    // directory is <prefix>_<branch>
  std::string repo_name; // appended to git_base_url
  bool bootstrap{false};
};

class Checkouts {
public:
  Checkouts(Config cfg, Reconciler rec, CommandRunner runner = run_command);

  std::filesystem::path fetch_suite(const std::string &branch,
                                    bool lock = true) const;
  std::filesystem::path fetch_tooling(const std::string &branch,
                                      bool lock = true) const;

  // Only one caller per destination reconciles at a time.
  std::filesystem::path fetch(const CheckoutKind &kind,
                              const std::string &branch,
                              bool lock = true) const;

  CheckoutKind suite_kind() const;
  CheckoutKind tooling_kind() const;

  static std::filesystem::path dest_path(const std::filesystem::path &base,
                                         const std::string &prefix,
                                         const std::string &branch);
  static std::filesystem::path lock_path(const std::filesystem::path &dest);
  static std::string repo_url(const std::string &base_url,
                              const std::string &name);

  const Config &config() const { return cfg_; }

private:
  Config cfg_;
  Reconciler rec_;
  CommandRunner runner_;
};

// Runs ./bootstrap inside `dest` with NO_CLOBBER=1. Returns its exit status,
// or -1 when it was killed on timeout. A failing bootstrap is only logged.
// Throws Cancelled when `cancel` is raised while it runs.
int run_bootstrap(const std::filesystem::path &dest,
                  std::chrono::seconds timeout,
                  const std::atomic_bool *cancel = nullptr,
                  const CommandRunner &runner = run_command);

} // namespace repomat
