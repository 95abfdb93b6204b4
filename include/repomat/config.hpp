#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

namespace repomat {

struct Config {
  // [checkout]
  std::filesystem::path src_base_path;
  std::string git_base_url = "https://github.com/ceph/";
  std::string suite_prefix = "ceph-qa-suite";
  std::string suite_repo = "ceph-qa-suite";
  std::string tooling_prefix = "teuthology";
  std::string tooling_repo = "teuthology.git";

  // [sync]
  int stale_after_sec = 60;

  // [timeouts]
  int clone_timeout_sec = 900;
  int fetch_timeout_sec = 300;
  int reset_timeout_sec = 60;
  int bootstrap_timeout_sec = 1800;

  // [log]
  std::filesystem::path log_file;
  std::size_t log_rotate_max_mb = 5;
  std::size_t log_rotate_files = 3;

  static Config Defaults();
  // Defaults overlaid with the file. Throws ConfigError.
  static Config Load(const std::filesystem::path &p);
  static std::filesystem::path default_path();

  // REPOMAT_SRC_BASE_PATH, REPOMAT_GIT_BASE_URL, REPOMAT_STALE_AFTER_SEC
  void apply_env();
};

std::filesystem::path expand_home(const std::string &s);

} // namespace repomat
