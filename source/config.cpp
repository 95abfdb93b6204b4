#include <repomat/config.hpp>
#include <repomat/errors.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace repomat {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                        s.back() == '\r' || s.back() == '\n'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

static int parse_int(const std::string &key, const std::string &val,
                     bool allow_zero) {
  char *end = nullptr;
  errno = 0;
  long v = std::strtol(val.c_str(), &end, 10);
  if (val.empty() || *end != '\0' || errno == ERANGE || v < 0 ||
      v > 1000000000L || (v == 0 && !allow_zero))
    throw ConfigError(fmt::format("invalid value for {}: '{}'", key, val));
  return static_cast<int>(v);
}

fs::path expand_home(const std::string &s) {
  if (s == "~" || s.rfind("~/", 0) == 0) {
    const char *home = std::getenv("HOME");
    if (home && *home)
      return fs::path(home) / s.substr(s.size() > 1 ? 2 : 1);
  }
  return fs::path(s);
}

Config Config::Defaults() {
  Config c;
  c.src_base_path = expand_home("~/src");
  return c;
}

fs::path Config::default_path() { return expand_home("~/.repomat.conf"); }

Config Config::Load(const fs::path &p) {
  Config c = Defaults();
  std::ifstream in(p);
  if (!in)
    throw ConfigError("config file not found: " + p.string());

  std::string section;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';')
      continue;
    if (line.front() == '[' && line.back() == ']') {
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos)
      throw ConfigError(
          fmt::format("{}:{}: expected key = value", p.string(), lineno));
    auto key = trim(line.substr(0, eq));
    auto val = trim(line.substr(eq + 1));
    auto full = section + "." + key;

    if (full == "checkout.src_base_path") {
      c.src_base_path = expand_home(val);
    } else if (full == "checkout.git_base_url") {
      c.git_base_url = val;
    } else if (full == "checkout.suite_prefix") {
      c.suite_prefix = val;
    } else if (full == "checkout.suite_repo") {
      c.suite_repo = val;
    } else if (full == "checkout.tooling_prefix") {
      c.tooling_prefix = val;
    } else if (full == "checkout.tooling_repo") {
      c.tooling_repo = val;

    } else if (full == "sync.stale_after_sec") {
      c.stale_after_sec = parse_int(full, val, true);

    } else if (full == "timeouts.clone_sec") {
      c.clone_timeout_sec = parse_int(full, val, false);
    } else if (full == "timeouts.fetch_sec") {
      c.fetch_timeout_sec = parse_int(full, val, false);
    } else if (full == "timeouts.reset_sec") {
      c.reset_timeout_sec = parse_int(full, val, false);
    } else if (full == "timeouts.bootstrap_sec") {
      c.bootstrap_timeout_sec = parse_int(full, val, false);

    } else if (full == "log.file") {
      c.log_file = val.empty() ? fs::path{} : expand_home(val);
    } else if (full == "log.rotate_max_mb") {
      c.log_rotate_max_mb = static_cast<std::size_t>(parse_int(full, val, false));
    } else if (full == "log.rotate_files") {
      c.log_rotate_files = static_cast<std::size_t>(parse_int(full, val, false));

    } else {
      spdlog::warn("[config] {}:{}: unknown key '{}'", p.string(), lineno,
                   full);
    }
  }
  return c;
}

void Config::apply_env() {
  if (const char *v = std::getenv("REPOMAT_SRC_BASE_PATH"); v && *v)
    src_base_path = expand_home(v);
  if (const char *v = std::getenv("REPOMAT_GIT_BASE_URL"); v && *v)
    git_base_url = v;
  if (const char *v = std::getenv("REPOMAT_STALE_AFTER_SEC"); v && *v)
    stale_after_sec = parse_int("REPOMAT_STALE_AFTER_SEC", v, true);
}

} // namespace repomat
