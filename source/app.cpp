#include <repomat/app.hpp>
#include <repomat/checkout.hpp>
#include <repomat/cli.hpp>
#include <repomat/config.hpp>
#include <repomat/errors.hpp>
#include <repomat/lock.hpp>
#include <repomat/reconciler.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>
#include <type_traits>
#include <variant>

#ifndef REPOMAT_VERSION
#define REPOMAT_VERSION "unknown"
#endif
#ifndef REPOMAT_COMMIT
#define REPOMAT_COMMIT "unknown"
#endif

namespace fs = std::filesystem;

namespace repomat {

static std::atomic_bool g_cancel{false};

static void on_signal(int) { g_cancel.store(true); }

static void print_help() {
  std::cout <<
      R"(repomat - keep branch checkouts of remote repositories up to date

Usage:
  repomat [--config FILE] [--verbose] [--log-file FILE] <command>

Commands:
  suite   <branch> [--no-lock]      update the test-suite checkout
  tooling <branch> [--no-lock]      update the tooling checkout and bootstrap it
  enforce --url URL --dest DIR --branch B [--keep-on-error] [--no-lock]
  fetch-branch --dest DIR --branch B
  help | version

Exit status: 0 ok, 2 usage, 3 branch not found, 4 invalid branch,
             5 timeout, 130 cancelled, 1 other failure
)";
}

static void setup_logging(const Config &cfg, bool verbose) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (!cfg.log_file.empty()) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file.string(), cfg.log_rotate_max_mb * 1024 * 1024,
          cfg.log_rotate_files);
      auto logger = std::make_shared<spdlog::logger>("repomat", sink);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("failed to open log file {} ({}), logging to stderr",
                   cfg.log_file.string(), e.what());
    }
  }
  if (verbose)
    spdlog::set_level(spdlog::level::debug);
}

static Config load_config(const GlobalOpts &g) {
  Config cfg;
  if (g.config) {
    cfg = Config::Load(*g.config);
  } else if (fs::exists(Config::default_path())) {
    cfg = Config::Load(Config::default_path());
  } else {
    cfg = Config::Defaults();
  }
  cfg.apply_env();
  if (g.log_file)
    cfg.log_file = *g.log_file;
  return cfg;
}

static ReconcilerOptions reconciler_options(const Config &cfg) {
  ReconcilerOptions o;
  o.stale_after = std::chrono::seconds(cfg.stale_after_sec);
  o.clone_timeout = std::chrono::seconds(cfg.clone_timeout_sec);
  o.fetch_timeout = std::chrono::seconds(cfg.fetch_timeout_sec);
  o.reset_timeout = std::chrono::seconds(cfg.reset_timeout_sec);
  o.cancel = &g_cancel;
  return o;
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? kExitOk : kExitUsage;
  }

  Config cfg;
  try {
    cfg = load_config(pr.global);
  } catch (const ConfigError &e) {
    spdlog::error("[config] {}", e.what());
    return kExitUsage;
  }
  setup_logging(cfg, pr.global.verbose);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  const Reconciler rec(reconciler_options(cfg));
  const Checkouts checkouts(cfg, rec);

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return kExitOk;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("repomat {} ({})\n", REPOMAT_VERSION,
                                     REPOMAT_COMMIT);
            return kExitOk;

          } else if constexpr (std::is_same_v<T, CmdSuite>) {
            std::cout << checkouts.fetch_suite(c.branch, c.lock).string()
                      << "\n";
            return kExitOk;

          } else if constexpr (std::is_same_v<T, CmdTooling>) {
            std::cout << checkouts.fetch_tooling(c.branch, c.lock).string()
                      << "\n";
            return kExitOk;

          } else if constexpr (std::is_same_v<T, CmdEnforce>) {
            Reconciler::validate_branch(c.branch);
            fs::path dest = fs::absolute(c.dest);
            FileLock guard(Checkouts::lock_path(dest), c.lock);
            rec.enforce_repo_state(c.url, dest, c.branch, c.remove_on_error);
            std::cout << dest.string() << "\n";
            return kExitOk;

          } else {
            static_assert(std::is_same_v<T, CmdFetchBranch>);
            rec.fetch_branch(c.dest, c.branch);
            std::cout << fs::absolute(c.dest).string() << "\n";
            return kExitOk;
          }
        },
        *pr.cmd);
  } catch (const InvalidBranchName &e) {
    spdlog::error("{}", e.what());
    return kExitInvalidBranch;
  } catch (const BranchNotFound &e) {
    spdlog::error("{}", e.what());
    return kExitBranchNotFound;
  } catch (const Timeout &e) {
    spdlog::error("{}", e.what());
    return kExitTimeout;
  } catch (const Cancelled &e) {
    spdlog::warn("{}", e.what());
    return kExitCancelled;
  } catch (const std::system_error &e) {
    spdlog::error("I/O error: {}", e.what());
    return kExitFailure;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return kExitFailure;
  }
}

} // namespace repomat
