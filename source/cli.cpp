#include <repomat/cli.hpp>

#include <string_view>

namespace repomat {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};

  int i = 1;
  for (; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "--config" && has_arg(i, argc)) {
      r.global.config = std::filesystem::path(argv[++i]);
    } else if (a == "--log-file" && has_arg(i, argc)) {
      r.global.log_file = std::filesystem::path(argv[++i]);
    } else if (a == "--verbose" || a == "-v") {
      r.global.verbose = true;
    } else if (a == "--config" || a == "--log-file") {
      r.error = std::string(a) + ": value required";
      return r;
    } else {
      break;
    }
  }

  if (i >= argc) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[i++];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "suite" || cmd == "tooling") {
    std::string branch;
    bool lock = true;
    for (; i < argc; ++i) {
      std::string_view a = argv[i];
      if (a == "--no-lock") {
        lock = false;
      } else if (branch.empty() && !a.empty() && a[0] != '-') {
        branch = argv[i];
      } else {
        r.error = cmd + ": unexpected argument " + std::string(a);
        return r;
      }
    }
    if (branch.empty()) {
      r.error = cmd + ": branch required";
      return r;
    }
    if (cmd == "suite")
      r.cmd = CmdSuite{branch, lock};
    else
      r.cmd = CmdTooling{branch, lock};
    return r;
  }

  if (cmd == "enforce") {
    CmdEnforce c{};
    for (; i < argc; ++i) {
      std::string_view a = argv[i];
      if (a == "--url" && has_arg(i, argc))
        c.url = argv[++i];
      else if (a == "--dest" && has_arg(i, argc))
        c.dest = argv[++i];
      else if (a == "--branch" && has_arg(i, argc))
        c.branch = argv[++i];
      else if (a == "--keep-on-error")
        c.remove_on_error = false;
      else if (a == "--no-lock")
        c.lock = false;
      else {
        r.error = "enforce: unexpected argument " + std::string(a);
        return r;
      }
    }
    if (c.url.empty() || c.dest.empty() || c.branch.empty()) {
      r.error = "enforce: --url, --dest and --branch required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "fetch-branch") {
    CmdFetchBranch c{};
    for (; i < argc; ++i) {
      std::string_view a = argv[i];
      if (a == "--dest" && has_arg(i, argc))
        c.dest = argv[++i];
      else if (a == "--branch" && has_arg(i, argc))
        c.branch = argv[++i];
      else {
        r.error = "fetch-branch: unexpected argument " + std::string(a);
        return r;
      }
    }
    if (c.dest.empty() || c.branch.empty()) {
      r.error = "fetch-branch: --dest and --branch required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace repomat
