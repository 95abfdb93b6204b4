#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace repomat {

struct GlobalOpts {
  std::optional<std::filesystem::path> config;
  std::optional<std::filesystem::path> log_file;
  bool verbose = false;
};

struct CmdSuite {
  std::string branch;
  bool lock = true;
};
struct CmdTooling {
  std::string branch;
  bool lock = true;
};
struct CmdEnforce {
  std::string url;
  std::string dest;
  std::string branch;
  bool remove_on_error = true;
  bool lock = true;
};
struct CmdFetchBranch {
  std::string dest;
  std::string branch;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdSuite, CmdTooling, CmdEnforce, CmdFetchBranch,
                             CmdHelp, CmdVersion>;

struct ParseResult {
  GlobalOpts global;
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace repomat
