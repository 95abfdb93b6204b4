#pragma once

namespace repomat {

enum ExitCode {
  kExitOk = 0,
  kExitFailure = 1,
  kExitUsage = 2,
  kExitBranchNotFound = 3,
  kExitInvalidBranch = 4,
  kExitTimeout = 5,
  kExitCancelled = 130,
};

class App {
public:
  int run(int argc, char **argv);
};

} // namespace repomat
