#include "test_helpers.hpp"

#include <repomat/checkout.hpp>

#include <atomic>

using namespace repomat;
using namespace std::chrono_literals;

static Config config_for(const fs::path &root) {
  Config cfg = Config::Defaults();
  cfg.src_base_path = root / "src";
  cfg.git_base_url = root.string();
  cfg.suite_prefix = "suite";
  cfg.suite_repo = "upstream.git";
  return cfg;
}

TEST_CASE("reconciling one destination from two threads never interleaves") {
  auto root = mkd("conc_same");
  auto up = make_upstream(root);

  RecordingRunner rec;
  rec.delay = 50ms;
  Checkouts co(config_for(root), Reconciler(ReconcilerOptions{}, rec.runner()),
               rec.runner());

  std::thread a([&] { co.fetch_suite("main"); });
  std::thread b([&] { co.fetch_suite("main"); });
  a.join();
  b.join();

  // clone+reset from the first caller, reset alone from the second
  REQUIRE(rec.calls.size() == 3);
  int runs = 1;
  for (size_t i = 1; i < rec.calls.size(); ++i) {
    if (rec.calls[i].thread != rec.calls[i - 1].thread)
      ++runs;
  }
  REQUIRE(runs == 2);
  REQUIRE(rec.calls[0].argv[1] == "clone");

  auto dest = root / "src" / "suite_main";
  REQUIRE(sh_out("git rev-parse HEAD", dest) == up.head("main"));
  REQUIRE_FALSE(fs::exists(Checkouts::lock_path(dest)));
}

TEST_CASE("different destinations are reconciled in parallel") {
  auto root = mkd("conc_diff");
  auto up = make_upstream(root);
  up.push("other");

  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
  CommandRunner tracking = [&](const std::vector<std::string> &argv,
                               const RunOptions &ro) {
    int now = ++active;
    int prev = max_active.load();
    while (now > prev && !max_active.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(300ms);
    auto r = run_command(argv, ro);
    --active;
    return r;
  };

  Checkouts co(config_for(root), Reconciler(ReconcilerOptions{}, tracking),
               tracking);
  std::thread a([&] { co.fetch_suite("main"); });
  std::thread b([&] { co.fetch_suite("other"); });
  a.join();
  b.join();

  REQUIRE(max_active.load() == 2);
  REQUIRE(fs::is_directory(root / "src" / "suite_main" / ".git"));
  REQUIRE(fs::is_directory(root / "src" / "suite_other" / ".git"));
}
