#include "test_helpers.hpp"

#include <repomat/process.hpp>

#include <atomic>

using namespace repomat;
using namespace std::chrono_literals;

TEST_CASE("run_command captures stdout and stderr together") {
  auto r = run_command({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"},
                       RunOptions{});
  REQUIRE(r.exit_code == 3);
  REQUIRE_FALSE(r.timed_out);
  REQUIRE_FALSE(r.cancelled);
  REQUIRE(r.out.find("out") != std::string::npos);
  REQUIRE(r.out.find("err") != std::string::npos);
}

TEST_CASE("run_command honours cwd and extra environment") {
  auto dir = mkd("proc_cwd");
  RunOptions ro;
  ro.cwd = dir;
  ro.env["REPOMAT_TEST_VAR"] = "hello";
  auto r = run_command({"/bin/sh", "-c", "pwd; echo $REPOMAT_TEST_VAR"}, ro);
  REQUIRE(r.exit_code == 0);
  REQUIRE(r.out.find(fs::canonical(dir).string()) != std::string::npos);
  REQUIRE(r.out.find("hello") != std::string::npos);
}

TEST_CASE("run_command reports a missing executable as 127") {
  auto r = run_command({"repomat-no-such-binary-xyz"}, RunOptions{});
  REQUIRE(r.exit_code == 127);
  REQUIRE(r.out.find("repomat-no-such-binary-xyz") != std::string::npos);
}

TEST_CASE("run_command kills a child that exceeds its timeout") {
  RunOptions ro;
  ro.timeout = 200ms;
  auto t0 = std::chrono::steady_clock::now();
  auto r = run_command({"/bin/sleep", "10"}, ro);
  auto elapsed = std::chrono::steady_clock::now() - t0;
  REQUIRE(r.timed_out);
  REQUIRE(r.exit_code != 0);
  REQUIRE(elapsed < 5s);
}

TEST_CASE("run_command timeout also ends grandchildren holding the pipe") {
  RunOptions ro;
  ro.timeout = 300ms;
  auto t0 = std::chrono::steady_clock::now();
  auto r = run_command({"/bin/sh", "-c", "sleep 10 & sleep 10; wait"}, ro);
  REQUIRE(r.timed_out);
  REQUIRE(std::chrono::steady_clock::now() - t0 < 5s);
}

TEST_CASE("run_command stops when the cancel flag is raised") {
  std::atomic_bool cancel{false};
  RunOptions ro;
  ro.cancel = &cancel;
  std::thread t([&] {
    std::this_thread::sleep_for(200ms);
    cancel = true;
  });
  auto t0 = std::chrono::steady_clock::now();
  auto r = run_command({"/bin/sleep", "10"}, ro);
  t.join();
  REQUIRE(r.cancelled);
  REQUIRE_FALSE(r.timed_out);
  REQUIRE(std::chrono::steady_clock::now() - t0 < 5s);
}

TEST_CASE("run_command gives the child an empty stdin") {
  RunOptions ro;
  ro.timeout = 5s;
  auto r = run_command({"/bin/cat"}, ro);
  REQUIRE_FALSE(r.timed_out);
  REQUIRE(r.exit_code == 0);
  REQUIRE(r.out.empty());
}

TEST_CASE("join_command renders argv with spaces") {
  REQUIRE(join_command({"git", "fetch", "-p", "origin"}) ==
          "git fetch -p origin");
}
