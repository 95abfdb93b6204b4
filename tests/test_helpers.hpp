#pragma once
#include <catch2/catch.hpp>
#include <repomat/process.hpp>

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static fs::path mkd(const std::string &name) {
  auto d = fs::temp_directory_path() /
           ("repomat_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void sh(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

static std::string sh_out(const std::string &cmd, const fs::path &wd) {
  FILE *p = popen(("cd \"" + wd.string() + "\" && " + cmd).c_str(), "r");
  REQUIRE(p);
  std::string s;
  char buf[256];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), p)) > 0)
    s.append(buf, n);
  pclose(p);
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

static void commit_file(const fs::path &work, const std::string &file,
                        const std::string &content, const std::string &msg) {
  std::ofstream(work / file) << content;
  sh("git add .", work);
  sh("git commit -q -m " + msg, work);
}

// A working repo with one commit on `main` and a bare clone of it that acts
// as the remote.
struct Upstream {
  fs::path work;
  fs::path bare;
  std::string url() const { return bare.string(); }

  std::string head(const std::string &branch) const {
    return sh_out("git rev-parse refs/heads/" + branch, bare);
  }
  void push(const std::string &branch) const {
    sh("git push -q \"" + bare.string() + "\" HEAD:refs/heads/" + branch, work);
  }
  void remove_branch(const std::string &branch) const {
    sh("git branch -q -D " + branch, bare);
  }
};

static Upstream make_upstream(const fs::path &root) {
  Upstream u{root / "work", root / "upstream.git"};
  fs::create_directories(u.work);
  sh("git init -q", u.work);
  sh("git symbolic-ref HEAD refs/heads/main", u.work);
  sh("git config user.email test@example.com", u.work);
  sh("git config user.name tester", u.work);
  commit_file(u.work, "README", "v1\n", "v1");
  sh("git clone -q --bare \"" + u.work.string() + "\" \"" + u.bare.string() +
         "\"",
     root);
  return u;
}

// Wraps run_command and keeps the argv of every call.
struct RecordingRunner {
  struct Call {
    std::vector<std::string> argv;
    std::thread::id thread;
  };

  std::mutex m;
  std::vector<Call> calls;
  std::chrono::milliseconds delay{0};

  repomat::CommandRunner runner() {
    return [this](const std::vector<std::string> &argv,
                  const repomat::RunOptions &opts) {
      {
        std::lock_guard<std::mutex> lk(m);
        calls.push_back({argv, std::this_thread::get_id()});
      }
      if (delay.count() > 0)
        std::this_thread::sleep_for(delay);
      return repomat::run_command(argv, opts);
    };
  }

  // number of calls whose argv starts with git <sub>
  size_t count(const std::string &sub, size_t argc = 0) {
    std::lock_guard<std::mutex> lk(m);
    size_t n = 0;
    for (auto &c : calls) {
      if (c.argv.size() > 1 && c.argv[1] == sub &&
          (argc == 0 || c.argv.size() == argc))
        ++n;
    }
    return n;
  }
};
