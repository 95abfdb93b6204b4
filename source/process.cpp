#include <repomat/process.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <thread>

using namespace std::chrono_literals;

namespace repomat {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static int decode_status(int st) {
  if (WIFEXITED(st))
    return WEXITSTATUS(st);
  if (WIFSIGNALED(st))
    return 128 + WTERMSIG(st);
  return -1;
}

static void kill_group(pid_t pid) {
  if (::kill(-pid, SIGKILL) != 0)
    ::kill(pid, SIGKILL);
}

static int wait_blocking(pid_t pid) {
  int st = 0;
  while (::waitpid(pid, &st, 0) < 0) {
    if (errno != EINTR)
      return -1;
  }
  return st;
}

// Reads whatever is already buffered without waiting for the writer.
static void drain(int fd, std::string &out) {
  std::array<char, 4096> buf{};
  for (;;) {
    pollfd p{fd, POLLIN, 0};
    if (::poll(&p, 1, 0) <= 0)
      return;
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n <= 0)
      return;
    out.append(buf.data(), static_cast<size_t>(n));
  }
}

std::string join_command(const std::vector<std::string> &argv) {
  return fmt::format("{}", fmt::join(argv, " "));
}

CmdResult run_command(const std::vector<std::string> &argv,
                      const RunOptions &opts) {
  CmdResult res{};
  if (argv.empty()) {
    res.out = "empty argv";
    return res;
  }

  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe");

  spdlog::debug("[proc] {} (cwd={})", join_command(argv),
                opts.cwd.empty() ? "." : opts.cwd.string());

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    ::close(pfd[0]);
    ::close(pfd[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(pfd[1], STDOUT_FILENO);
    ::dup2(pfd[1], STDERR_FILENO);
    ::close(pfd[0]);
    ::close(pfd[1]);

    if (!opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) {
      ::dprintf(STDERR_FILENO, "chdir %s: %s\n", opts.cwd.c_str(),
                std::strerror(errno));
      _exit(127);
    }
    for (auto &[k, v] : opts.env)
      ::setenv(k.c_str(), v.c_str(), 1);

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (auto &s : argv)
      args.push_back(const_cast<char *>(s.c_str()));
    args.push_back(nullptr);

    ::execvp(args[0], args.data());
    ::dprintf(STDERR_FILENO, "exec %s: %s\n", args[0], std::strerror(errno));
    _exit(127);
  }

  ::setpgid(pid, pid);
  ::close(pfd[1]);

  const bool limited = opts.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + opts.timeout;
  std::array<char, 4096> buf{};
  bool eof = false;
  bool reaped = false;
  int status = 0;

  while (!reaped) {
    if (opts.cancel && opts.cancel->load()) {
      res.cancelled = true;
      break;
    }
    long long wait_ms = 100;
    if (limited) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        res.timed_out = true;
        break;
      }
      wait_ms = std::min<long long>(wait_ms, left.count());
    }

    if (!eof) {
      pollfd p{pfd[0], POLLIN, 0};
      int rc = ::poll(&p, 1, static_cast<int>(wait_ms));
      if (rc > 0) {
        ssize_t n = ::read(pfd[0], buf.data(), buf.size());
        if (n > 0)
          res.out.append(buf.data(), static_cast<size_t>(n));
        else if (n == 0 || (errno != EINTR && errno != EAGAIN))
          eof = true;
      } else if (rc < 0 && errno != EINTR) {
        eof = true;
      }
    } else {
      std::this_thread::sleep_for(10ms);
    }

    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      reaped = true;
      // a grandchild may still hold the write end; take what is there
      drain(pfd[0], res.out);
    } else if (r < 0 && errno != EINTR) {
      ::close(pfd[0]);
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }

  if (!reaped) {
    spdlog::warn("[proc] killing pid={} ({}): {}", pid,
                 res.timed_out ? "timeout" : "cancelled", join_command(argv));
    kill_group(pid);
    status = wait_blocking(pid);
    drain(pfd[0], res.out);
  }
  ::close(pfd[0]);

  res.exit_code = status < 0 ? -1 : decode_status(status);
  return res;
}

} // namespace repomat
