#include <repomat/lock.hpp>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace repomat {

static bool same_inode(int fd, const fs::path &p) {
  struct stat by_fd {};
  struct stat by_path {};
  if (::fstat(fd, &by_fd) != 0)
    throw std::system_error(errno, std::generic_category(),
                            "fstat " + p.string());
  if (::stat(p.c_str(), &by_path) != 0) {
    if (errno == ENOENT)
      return false;
    throw std::system_error(errno, std::generic_category(),
                            "stat " + p.string());
  }
  return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

FileLock::FileLock(fs::path path, bool enabled)
    : path_(std::move(path)), enabled_(enabled) {
  if (enabled_)
    acquire();
}

FileLock::~FileLock() { release(); }

void FileLock::acquire() {
  auto parent = path_.parent_path();
  if (!parent.empty())
    fs::create_directories(parent);

  for (;;) {
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
      throw std::system_error(errno, std::generic_category(),
                              "open " + path_.string());

    spdlog::debug("[lock] waiting for {}", path_.string());
    int rc;
    while ((rc = ::flock(fd, LOCK_EX)) != 0 && errno == EINTR) {
    }
    if (rc != 0) {
      int err = errno;
      ::close(fd);
      throw std::system_error(err, std::generic_category(),
                              "flock " + path_.string());
    }

    bool current = false;
    try {
      current = same_inode(fd, path_);
    } catch (...) {
      ::close(fd);
      throw;
    }
    if (current) {
      fd_ = fd;
      spdlog::debug("[lock] acquired {}", path_.string());
      return;
    }
    // the previous holder removed the file after we opened it
    ::close(fd);
  }
}

void FileLock::release() noexcept {
  if (fd_ < 0)
    return;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec)
    spdlog::warn("[lock] could not remove {}: {}", path_.string(),
                 ec.message());
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
  spdlog::debug("[lock] released {}", path_.string());
}

} // namespace repomat
