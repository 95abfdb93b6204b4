#pragma once
#include <filesystem>

namespace repomat {

/// Scoped exclusive advisory lock (flock) on a file next to a checkout.
///
/// The constructor blocks until the lock is held; there is no timeout.
/// The destructor removes the lock file, then unlocks and closes it.
/// Removal happens while the lock is still held, and an acquirer that ends
/// up holding an inode no longer reachable through the path reopens and
/// tries again, so a waiter never holds a lock on a deleted file.
///
/// A disabled lock does nothing and never touches the filesystem.
class FileLock {
public:
  explicit FileLock(std::filesystem::path path, bool enabled = true);
  ~FileLock();

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  const std::filesystem::path &path() const { return path_; }
  bool enabled() const { return enabled_; }
  bool held() const { return fd_ >= 0; }

private:
  void acquire();
  void release() noexcept;

  std::filesystem::path path_;
  bool enabled_;
  int fd_{-1};
};

} // namespace repomat
