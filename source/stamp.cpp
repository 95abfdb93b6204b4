#include <repomat/stamp.hpp>

#include <spdlog/spdlog.h>

#include <fstream>

namespace fs = std::filesystem;

namespace repomat {

fs::path FetchStamp::file(const fs::path &repo_path) {
  return repo_path / ".git" / "repomat-fetched";
}

std::optional<std::chrono::seconds> FetchStamp::age(const fs::path &repo_path) {
  std::error_code ec;
  auto mtime = fs::last_write_time(file(repo_path), ec);
  if (ec)
    return std::nullopt;
  auto d = fs::file_time_type::clock::now() - mtime;
  // mtime in the future counts as just now
  if (d.count() < 0)
    return std::chrono::seconds{0};
  return std::chrono::duration_cast<std::chrono::seconds>(d);
}

bool FetchStamp::is_stale(const fs::path &repo_path,
                          std::chrono::seconds max_age) {
  auto a = age(repo_path);
  return !a || *a > max_age;
}

bool FetchStamp::touch(const fs::path &repo_path) {
  auto f = file(repo_path);
  {
    std::ofstream o(f, std::ios::app);
    if (!o) {
      spdlog::warn("[stamp] cannot write {}", f.string());
      return false;
    }
  }
  std::error_code ec;
  fs::last_write_time(f, fs::file_time_type::clock::now(), ec);
  if (ec) {
    spdlog::warn("[stamp] cannot update mtime of {}: {}", f.string(),
                 ec.message());
    return false;
  }
  return true;
}

} // namespace repomat
