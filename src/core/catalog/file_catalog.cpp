// File: src/core/catalog/file_catalog.cpp
#include "fgt/core/catalog/file_catalog.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <sys/stat.h>

namespace fgt {
namespace {

constexpr const char kGzSuffix[] = ".gz";
constexpr std::size_t kStampLen = 15;  // YYYYMMDD-HHMMSS

bool is_digits(const std::string& s, std::size_t pos, std::size_t n) {
  if (pos + n > s.size()) return false;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

}  // namespace

bool has_gzip_suffix(const std::string& path) {
  const std::size_t n = sizeof(kGzSuffix) - 1;
  return path.size() >= n && path.compare(path.size() - n, n, kGzSuffix) == 0;
}

FileCatalog::FileCatalog(std::string dir, std::string basename)
    : dir_(std::move(dir)), basename_(std::move(basename)) {}

std::string FileCatalog::rotation_stamp(const std::string& name) const {
  const std::string prefix = basename_ + "-";
  if (name.rfind(prefix, 0) != 0) return {};

  const std::size_t p = prefix.size();
  if (!is_digits(name, p, 8)) return {};
  if (p + 8 >= name.size() || name[p + 8] != '-') return {};
  if (!is_digits(name, p + 9, 6)) return {};

  const std::size_t end = p + kStampLen;
  const std::string rest = name.substr(end);
  if (!rest.empty() && rest != kGzSuffix) return {};

  return name.substr(p, kStampLen);
}

Result<std::vector<std::string>> FileCatalog::list_rotated_files() const {
  namespace fs = std::filesystem;
  using Out = std::vector<std::string>;

  std::error_code ec;
  if (!fs::exists(dir_, ec)) return Result<Out>::ok(Out{});

  struct Entry {
    std::string stamp;
    std::string path;
  };

  std::vector<Entry> entries;
  try {
    for (const auto& it : fs::directory_iterator(dir_)) {
      std::error_code fec;
      if (!it.is_regular_file(fec)) continue;
      const std::string stamp = rotation_stamp(it.path().filename().string());
      if (stamp.empty()) continue;
      entries.push_back(Entry{stamp, it.path().string()});
    }
  } catch (const fs::filesystem_error& e) {
    return Result<Out>::err(Status::io_error("failed listing directory '" + dir_ + "': " + e.what()));
  }

  // Fixed-width zero-padded stamps: lexicographic == chronological.
  // Path breaks ties (plain vs .gz of the same stamp) deterministically.
  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
    if (a.stamp != b.stamp) return a.stamp < b.stamp;
    return a.path < b.path;
  });

  Out out;
  out.reserve(entries.size());
  for (auto& e : entries) out.push_back(std::move(e.path));
  return Result<Out>::ok(std::move(out));
}

Result<FileIdentity> stat_file(const std::string& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    const int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      return Result<FileIdentity>::err(Status::not_found("file vanished: " + path));
    }
    return Result<FileIdentity>::err(Status::io_error("stat " + path + ": " + std::strerror(err)));
  }

  FileIdentity id;
  id.path = path;
  id.inode = static_cast<std::uint64_t>(st.st_ino);
  id.size = static_cast<std::uint64_t>(st.st_size);
  id.mtime_s = static_cast<std::int64_t>(st.st_mtime);
  return Result<FileIdentity>::ok(std::move(id));
}

}  // namespace fgt
