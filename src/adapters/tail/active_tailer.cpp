// File: src/adapters/tail/active_tailer.cpp
#include "fgt/adapters/tail/active_tailer.hpp"

#include <cerrno>
#include <cstring>
#include <string_view>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "fgt/core/catalog/file_catalog.hpp"
#include "fgt/core/util/text.hpp"

namespace fgt {

ActiveTailer::ActiveTailer(ActiveTailerConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.read_chunk_bytes == 0) cfg_.read_chunk_bytes = 8192;
  if (cfg_.poll_interval_ms <= 0) cfg_.poll_interval_ms = 200;
  chunk_.resize(cfg_.read_chunk_bytes);
}

ActiveTailer::~ActiveTailer() { close(); }

Status ActiveTailer::open(std::uint64_t start_offset) {
  if (cfg_.path.empty()) return Status::invalid_argument("ActiveTailer: path is empty");
  close();

  fd_ = ::open(cfg_.path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    const int err = errno;
    fd_ = -1;
    if (err == ENOENT) return Status::not_found("ActiveTailer: active file absent: " + cfg_.path);
    return Status::io_error("ActiveTailer: open " + cfg_.path + ": " + std::strerror(err));
  }

  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    const int err = errno;
    close();
    return Status::io_error("ActiveTailer: fstat " + cfg_.path + ": " + std::strerror(err));
  }
  inode_ = static_cast<std::uint64_t>(st.st_ino);

  if (::lseek(fd_, static_cast<off_t>(start_offset), SEEK_SET) < 0) {
    const int err = errno;
    close();
    return Status::io_error("ActiveTailer: seek " + cfg_.path + ": " + std::strerror(err));
  }

  offset_ = start_offset;
  buf_.clear();
  return Status::ok_status();
}

Status ActiveTailer::next(SourceLine* out) {
  if (!out) return Status::invalid_argument("ActiveTailer::next: out is null");
  if (fd_ < 0) return Status::invalid_argument("ActiveTailer::next: not opened");

  const auto poll = std::chrono::milliseconds(cfg_.poll_interval_ms);

  while (true) {
    // Checked before serving buffered lines too, so a backlog cannot pin the caller.
    if (Clock::now() >= deadline_) {
      return Status::deadline_exceeded("ActiveTailer: slice deadline passed");
    }

    const std::size_t nl = buf_.find('\n');
    if (nl != std::string::npos) {
      const std::size_t len = nl + 1;
      out->text = decode_utf8_lossy(std::string_view(buf_.data(), len));
      buf_.erase(0, len);
      offset_ += len;

      out->pos.path = cfg_.path;
      out->pos.inode = inode_;
      out->pos.offset = offset_;
      out->pos.size = 0;
      out->pos.mtime_s = 0;
      return Status::ok_status();
    }

    const ssize_t n = ::read(fd_, chunk_.data(), chunk_.size());
    if (n > 0) {
      buf_.append(chunk_.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      return Status::io_error("ActiveTailer: read " + cfg_.path + ": " + std::strerror(errno));
    }

    // No new bytes yet.
    const auto remaining = deadline_ - Clock::now();
    std::this_thread::sleep_for(remaining < poll ? remaining : Clock::duration(poll));
  }
}

void ActiveTailer::close() {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
  buf_.clear();
}

Result<FileIdentity> ActiveTailer::current_identity() const { return stat_file(cfg_.path); }

}  // namespace fgt
