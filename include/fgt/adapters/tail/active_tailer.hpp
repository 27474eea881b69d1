// File: include/fgt/adapters/tail/active_tailer.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "fgt/core/config.hpp"
#include "fgt/core/io/line_source.hpp"

namespace fgt {

struct ActiveTailerConfig {
  std::string path;
  std::size_t read_chunk_bytes{8192};
  DurationMs poll_interval_ms{200};
};

// Follows the active (appended-to) log at byte granularity.
//
// The file is opened once and read from `start_offset` in fixed-size chunks.
// When no new bytes are available the tailer sleeps poll_interval_ms and tries
// again; it never reports end-of-stream. A trailing line without '\n' stays
// buffered until its terminator arrives.
//
// The single control loop cannot block forever, so next() gives up with
// deadline_exceeded once the deadline set by set_deadline() passes, whether
// the file is idle or still has unread lines. Without a deadline it waits
// indefinitely.
//
// Rotation detection is the caller's job (compare current_identity() against
// the inode this tailer opened).
class ActiveTailer final : public ILineSource {
 public:
  using Clock = std::chrono::steady_clock;

  explicit ActiveTailer(ActiveTailerConfig cfg);
  ~ActiveTailer() override;

  ActiveTailer(const ActiveTailer&) = delete;
  ActiveTailer& operator=(const ActiveTailer&) = delete;

  Status open(std::uint64_t start_offset);

  void set_deadline(Clock::time_point deadline) { deadline_ = deadline; }

  // On success pos.offset is the byte offset just past the yielded line.
  Status next(SourceLine* out) override;

  void close();

  // Identity of whatever the active path names right now (not_found if absent).
  Result<FileIdentity> current_identity() const;

  // Inode of the file descriptor actually being read.
  std::uint64_t opened_inode() const { return inode_; }

  // End of the last complete line handed out.
  std::uint64_t offset() const { return offset_; }

 private:
  ActiveTailerConfig cfg_;
  int fd_{-1};
  std::uint64_t inode_{0};
  std::uint64_t offset_{0};

  std::vector<char> chunk_;
  std::string buf_;  // bytes read past offset_, no complete line yet at the tail
  Clock::time_point deadline_{Clock::time_point::max()};
};

}  // namespace fgt
