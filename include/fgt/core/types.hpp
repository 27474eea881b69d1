// include/fgt/core/types.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fgt {

// -----------------------------
// File identity
// -----------------------------
// A path can name different physical files over time (rotation, recreation).
// Identity, not path, is the unit of dedup.

struct FileIdentity {
  std::string path;
  std::uint64_t inode = 0;
  std::uint64_t size = 0;
  std::int64_t mtime_s = 0;  // truncated to whole seconds

  bool operator==(const FileIdentity& other) const noexcept {
    return path == other.path && inode == other.inode && size == other.size &&
           mtime_s == other.mtime_s;
  }
  bool operator!=(const FileIdentity& other) const noexcept { return !(*this == other); }

  // "path|inode|size|mtime"
  [[nodiscard]] std::string dedup_key() const {
    return path + "|" + std::to_string(inode) + "|" + std::to_string(size) + "|" +
           std::to_string(mtime_s);
  }
};

// Where a line came from. offset is absent for compressed files.
struct SourcePosition {
  std::string path;
  std::uint64_t inode = 0;
  std::optional<std::uint64_t> offset;
  std::uint64_t size = 0;
  std::int64_t mtime_s = 0;
};

// One raw line pulled from a source, terminator included when present.
struct SourceLine {
  std::string text;
  SourcePosition pos;
};

// -----------------------------
// Checkpoint state
// -----------------------------

struct CompletedFileRecord {
  std::string key;
  FileIdentity identity;
  std::int64_t completed_at = 0;

  bool operator==(const CompletedFileRecord& other) const noexcept {
    return key == other.key && identity == other.identity && completed_at == other.completed_at;
  }
};

struct ActivePointer {
  std::string path;
  std::optional<std::uint64_t> inode;  // unset until the active file has been seen
  std::uint64_t offset = 0;            // bytes, not lines
  std::optional<std::string> last_event_ts_seen;

  bool operator==(const ActivePointer& other) const noexcept {
    return path == other.path && inode == other.inode && offset == other.offset &&
           last_event_ts_seen == other.last_event_ts_seen;
  }
};

// Monotonic for the lifetime of the process.
struct Counters {
  std::uint64_t lines_in_total = 0;
  std::uint64_t bytes_in_total = 0;
  std::uint64_t events_out_total = 0;
  std::uint64_t dlq_out_total = 0;
  std::uint64_t parse_fail_total = 0;
  std::uint64_t write_fail_total = 0;
  std::uint64_t checkpoint_fail_total = 0;

  bool operator==(const Counters& other) const noexcept {
    return lines_in_total == other.lines_in_total && bytes_in_total == other.bytes_in_total &&
           events_out_total == other.events_out_total && dlq_out_total == other.dlq_out_total &&
           parse_fail_total == other.parse_fail_total &&
           write_fail_total == other.write_fail_total &&
           checkpoint_fail_total == other.checkpoint_fail_total;
  }
};

constexpr int kCheckpointSchemaVersion = 1;

struct CheckpointState {
  int schema_version = kCheckpointSchemaVersion;
  ActivePointer active;
  std::vector<CompletedFileRecord> completed;  // insertion order, oldest first
  Counters counters;
  std::int64_t updated_at = 0;
};

// -----------------------------
// Parsed output
// -----------------------------

enum class ParseStatus { kOk, kPartial };

enum class DlqReason {
  kEmptyLine,
  kNonTextOrBinary,
  kSyslogHeaderParseFail,
  kInvalidMonth,
  kKvParseException,
};

const char* to_string(ParseStatus s);
const char* to_string(DlqReason r);

// Abbreviated source stamped on routed records.
struct SourceRef {
  std::string path;
  std::uint64_t inode = 0;
  std::optional<std::uint64_t> offset;
};

constexpr int kRecordSchemaVersion = 1;

struct FirewallEvent {
  std::string event_id;  // 32 hex chars
  std::string host;
  std::optional<std::string> event_ts;

  std::optional<std::string> type;
  std::optional<std::string> subtype;
  std::optional<std::string> level;
  std::optional<std::string> devname;
  std::optional<std::string> devid;
  std::optional<std::string> vd;
  std::optional<std::string> action;
  std::optional<std::int64_t> policyid;
  std::optional<std::int64_t> proto;
  std::optional<std::string> service;

  std::optional<std::string> srcip;
  std::optional<std::int64_t> srcport;
  std::optional<std::string> srcintf;
  std::optional<std::string> srcintfrole;
  std::optional<std::string> dstip;
  std::optional<std::int64_t> dstport;
  std::optional<std::string> dstintf;
  std::optional<std::string> dstintfrole;

  std::optional<std::int64_t> sentbyte;
  std::optional<std::int64_t> rcvdbyte;
  std::optional<std::int64_t> sentpkt;
  std::optional<std::int64_t> rcvdpkt;

  std::string raw;
  ParseStatus parse_status = ParseStatus::kOk;

  // Stamped by the router.
  std::string ingest_ts;
  SourceRef source;
};

struct DlqRecord {
  DlqReason reason = DlqReason::kSyslogHeaderParseFail;
  std::string raw;

  // Stamped by the router.
  std::string ingest_ts;
  SourceRef source;
};

// One liveness summary per metrics interval.
struct MetricsRecord {
  std::string ts;  // ISO-8601 UTC
  double window_s = 0.0;
  Counters totals;
  Counters deltas;
  double lines_per_s = 0.0;
  double events_per_s = 0.0;
  ActivePointer active;
  std::size_t completed_files = 0;
  std::int64_t checkpoint_updated_at = 0;
  std::string config_hash;
};

}  // namespace fgt
