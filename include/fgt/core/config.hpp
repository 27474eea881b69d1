// include/fgt/core/config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "fgt/core/status.hpp"

namespace fgt {

// Units policy:
// - Loop intervals in milliseconds (int64)
// - Sizes in bytes

using DurationMs = std::int64_t;

constexpr DurationMs seconds_to_ms(double seconds) {
  return static_cast<DurationMs>(seconds * 1000.0);
}

// -----------------------------
// Filesystem layout
// -----------------------------
struct PathsConfig {
  // The single file the firewall appends to.
  std::string active_log = "/data/fortigate/fortigate.log";

  // Where rotated siblings live. Empty = parent directory of active_log.
  std::string rotated_dir;

  // Event / DLQ hourly buckets land here.
  std::string output_dir = "/data/fortigate/parsed";

  // Empty = <output_dir>/checkpoint.json
  std::string checkpoint;

  // Empty = <output_dir>/metrics.jsonl
  std::string metrics;
};

// -----------------------------
// Control loop timing
// -----------------------------
struct TimingConfig {
  // Wall-clock budget for one active-file slice per loop iteration.
  DurationMs tail_slice_ms = seconds_to_ms(2.0);

  // Sleep between polls when the active file has no new bytes.
  DurationMs poll_interval_ms = 200;

  DurationMs checkpoint_interval_ms = seconds_to_ms(2.0);
  DurationMs metrics_interval_ms = seconds_to_ms(10.0);
};

struct TailConfig {
  std::size_t read_chunk_bytes = 8192;
};

struct CheckpointConfig {
  // Completed-file ledger keeps only the most recent N entries.
  std::size_t completed_cap = 5000;
};

struct LoggingConfig {
  std::string level = "info";  // trace | debug | info | warn | error | critical | off
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  PathsConfig paths;
  TimingConfig timing;
  TailConfig tail;
  CheckpointConfig checkpoint;
  LoggingConfig logging;

  // Resolved accessors (apply the "empty = derived" defaults above).
  [[nodiscard]] std::string rotated_dir() const;
  [[nodiscard]] std::string rotated_basename() const;
  [[nodiscard]] std::string checkpoint_path() const;
  [[nodiscard]] std::string metrics_path() const;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.paths.active_log.empty()) {
    return Status::invalid_argument("paths.active_log must not be empty");
  }
  if (cfg.rotated_basename().empty()) {
    return Status::invalid_argument("paths.active_log must name a file");
  }
  if (cfg.paths.output_dir.empty()) {
    return Status::invalid_argument("paths.output_dir must not be empty");
  }
  if (cfg.timing.tail_slice_ms <= 0) {
    return Status::invalid_argument("timing.tail_slice_s must be > 0");
  }
  if (cfg.timing.poll_interval_ms <= 0) {
    return Status::invalid_argument("timing.poll_interval_ms must be > 0");
  }
  if (cfg.timing.checkpoint_interval_ms <= 0) {
    return Status::invalid_argument("timing.checkpoint_interval_s must be > 0");
  }
  if (cfg.timing.metrics_interval_ms <= 0) {
    return Status::invalid_argument("timing.metrics_interval_s must be > 0");
  }
  if (cfg.tail.read_chunk_bytes == 0) {
    return Status::invalid_argument("tail.read_chunk_bytes must be > 0");
  }
  if (cfg.checkpoint.completed_cap == 0) {
    return Status::invalid_argument("checkpoint.completed_cap must be > 0");
  }
  const std::string& lv = cfg.logging.level;
  if (lv != "trace" && lv != "debug" && lv != "info" && lv != "warn" && lv != "error" &&
      lv != "critical" && lv != "off") {
    return Status::invalid_argument("logging.level must be one of trace|debug|info|warn|error|critical|off");
  }
  return Status::ok_status();
}

}  // namespace fgt
