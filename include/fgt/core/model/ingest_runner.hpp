// File: include/fgt/core/model/ingest_runner.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "fgt/core/catalog/file_catalog.hpp"
#include "fgt/core/checkpoint/checkpoint_store.hpp"
#include "fgt/core/config.hpp"
#include "fgt/core/events/event_sink.hpp"
#include "fgt/core/model/event_router.hpp"
#include "fgt/core/model/metrics_window.hpp"
#include "fgt/core/status.hpp"
#include "fgt/core/types.hpp"

namespace fgt {

// IngestRunner owns lifecycle and the one CheckpointState of the process.
//
// One loop iteration (run_once):
//   1. drain every rotated file not yet in the completed ledger
//   2. follow the active file for at most timing.tail_slice_ms
//   3. fire the checkpoint and metrics timers if due
//
// Time contract: timers run on the steady clock; records carry wall-clock UTC.
class IngestRunner {
 public:
  using Clock = std::chrono::steady_clock;

  // `sink` must outlive the runner.
  IngestRunner(Config cfg, EventSink& sink);

  // Loads the checkpoint and opens the sink. Any failure here is fatal.
  Status start();

  void drain_rotated();
  void tail_slice();
  void tick_timers();
  void run_once();

  // Loops until `stop` becomes true, then does a final save.
  void run(const std::atomic<bool>& stop);

  // Final checkpoint save, flush and close the sink.
  Status stop();

  // Flushes the sink and writes the checkpoint; counts a failure.
  Status save_checkpoint();

  Status emit_metrics();

  const CheckpointState& state() const { return state_; }
  const std::string& config_hash() const { return config_hash_; }

 private:
  // Applies the rotation/truncation rules against what is on disk now.
  void sync_active_pointer_(const FileIdentity& on_disk);
  void sleep_poll_() const;

  Config cfg_;
  EventSink& sink_;
  CheckpointStore store_;
  FileCatalog catalog_;
  EventRouter router_;
  std::string config_hash_;

  CheckpointState state_;
  std::optional<MetricsWindow> metrics_;

  Clock::time_point next_checkpoint_{};
  Clock::time_point next_metrics_{};
  const std::atomic<bool>* stop_flag_{nullptr};
  bool started_{false};
};

}  // namespace fgt
