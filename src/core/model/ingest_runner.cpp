// File: src/core/model/ingest_runner.cpp
#include "fgt/core/model/ingest_runner.hpp"

#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "fgt/adapters/rotated/rotated_file_reader.hpp"
#include "fgt/adapters/tail/active_tailer.hpp"
#include "fgt/core/util/content_hash.hpp"

namespace fgt {

IngestRunner::IngestRunner(Config cfg, EventSink& sink)
    : cfg_(std::move(cfg)),
      sink_(sink),
      store_(cfg_.checkpoint_path(), cfg_.paths.active_log, cfg_.checkpoint.completed_cap),
      catalog_(cfg_.rotated_dir(), cfg_.rotated_basename()),
      router_(sink),
      config_hash_(compute_config_hash(cfg_)) {}

Status IngestRunner::start() {
  const std::filesystem::path ckpt_dir = std::filesystem::path(store_.path()).parent_path();
  if (!ckpt_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(ckpt_dir, ec);
    if (ec) return Status::io_error("failed creating '" + ckpt_dir.string() + "': " + ec.message());
  }

  auto st_r = store_.load();
  if (!st_r.ok()) return st_r.status();
  state_ = st_r.take_value();

  FGT_RETURN_IF_ERROR(sink_.open());

  const auto now = Clock::now();
  metrics_.emplace(config_hash_, state_.counters, now);
  next_checkpoint_ = now + std::chrono::milliseconds(cfg_.timing.checkpoint_interval_ms);
  next_metrics_ = now + std::chrono::milliseconds(cfg_.timing.metrics_interval_ms);
  started_ = true;

  spdlog::info("fgt_ingest starting: active={} rotated_dir={} output_dir={} checkpoint={} config_hash={}",
               cfg_.paths.active_log, catalog_.dir(), cfg_.paths.output_dir, store_.path(),
               config_hash_);
  spdlog::info("resume: inode={} offset={} completed={}",
               state_.active.inode ? std::to_string(*state_.active.inode) : std::string("none"),
               state_.active.offset, state_.completed.size());
  return Status::ok_status();
}

void IngestRunner::sleep_poll_() const {
  std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.timing.poll_interval_ms));
}

void IngestRunner::drain_rotated() {
  auto list_r = catalog_.list_rotated_files();
  if (!list_r.ok()) {
    spdlog::warn("rotated: listing {} failed: {}", catalog_.dir(), list_r.status().message());
    return;
  }

  for (const std::string& path : *list_r) {
    if (stop_flag_ && stop_flag_->load()) return;

    auto id_r = stat_file(path);
    if (!id_r.ok()) {
      if (!id_r.status().is_not_found()) {
        spdlog::warn("rotated: stat {} failed: {}", path, id_r.status().message());
      }
      continue;  // vanished between listing and stat
    }
    const FileIdentity id = id_r.take_value();
    if (store_.is_completed(state_, id)) continue;

    RotatedFileReaderConfig rc;
    rc.path = path;
    rc.read_chunk_bytes = cfg_.tail.read_chunk_bytes;
    RotatedFileReader reader(rc);

    const Status st_open = reader.open();
    if (!st_open.ok()) {
      if (!st_open.is_not_found()) {
        spdlog::error("rotated: open {} failed: {}", path, st_open.message());
      }
      continue;
    }

    spdlog::info("rotated: start {} (size={} gz={})", path, id.size, reader.compressed());

    const std::uint64_t lines_before = state_.counters.lines_in_total;
    bool failed = false;
    SourceLine line;
    while (true) {
      const Status st = reader.next(&line);
      if (st.is_eof()) break;
      if (!st.ok()) {
        spdlog::error("rotated: read {} failed, will retry: {}", path, st.message());
        failed = true;
        break;
      }
      router_.ingest_line(state_, line);
    }
    reader.close();
    if (failed) continue;

    store_.mark_completed(state_, id);
    spdlog::info("rotated: done {} ({} lines)", path, state_.counters.lines_in_total - lines_before);

    tick_timers();
  }
}

void IngestRunner::sync_active_pointer_(const FileIdentity& on_disk) {
  ActivePointer& a = state_.active;
  a.path = cfg_.paths.active_log;

  if (!a.inode || *a.inode != on_disk.inode) {
    if (a.inode) {
      spdlog::info("active: rotation detected (inode {} -> {}), offset reset", *a.inode, on_disk.inode);
    }
    a.inode = on_disk.inode;
    a.offset = 0;
    return;
  }
  if (on_disk.size < a.offset) {
    spdlog::info("active: truncated in place (size {} < offset {}), offset reset", on_disk.size,
                 a.offset);
    a.offset = 0;
  }
}

void IngestRunner::tail_slice() {
  const std::string& path = cfg_.paths.active_log;

  auto id_r = stat_file(path);
  if (!id_r.ok()) {
    if (!id_r.status().is_not_found()) {
      spdlog::warn("active: stat {} failed: {}", path, id_r.status().message());
    }
    sleep_poll_();
    return;
  }
  sync_active_pointer_(*id_r);

  ActiveTailerConfig tc;
  tc.path = path;
  tc.read_chunk_bytes = cfg_.tail.read_chunk_bytes;
  tc.poll_interval_ms = cfg_.timing.poll_interval_ms;
  ActiveTailer tailer(tc);

  const Status st_open = tailer.open(state_.active.offset);
  if (!st_open.ok()) {
    if (!st_open.is_not_found()) spdlog::warn("active: {}", st_open.message());
    sleep_poll_();
    return;
  }
  if (tailer.opened_inode() != *state_.active.inode) {
    return;  // replaced between stat and open; next slice resyncs
  }

  const auto deadline = Clock::now() + std::chrono::milliseconds(cfg_.timing.tail_slice_ms);
  tailer.set_deadline(deadline);

  SourceLine line;
  while (true) {
    const Status st = tailer.next(&line);
    if (st.is_deadline()) break;
    if (!st.ok()) {
      spdlog::warn("active: read failed: {}", st.message());
      break;
    }

    router_.ingest_line(state_, line);
    state_.active.offset = line.pos.offset.value_or(state_.active.offset);

    auto cur_r = stat_file(path);
    if (!cur_r.ok()) break;  // rotated away, not recreated yet
    if (cur_r->inode != *state_.active.inode) {
      sync_active_pointer_(*cur_r);
      break;
    }
    if (Clock::now() >= deadline) break;
  }
  tailer.close();
}

Status IngestRunner::save_checkpoint() {
  const Status st_flush = sink_.flush();
  if (!st_flush.ok()) spdlog::warn("sink: flush failed: {}", st_flush.message());

  const Status st = store_.save(state_);
  if (!st.ok()) {
    state_.counters.checkpoint_fail_total += 1;
    spdlog::warn("checkpoint: save failed (total {}): {}", state_.counters.checkpoint_fail_total,
                 st.message());
  }
  return st;
}

Status IngestRunner::emit_metrics() {
  if (!metrics_) return Status::invalid_argument("IngestRunner::emit_metrics called before start");
  const MetricsRecord m = metrics_->build(state_, Clock::now());
  const Status st = sink_.emit_metrics(m);
  if (!st.ok()) router_.note_write_failure(state_, st, "metrics");
  return st;
}

void IngestRunner::tick_timers() {
  const auto now = Clock::now();

  if (now >= next_checkpoint_) {
    (void)save_checkpoint();  // counted and logged inside
    next_checkpoint_ = now + std::chrono::milliseconds(cfg_.timing.checkpoint_interval_ms);
  }
  if (now >= next_metrics_) {
    (void)emit_metrics();
    next_metrics_ = now + std::chrono::milliseconds(cfg_.timing.metrics_interval_ms);
  }
}

void IngestRunner::run_once() {
  drain_rotated();
  if (stop_flag_ && stop_flag_->load()) return;
  tail_slice();
  tick_timers();
}

void IngestRunner::run(const std::atomic<bool>& stop) {
  stop_flag_ = &stop;
  while (!stop.load()) run_once();
  stop_flag_ = nullptr;
  spdlog::info("stop requested; writing final checkpoint");
}

Status IngestRunner::stop() {
  if (!started_) return Status::ok_status();
  const Status st = save_checkpoint();
  sink_.close();
  started_ = false;
  return st;
}

}  // namespace fgt
