// File: src/core/model/metrics_window.cpp
#include "fgt/core/model/metrics_window.hpp"

#include <utility>

#include "fgt/core/util/text.hpp"

namespace fgt {
namespace {

std::uint64_t sub(std::uint64_t a, std::uint64_t b) { return a >= b ? a - b : 0; }

}  // namespace

Counters counters_delta(const Counters& a, const Counters& b) {
  Counters d;
  d.lines_in_total = sub(a.lines_in_total, b.lines_in_total);
  d.bytes_in_total = sub(a.bytes_in_total, b.bytes_in_total);
  d.events_out_total = sub(a.events_out_total, b.events_out_total);
  d.dlq_out_total = sub(a.dlq_out_total, b.dlq_out_total);
  d.parse_fail_total = sub(a.parse_fail_total, b.parse_fail_total);
  d.write_fail_total = sub(a.write_fail_total, b.write_fail_total);
  d.checkpoint_fail_total = sub(a.checkpoint_fail_total, b.checkpoint_fail_total);
  return d;
}

MetricsWindow::MetricsWindow(std::string config_hash, const Counters& baseline,
                             Clock::time_point start)
    : config_hash_(std::move(config_hash)), prev_(baseline), prev_t_(start) {}

MetricsRecord MetricsWindow::build(const CheckpointState& state, Clock::time_point now) {
  MetricsRecord m;
  m.ts = iso8601_utc_now();
  m.window_s = std::chrono::duration<double>(now - prev_t_).count();
  m.totals = state.counters;
  m.deltas = counters_delta(state.counters, prev_);

  if (m.window_s > 0.0) {
    m.lines_per_s = static_cast<double>(m.deltas.lines_in_total) / m.window_s;
    m.events_per_s = static_cast<double>(m.deltas.events_out_total) / m.window_s;
  }

  m.active = state.active;
  m.completed_files = state.completed.size();
  m.checkpoint_updated_at = state.updated_at;
  m.config_hash = config_hash_;

  prev_ = state.counters;
  prev_t_ = now;
  return m;
}

}  // namespace fgt
