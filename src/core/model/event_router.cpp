// File: src/core/model/event_router.cpp
#include "fgt/core/model/event_router.hpp"

#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "fgt/core/util/text.hpp"

namespace fgt {
namespace {

constexpr std::uint64_t kWarnEvery = 1000;

}  // namespace

EventRouter::EventRouter(EventSink& sink) : sink_(sink) {}

SourceRef EventRouter::source_ref(const SourcePosition& pos) {
  SourceRef s;
  s.path = pos.path;
  s.inode = pos.inode;
  s.offset = pos.offset;
  return s;
}

void EventRouter::note_write_failure(CheckpointState& state, const Status& st, const char* what) {
  state.counters.write_fail_total += 1;
  const std::uint64_t n = ++failures_logged_;
  if (n == 1 || n % kWarnEvery == 0) {
    spdlog::warn("sink: {} append failed ({} failures so far): {}", what, n, st.message());
  }
}

void EventRouter::route_event(CheckpointState& state, FirewallEvent event,
                              const SourcePosition& pos) {
  event.ingest_ts = iso8601_utc_now();
  event.source = source_ref(pos);

  const Status st = sink_.emit_event(event);
  if (!st.ok()) {
    note_write_failure(state, st, "event");
    return;
  }
  state.counters.events_out_total += 1;
  if (event.event_ts) state.active.last_event_ts_seen = std::move(event.event_ts);
}

void EventRouter::route_dlq(CheckpointState& state, DlqRecord dlq, const SourcePosition& pos) {
  dlq.ingest_ts = iso8601_utc_now();
  dlq.source = source_ref(pos);

  const Status st = sink_.emit_dlq(dlq);
  if (!st.ok()) {
    note_write_failure(state, st, "dlq");
    return;
  }
  state.counters.dlq_out_total += 1;
  state.counters.parse_fail_total += 1;
}

void EventRouter::ingest_line(CheckpointState& state, const SourceLine& line) {
  ingest_line(state, line, local_year_now());
}

void EventRouter::ingest_line(CheckpointState& state, const SourceLine& line,
                              int contextual_year) {
  state.counters.lines_in_total += 1;
  state.counters.bytes_in_total += line.text.size();

  ParseOutcome out = parse_line(line.text, contextual_year);
  if (auto* ev = std::get_if<FirewallEvent>(&out)) {
    spdlog::debug("event {} from {}", ev->event_id, line.pos.path);
    route_event(state, std::move(*ev), line.pos);
  } else {
    auto& dlq = std::get<DlqRecord>(out);
    spdlog::debug("dlq {} from {}", to_string(dlq.reason), line.pos.path);
    route_dlq(state, std::move(dlq), line.pos);
  }
}

}  // namespace fgt
