// File: include/fgt/core/model/event_router.hpp
#pragma once

#include <cstdint>

#include "fgt/core/events/event_sink.hpp"
#include "fgt/core/parse/line_parser.hpp"
#include "fgt/core/types.hpp"

namespace fgt {

// Stamps ingest metadata on parser output, hands it to the sink and keeps the
// checkpoint counters in step. Sink failures are counted, logged (rate-limited)
// and swallowed here; they never reach the control loop.
class EventRouter {
 public:
  explicit EventRouter(EventSink& sink);

  // lines_in/bytes_in accounting, parse with the current local year, route.
  void ingest_line(CheckpointState& state, const SourceLine& line);

  // Same as ingest_line with an explicit year (tests pin it).
  void ingest_line(CheckpointState& state, const SourceLine& line, int contextual_year);

  void route_event(CheckpointState& state, FirewallEvent event, const SourcePosition& pos);
  void route_dlq(CheckpointState& state, DlqRecord dlq, const SourcePosition& pos);

  // Records a failed append that did not go through route_* (metrics).
  void note_write_failure(CheckpointState& state, const Status& st, const char* what);

 private:
  static SourceRef source_ref(const SourcePosition& pos);

  EventSink& sink_;
  std::uint64_t failures_logged_{0};
};

}  // namespace fgt
