// File: include/fgt/core/events/event_sink.hpp
#pragma once

#include <string>

#include "fgt/core/status.hpp"
#include "fgt/core/types.hpp"

namespace fgt {

// Where routed records go. Keep output stable and boring; evolve by adding
// fields (not breaking existing ones).
//
// Each emit_* call is all-or-nothing for its one record: a non-OK status means
// the record was not (fully) persisted.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open() = 0;
  virtual Status emit_event(const FirewallEvent& e) = 0;
  virtual Status emit_dlq(const DlqRecord& d) = 0;
  virtual Status emit_metrics(const MetricsRecord& m) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace fgt
