// File: include/fgt/core/events/record_codec.hpp
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "fgt/core/types.hpp"

namespace fgt {

// Field order is part of the output contract; ordered_json keeps insertion order.
using RecordJson = nlohmann::ordered_json;

RecordJson event_to_json(const FirewallEvent& e);
RecordJson dlq_to_json(const DlqRecord& d);
RecordJson metrics_to_json(const MetricsRecord& m);
RecordJson counters_to_json(const Counters& c);
RecordJson source_to_json(const SourceRef& s);

// One compact line, no trailing newline. Invalid UTF-8 is replaced, never thrown.
std::string to_json_line(const RecordJson& j);

}  // namespace fgt
