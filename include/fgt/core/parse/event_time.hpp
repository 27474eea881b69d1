// File: include/fgt/core/parse/event_time.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "fgt/core/parse/kv_parser.hpp"

namespace fgt {

// Envelope fields used when the body carries no usable date/time.
struct EnvelopeTime {
  int month = 0;          // 1..12
  int day = 0;            // as written, validated against the calendar here
  std::string_view hms;   // "HH:MM:SS"
};

// Resolves the event timestamp:
//  1. `date` (YYYY-MM-DD) + `time` (HH:MM:SS) keys, if both present and valid;
//  2. else contextual_year + envelope month/day/time.
// A `tz` key of the form [+-]HHMM becomes a fixed offset ("+05:30"); otherwise
// the result is offset-naive. Returns nullopt when neither path yields a valid
// calendar date/time.
std::optional<std::string> resolve_event_ts(const KvMap& kv, int contextual_year,
                                            const EnvelopeTime& fallback);

}  // namespace fgt
