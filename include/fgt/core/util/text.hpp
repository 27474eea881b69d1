// include/fgt/core/util/text.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fgt {

// Best-effort UTF-8 decode: every invalid or truncated sequence becomes U+FFFD.
// Never fails; valid input comes back byte-identical.
std::string decode_utf8_lossy(std::string_view bytes);

// Wall clock helpers.
std::int64_t wall_now_s();
int local_year_now();

// "2026-10-17T12:34:56.123456+00:00"
std::string iso8601_utc_now();

// Local-time hour bucket, "YYYYMMDD-HH".
std::string local_hour_key(std::int64_t epoch_s);

}  // namespace fgt
