// File: include/fgt/core/parse/line_parser.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "fgt/core/types.hpp"

namespace fgt {

// Exactly one of the two, never both, never neither.
using ParseOutcome = std::variant<FirewallEvent, DlqRecord>;

// `Mmm dd HH:MM:SS host body`
struct SyslogEnvelope {
  std::string_view month;
  int day = 0;
  std::string_view hms;
  std::string_view host;
  std::string_view body;
};

// Pure. `raw_line` is the line as read (a trailing '\n' is allowed and kept in
// the stored raw text). `contextual_year` completes envelope timestamps, which
// carry no year.
//
// Rules, first failure wins:
//   empty_line, non_text_or_binary, syslog_header_parse_fail, invalid_month,
//   kv_parse_exception.
ParseOutcome parse_line(std::string_view raw_line, int contextual_year);

// Grammar pieces, exposed for tests.
bool parse_syslog_envelope(std::string_view line, SyslogEnvelope* out);
int month_number(std::string_view abbrev);  // 0 if not Jan..Dec
bool has_binary_garbage(std::string_view line);
std::optional<std::int64_t> parse_int_field(std::string_view s);

}  // namespace fgt
