// src/core/types.cpp
#include "fgt/core/types.hpp"

namespace fgt {

const char* to_string(ParseStatus s) {
  switch (s) {
    case ParseStatus::kOk: return "ok";
    case ParseStatus::kPartial: return "partial";
  }
  return "ok";
}

const char* to_string(DlqReason r) {
  switch (r) {
    case DlqReason::kEmptyLine: return "empty_line";
    case DlqReason::kNonTextOrBinary: return "non_text_or_binary";
    case DlqReason::kSyslogHeaderParseFail: return "syslog_header_parse_fail";
    case DlqReason::kInvalidMonth: return "invalid_month";
    case DlqReason::kKvParseException: return "kv_parse_exception";
  }
  return "parse_fail";
}

}  // namespace fgt
