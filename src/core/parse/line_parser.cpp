// File: src/core/parse/line_parser.cpp
#include "fgt/core/parse/line_parser.hpp"

#include <exception>
#include <limits>
#include <utility>

#include "fgt/core/parse/event_time.hpp"
#include "fgt/core/parse/kv_parser.hpp"
#include "fgt/core/util/content_hash.hpp"

namespace fgt {
namespace {

constexpr int kMaxControlChars = 5;

constexpr std::string_view kMonths[12] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_lower(char c) { return c >= 'a' && c <= 'z'; }

// Consumes one or more whitespace chars; false if there are none at `i`.
bool skip_ws(std::string_view s, std::size_t& i) {
  const std::size_t start = i;
  while (i < s.size() && is_space(s[i])) ++i;
  return i > start;
}

std::string_view strip_trailing_newlines(std::string_view s) {
  while (!s.empty() && s.back() == '\n') s.remove_suffix(1);
  return s;
}

std::optional<std::string> opt_str(const KvMap& kv, const char* key) {
  const auto it = kv.find(key);
  if (it == kv.end()) return std::nullopt;
  return it->second;
}

std::optional<std::int64_t> opt_int(const KvMap& kv, const char* key) {
  const auto it = kv.find(key);
  if (it == kv.end()) return std::nullopt;
  return parse_int_field(it->second);
}

DlqRecord make_dlq(DlqReason reason, std::string_view raw_line) {
  DlqRecord d;
  d.reason = reason;
  d.raw = std::string(raw_line);
  return d;
}

FirewallEvent assemble(std::string_view raw_line, const SyslogEnvelope& env, const KvMap& kv,
                       std::optional<std::string> event_ts) {
  FirewallEvent e;
  e.event_id = stable_event_id(raw_line);
  e.host = std::string(env.host);
  e.event_ts = std::move(event_ts);

  e.type = opt_str(kv, "type");
  e.subtype = opt_str(kv, "subtype");
  e.level = opt_str(kv, "level");
  e.devname = opt_str(kv, "devname");
  e.devid = opt_str(kv, "devid");
  e.vd = opt_str(kv, "vd");
  e.action = opt_str(kv, "action");
  e.policyid = opt_int(kv, "policyid");
  e.proto = opt_int(kv, "proto");
  e.service = opt_str(kv, "service");

  e.srcip = opt_str(kv, "srcip");
  e.srcport = opt_int(kv, "srcport");
  e.srcintf = opt_str(kv, "srcintf");
  e.srcintfrole = opt_str(kv, "srcintfrole");
  e.dstip = opt_str(kv, "dstip");
  e.dstport = opt_int(kv, "dstport");
  e.dstintf = opt_str(kv, "dstintf");
  e.dstintfrole = opt_str(kv, "dstintfrole");

  e.sentbyte = opt_int(kv, "sentbyte");
  e.rcvdbyte = opt_int(kv, "rcvdbyte");
  e.sentpkt = opt_int(kv, "sentpkt");
  e.rcvdpkt = opt_int(kv, "rcvdpkt");

  e.raw = std::string(raw_line);

  const bool core_missing = !e.type || !e.subtype || !e.action;
  e.parse_status = core_missing ? ParseStatus::kPartial : ParseStatus::kOk;
  return e;
}

}  // namespace

int month_number(std::string_view abbrev) {
  for (int i = 0; i < 12; ++i) {
    if (kMonths[i] == abbrev) return i + 1;
  }
  return 0;
}

bool has_binary_garbage(std::string_view line) {
  int bad = 0;
  for (const char ch : line) {
    const auto c = static_cast<unsigned char>(ch);
    if (c == 0) return true;
    if (c < 9 || (c >= 11 && c < 32)) {
      if (++bad > kMaxControlChars) return true;
    }
  }
  return false;
}

std::optional<std::int64_t> parse_int_field(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  bool neg = false;
  if (s.front() == '+' || s.front() == '-') {
    neg = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s.empty()) return std::nullopt;

  // Accumulate as negative so INT64_MIN fits.
  constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
  std::int64_t v = 0;
  for (const char c : s) {
    if (!is_digit(c)) return std::nullopt;
    const int d = c - '0';
    if (v < (kMin + d) / 10) return std::nullopt;
    v = v * 10 - d;
  }
  if (!neg) {
    if (v == kMin) return std::nullopt;
    v = -v;
  }
  return v;
}

bool parse_syslog_envelope(std::string_view line, SyslogEnvelope* out) {
  std::size_t i = 0;
  const std::size_t n = line.size();

  // Month: [A-Z][a-z]{2}
  if (n < 3 || !is_upper(line[0]) || !is_lower(line[1]) || !is_lower(line[2])) return false;
  out->month = line.substr(0, 3);
  i = 3;
  if (!skip_ws(line, i)) return false;

  // Day: 1-2 digits
  const std::size_t day_start = i;
  while (i < n && i - day_start < 2 && is_digit(line[i])) ++i;
  if (i == day_start) return false;
  int day = 0;
  for (std::size_t k = day_start; k < i; ++k) day = day * 10 + (line[k] - '0');
  out->day = day;
  if (!skip_ws(line, i)) return false;

  // Time: HH:MM:SS
  if (i + 8 > n) return false;
  const std::string_view hms = line.substr(i, 8);
  if (!is_digit(hms[0]) || !is_digit(hms[1]) || hms[2] != ':' || !is_digit(hms[3]) ||
      !is_digit(hms[4]) || hms[5] != ':' || !is_digit(hms[6]) || !is_digit(hms[7])) {
    return false;
  }
  out->hms = hms;
  i += 8;
  if (!skip_ws(line, i)) return false;

  // Host: one non-whitespace token, then whitespace.
  const std::size_t host_start = i;
  while (i < n && !is_space(line[i])) ++i;
  if (i == host_start) return false;
  out->host = line.substr(host_start, i - host_start);
  if (!skip_ws(line, i)) return false;

  out->body = line.substr(i);
  return true;
}

ParseOutcome parse_line(std::string_view raw_line, int contextual_year) {
  const std::string_view line = strip_trailing_newlines(raw_line);
  if (line.empty()) return make_dlq(DlqReason::kEmptyLine, raw_line);

  if (has_binary_garbage(line)) return make_dlq(DlqReason::kNonTextOrBinary, raw_line);

  SyslogEnvelope env;
  if (!parse_syslog_envelope(line, &env)) {
    return make_dlq(DlqReason::kSyslogHeaderParseFail, raw_line);
  }

  const int month = month_number(env.month);
  if (month == 0) return make_dlq(DlqReason::kInvalidMonth, raw_line);

  KvMap kv;
  try {
    kv = parse_kv(env.body);
  } catch (const std::exception&) {
    return make_dlq(DlqReason::kKvParseException, raw_line);
  }

  auto event_ts = resolve_event_ts(kv, contextual_year, EnvelopeTime{month, env.day, env.hms});
  return assemble(raw_line, env, kv, std::move(event_ts));
}

}  // namespace fgt
