// File: src/core/parse/event_time.cpp
#include "fgt/core/parse/event_time.hpp"

#include <cstdio>

namespace fgt {
namespace {

struct Civil {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

// Fixed UTC offset parsed from `tz`.
struct TzOffset {
  bool present = false;
  bool valid = true;
  int total_minutes = 0;  // signed
};

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool read_digits(std::string_view s, std::size_t pos, std::size_t n, int* out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (!is_digit(s[i])) return false;
    v = v * 10 + (s[i] - '0');
  }
  *out = v;
  return true;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap(y)) return 29;
  return kDays[m - 1];
}

bool valid(const Civil& c) {
  if (c.year < 1 || c.year > 9999) return false;
  if (c.month < 1 || c.month > 12) return false;
  if (c.day < 1 || c.day > days_in_month(c.year, c.month)) return false;
  return c.hour < 24 && c.minute < 60 && c.second < 60;
}

// YYYY-MM-DD
bool parse_date(std::string_view s, Civil* c) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
  return read_digits(s, 0, 4, &c->year) && read_digits(s, 5, 2, &c->month) &&
         read_digits(s, 8, 2, &c->day);
}

// HH:MM:SS
bool parse_hms(std::string_view s, Civil* c) {
  if (s.size() != 8 || s[2] != ':' || s[5] != ':') return false;
  return read_digits(s, 0, 2, &c->hour) && read_digits(s, 3, 2, &c->minute) &&
         read_digits(s, 6, 2, &c->second);
}

std::string_view trim_tz(std::string_view s) {
  const auto ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; };
  while (!s.empty() && ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && ws(s.back())) s.remove_suffix(1);
  while (!s.empty() && s.front() == '"') s.remove_prefix(1);
  while (!s.empty() && s.back() == '"') s.remove_suffix(1);
  return s;
}

TzOffset parse_tz(const KvMap& kv) {
  TzOffset tz;
  const auto it = kv.find("tz");
  if (it == kv.end() || it->second.empty()) return tz;

  const std::string_view s = trim_tz(it->second);
  int hh = 0;
  int mm = 0;
  if (s.size() != 5 || (s[0] != '+' && s[0] != '-') || !read_digits(s, 1, 2, &hh) ||
      !read_digits(s, 3, 2, &mm)) {
    return tz;  // unrecognized: offset-naive
  }

  tz.present = true;
  const int total = hh * 60 + mm;
  if (total >= 24 * 60) {
    tz.valid = false;
    return tz;
  }
  tz.total_minutes = (s[0] == '-') ? -total : total;
  return tz;
}

std::optional<std::string> format(const Civil& c, const TzOffset& tz) {
  if (!valid(c) || !tz.valid) return std::nullopt;

  char buf[40];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", c.year, c.month,
                        c.day, c.hour, c.minute, c.second);
  std::string out(buf, static_cast<std::size_t>(n));

  if (tz.present) {
    const int abs_min = tz.total_minutes < 0 ? -tz.total_minutes : tz.total_minutes;
    n = std::snprintf(buf, sizeof(buf), "%c%02d:%02d", tz.total_minutes < 0 ? '-' : '+',
                      abs_min / 60, abs_min % 60);
    out.append(buf, static_cast<std::size_t>(n));
  }
  return out;
}

}  // namespace

std::optional<std::string> resolve_event_ts(const KvMap& kv, int contextual_year,
                                            const EnvelopeTime& fallback) {
  const TzOffset tz = parse_tz(kv);

  const auto d = kv.find("date");
  const auto t = kv.find("time");
  if (d != kv.end() && t != kv.end() && !d->second.empty() && !t->second.empty()) {
    Civil c;
    if (parse_date(d->second, &c) && parse_hms(t->second, &c)) {
      auto ts = format(c, tz);
      if (ts) return ts;
    }
  }

  Civil c;
  c.year = contextual_year;
  c.month = fallback.month;
  c.day = fallback.day;
  if (!parse_hms(fallback.hms, &c)) return std::nullopt;
  return format(c, tz);
}

}  // namespace fgt
