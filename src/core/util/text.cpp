// src/core/util/text.cpp
#include "fgt/core/util/text.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace fgt {
namespace {

constexpr const char kReplacement[] = "\xEF\xBF\xBD";  // U+FFFD

bool in_range(unsigned char c, unsigned char lo, unsigned char hi) { return c >= lo && c <= hi; }

}  // namespace

std::string decode_utf8_lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());

  const std::size_t n = bytes.size();
  std::size_t i = 0;
  while (i < n) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
      ++i;
      continue;
    }

    std::size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (in_range(c, 0xC2, 0xDF)) {
      need = 1;
    } else if (in_range(c, 0xE0, 0xEF)) {
      need = 2;
      if (c == 0xE0) lo = 0xA0;
      if (c == 0xED) hi = 0x9F;  // no surrogates
    } else if (in_range(c, 0xF0, 0xF4)) {
      need = 3;
      if (c == 0xF0) lo = 0x90;
      if (c == 0xF4) hi = 0x8F;
    } else {
      out += kReplacement;
      ++i;
      continue;
    }

    // Consume the maximal valid prefix; one replacement for an incomplete one.
    std::size_t j = i + 1;
    std::size_t got = 0;
    while (got < need && j < n) {
      const auto cc = static_cast<unsigned char>(bytes[j]);
      const bool ok = (got == 0) ? in_range(cc, lo, hi) : in_range(cc, 0x80, 0xBF);
      if (!ok) break;
      ++j;
      ++got;
    }

    if (got == need) {
      out.append(bytes.data() + i, j - i);
    } else {
      out += kReplacement;
    }
    i = j;
  }
  return out;
}

std::int64_t wall_now_s() {
  using clock = std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::seconds>(clock::now().time_since_epoch()).count();
}

int local_year_now() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm.tm_year + 1900;
}

std::string iso8601_utc_now() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  const std::time_t secs = static_cast<std::time_t>(us / 1000000);
  const long frac = static_cast<long>(us % 1000000);

  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld+00:00",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                frac);
  return std::string(buf);
}

std::string local_hour_key(std::int64_t epoch_s) {
  const std::time_t secs = static_cast<std::time_t>(epoch_s);
  std::tm tm{};
  localtime_r(&secs, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y%m%d-%H", &tm);
  return std::string(buf);
}

}  // namespace fgt
