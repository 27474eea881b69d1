// File: src/core/parse/kv_parser.cpp
#include "fgt/core/parse/kv_parser.hpp"

namespace fgt {

KvMap parse_kv(std::string_view body) {
  KvMap out;
  const std::size_t n = body.size();
  std::size_t i = 0;

  const auto skip_spaces = [&]() {
    while (i < n && body[i] == ' ') ++i;
  };

  while (i < n) {
    skip_spaces();
    if (i >= n) break;

    const std::size_t k_start = i;
    while (i < n && body[i] != '=' && body[i] != ' ') ++i;
    if (i == k_start || i >= n || body[i] != '=') break;
    std::string key(body.substr(k_start, i - k_start));
    ++i;  // '='

    std::string value;
    if (i < n && body[i] == '"') {
      ++i;
      while (i < n) {
        const char ch = body[i];
        if (ch == '\\' && i + 1 < n) {
          value.push_back(body[i + 1]);
          i += 2;
          continue;
        }
        if (ch == '"') {
          ++i;
          break;
        }
        value.push_back(ch);
        ++i;
      }
    } else {
      const std::size_t v_start = i;
      while (i < n && body[i] != ' ') ++i;
      value.assign(body.substr(v_start, i - v_start));
    }
    skip_spaces();

    out[std::move(key)] = std::move(value);
  }

  return out;
}

}  // namespace fgt
