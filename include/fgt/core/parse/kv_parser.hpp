// File: include/fgt/core/parse/kv_parser.hpp
#pragma once

#include <map>
#include <string>
#include <string_view>

namespace fgt {

using KvMap = std::map<std::string, std::string>;

// Firewall key/value body: `key=value` or `key="value with spaces"`, separated
// by spaces. Inside quotes a backslash emits the following character verbatim.
//
// Total: never fails. A token without a bare `key=` prefix ends the scan and the
// rest of the body is dropped. A repeated key keeps its last value.
KvMap parse_kv(std::string_view body);

}  // namespace fgt
