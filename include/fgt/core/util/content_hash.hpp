// include/fgt/core/util/content_hash.hpp
#pragma once

#include <string>
#include <string_view>

#include "fgt/core/config.hpp"

namespace fgt {

// SHA-256 of the raw line bytes, truncated to 128 bits (32 lowercase hex chars).
// Identical bytes always give the same id, so downstream can dedup by content.
std::string stable_event_id(std::string_view raw_line);

// Full lowercase hex SHA-256 of `data`.
std::string sha256_hex(std::string_view data);

// Hash the full runtime config.
// Goal: if the paths or loop timings change, this hash should change.
std::string compute_config_hash(const Config& cfg);

}  // namespace fgt
