// src/core/util/content_hash.cpp
#include "fgt/core/util/content_hash.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace fgt {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }
};

constexpr char kHex[] = "0123456789abcdef";

std::string to_hex(std::uint64_t v) {
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

std::string to_hex(const unsigned char* p, std::size_t n) {
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(kHex[p[i] >> 4]);
    out.push_back(kHex[p[i] & 0xF]);
  }
  return out;
}

std::array<unsigned char, 32> sha256(std::string_view data) {
  std::array<unsigned char, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
      len != out.size()) {
    // Only fails on allocation failure inside libcrypto.
    throw std::runtime_error("EVP_Digest(EVP_sha256) failed");
  }
  return out;
}

}  // namespace

std::string sha256_hex(std::string_view data) {
  const auto digest = sha256(data);
  return to_hex(digest.data(), digest.size());
}

std::string stable_event_id(std::string_view raw_line) {
  const auto digest = sha256(raw_line);
  return to_hex(digest.data(), 16);
}

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Paths (resolved, so an explicit default and an implied one hash the same).
  h.add_string(cfg.paths.active_log);
  h.add_string(cfg.rotated_dir());
  h.add_string(cfg.paths.output_dir);
  h.add_string(cfg.checkpoint_path());
  h.add_string(cfg.metrics_path());

  // Timing.
  h.add_i64(cfg.timing.tail_slice_ms);
  h.add_i64(cfg.timing.poll_interval_ms);
  h.add_i64(cfg.timing.checkpoint_interval_ms);
  h.add_i64(cfg.timing.metrics_interval_ms);

  // Tail / checkpoint.
  h.add_u64(static_cast<std::uint64_t>(cfg.tail.read_chunk_bytes));
  h.add_u64(static_cast<std::uint64_t>(cfg.checkpoint.completed_cap));

  // Logging level does not change what gets ingested; leave it out.

  return to_hex(h.h);
}

}  // namespace fgt
