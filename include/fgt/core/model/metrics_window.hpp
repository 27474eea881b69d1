// File: include/fgt/core/model/metrics_window.hpp
#pragma once

#include <chrono>
#include <string>

#include "fgt/core/types.hpp"

namespace fgt {

// Turns the running counters into one summary record per interval.
// Deltas and rates are relative to the previous build(), or to the baseline
// given at construction for the first window.
class MetricsWindow {
 public:
  using Clock = std::chrono::steady_clock;

  MetricsWindow(std::string config_hash, const Counters& baseline, Clock::time_point start);

  MetricsRecord build(const CheckpointState& state, Clock::time_point now);

 private:
  std::string config_hash_;
  Counters prev_;
  Clock::time_point prev_t_;
};

// Field-wise a - b (counters never go backwards within a process).
Counters counters_delta(const Counters& a, const Counters& b);

}  // namespace fgt
