// File: tests/metrics_window_test.cpp
#include <gtest/gtest.h>

#include <chrono>

#include "fgt/core/model/metrics_window.hpp"

namespace fgt {

TEST(MetricsWindowTest, FirstWindowIsRelativeToBaseline) {
  Counters baseline;
  baseline.lines_in_total = 100;
  baseline.events_out_total = 90;

  const auto t0 = MetricsWindow::Clock::now();
  MetricsWindow window("cfg123", baseline, t0);

  CheckpointState st;
  st.counters = baseline;
  st.counters.lines_in_total += 20;
  st.counters.events_out_total += 10;
  st.active.path = "/a.log";
  st.active.inode = 5;
  st.active.offset = 77;
  st.updated_at = 1700000000;
  st.completed.resize(3);

  const MetricsRecord m = window.build(st, t0 + std::chrono::seconds(10));
  EXPECT_DOUBLE_EQ(m.window_s, 10.0);
  EXPECT_EQ(m.totals.lines_in_total, 120u);
  EXPECT_EQ(m.deltas.lines_in_total, 20u);
  EXPECT_EQ(m.deltas.events_out_total, 10u);
  EXPECT_DOUBLE_EQ(m.lines_per_s, 2.0);
  EXPECT_DOUBLE_EQ(m.events_per_s, 1.0);
  EXPECT_EQ(m.active, st.active);
  EXPECT_EQ(m.completed_files, 3u);
  EXPECT_EQ(m.checkpoint_updated_at, 1700000000);
  EXPECT_EQ(m.config_hash, "cfg123");
  EXPECT_FALSE(m.ts.empty());
}

TEST(MetricsWindowTest, SubsequentWindowsUsePreviousSnapshot) {
  const auto t0 = MetricsWindow::Clock::now();
  MetricsWindow window("h", Counters{}, t0);

  CheckpointState st;
  st.counters.dlq_out_total = 4;
  (void)window.build(st, t0 + std::chrono::seconds(5));

  st.counters.dlq_out_total = 6;
  const MetricsRecord m = window.build(st, t0 + std::chrono::seconds(10));
  EXPECT_DOUBLE_EQ(m.window_s, 5.0);
  EXPECT_EQ(m.deltas.dlq_out_total, 2u);
  EXPECT_EQ(m.totals.dlq_out_total, 6u);
}

TEST(MetricsWindowTest, ZeroLengthWindowHasZeroRates) {
  const auto t0 = MetricsWindow::Clock::now();
  MetricsWindow window("h", Counters{}, t0);
  CheckpointState st;
  st.counters.lines_in_total = 3;
  const MetricsRecord m = window.build(st, t0);
  EXPECT_DOUBLE_EQ(m.lines_per_s, 0.0);
  EXPECT_EQ(m.deltas.lines_in_total, 3u);
}

}  // namespace fgt
