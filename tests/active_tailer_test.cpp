// File: tests/active_tailer_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "fgt/adapters/tail/active_tailer.hpp"
#include "test_support.hpp"

namespace fgt {

class ActiveTailerTest : public ::testing::Test {
 protected:
  ActiveTailer make_tailer() {
    ActiveTailerConfig cfg;
    cfg.path = path_;
    cfg.read_chunk_bytes = 4;
    cfg.poll_interval_ms = 10;
    return ActiveTailer(cfg);
  }

  void set_short_deadline(ActiveTailer& t) {
    t.set_deadline(ActiveTailer::Clock::now() + std::chrono::milliseconds(100));
  }

  testutil::TempDir tmp_;
  std::string path_ = tmp_.file("fortigate.log");
};

TEST_F(ActiveTailerTest, HoldsBackPartialLineUntilTerminated) {
  testutil::write_file(path_, "line1\npart");
  ActiveTailer tailer = make_tailer();
  ASSERT_TRUE(tailer.open(0).ok());

  SourceLine line;
  set_short_deadline(tailer);
  ASSERT_TRUE(tailer.next(&line).ok());
  EXPECT_EQ(line.text, "line1\n");
  EXPECT_EQ(line.pos.offset, 6u);
  EXPECT_EQ(line.pos.inode, tailer.opened_inode());

  set_short_deadline(tailer);
  EXPECT_TRUE(tailer.next(&line).is_deadline());
  EXPECT_EQ(tailer.offset(), 6u);

  testutil::append_file(path_, "ial\n");
  set_short_deadline(tailer);
  ASSERT_TRUE(tailer.next(&line).ok());
  EXPECT_EQ(line.text, "partial\n");
  EXPECT_EQ(line.pos.offset, 14u);
}

TEST_F(ActiveTailerTest, ResumesFromOffset) {
  testutil::write_file(path_, "aaa\nbbb\nccc\n");
  ActiveTailer tailer = make_tailer();
  ASSERT_TRUE(tailer.open(4).ok());

  SourceLine line;
  set_short_deadline(tailer);
  ASSERT_TRUE(tailer.next(&line).ok());
  EXPECT_EQ(line.text, "bbb\n");
  EXPECT_EQ(line.pos.offset, 8u);
}

TEST_F(ActiveTailerTest, IdleReturnsDeadlineExceeded) {
  testutil::write_file(path_, "");
  ActiveTailer tailer = make_tailer();
  ASSERT_TRUE(tailer.open(0).ok());

  const auto t0 = ActiveTailer::Clock::now();
  tailer.set_deadline(t0 + std::chrono::milliseconds(50));
  SourceLine line;
  const Status st = tailer.next(&line);
  const auto elapsed = ActiveTailer::Clock::now() - t0;

  EXPECT_TRUE(st.is_deadline());
  EXPECT_GE(elapsed, std::chrono::milliseconds(50));
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(ActiveTailerTest, PassedDeadlineStopsEvenWithLinesWaiting) {
  testutil::write_file(path_, "aaa\nbbb\nccc\n");
  ActiveTailer tailer = make_tailer();
  ASSERT_TRUE(tailer.open(0).ok());

  SourceLine line;
  set_short_deadline(tailer);
  ASSERT_TRUE(tailer.next(&line).ok());
  EXPECT_EQ(line.text, "aaa\n");

  tailer.set_deadline(ActiveTailer::Clock::now() - std::chrono::milliseconds(1));
  EXPECT_TRUE(tailer.next(&line).is_deadline());
  EXPECT_EQ(tailer.offset(), 4u);

  set_short_deadline(tailer);
  ASSERT_TRUE(tailer.next(&line).ok());
  EXPECT_EQ(line.text, "bbb\n");
  EXPECT_EQ(tailer.offset(), 8u);
}

TEST_F(ActiveTailerTest, MissingFileIsNotFound) {
  ActiveTailer tailer = make_tailer();
  EXPECT_TRUE(tailer.open(0).is_not_found());
  EXPECT_TRUE(tailer.current_identity().status().is_not_found());
}

}  // namespace fgt
