// File: tests/event_router_test.cpp
#include <gtest/gtest.h>

#include <cstddef>
#include <iterator>
#include <string>

#include "fgt/core/model/event_router.hpp"
#include "test_support.hpp"

namespace fgt {
namespace {

SourceLine make_line(const std::string& text, std::uint64_t offset) {
  SourceLine l;
  l.text = text;
  l.pos.path = "/data/fortigate/fortigate.log";
  l.pos.inode = 99;
  l.pos.offset = offset;
  return l;
}

}  // namespace

TEST(EventRouterTest, RoutesEventAndUpdatesCounters) {
  testutil::MemorySink sink;
  EventRouter router(sink);
  CheckpointState st;

  const std::string raw = testutil::sample_traffic_line();
  router.ingest_line(st, make_line(raw, 100), 2024);

  EXPECT_EQ(st.counters.lines_in_total, 1u);
  EXPECT_EQ(st.counters.bytes_in_total, raw.size());
  EXPECT_EQ(st.counters.events_out_total, 1u);
  EXPECT_EQ(st.counters.dlq_out_total, 0u);
  EXPECT_EQ(st.active.last_event_ts_seen, "2024-01-15T10:30:45+05:30");

  ASSERT_EQ(sink.events.size(), 1u);
  const FirewallEvent& e = sink.events[0];
  EXPECT_EQ(e.source.path, "/data/fortigate/fortigate.log");
  EXPECT_EQ(e.source.inode, 99u);
  EXPECT_EQ(e.source.offset, 100u);
  // YYYY-MM-DDTHH:MM:SS.ffffff+00:00
  ASSERT_EQ(e.ingest_ts.size(), 32u);
  EXPECT_EQ(e.ingest_ts.substr(26), "+00:00");
  EXPECT_EQ(e.ingest_ts[19], '.');
}

TEST(EventRouterTest, RoutesDlq) {
  testutil::MemorySink sink;
  EventRouter router(sink);
  CheckpointState st;

  router.ingest_line(st, make_line("garbage\n", 0), 2024);

  EXPECT_EQ(st.counters.lines_in_total, 1u);
  EXPECT_EQ(st.counters.events_out_total, 0u);
  EXPECT_EQ(st.counters.dlq_out_total, 1u);
  EXPECT_EQ(st.counters.parse_fail_total, 1u);
  ASSERT_EQ(sink.dlq.size(), 1u);
  EXPECT_EQ(sink.dlq[0].reason, DlqReason::kSyslogHeaderParseFail);
  EXPECT_EQ(sink.dlq[0].raw, "garbage\n");
  EXPECT_FALSE(sink.dlq[0].ingest_ts.empty());
}

TEST(EventRouterTest, EventWithoutTimestampKeepsLastSeen) {
  testutil::MemorySink sink;
  EventRouter router(sink);
  CheckpointState st;
  st.active.last_event_ts_seen = "2024-01-01T00:00:00";

  // Feb 30 never resolves.
  router.ingest_line(st, make_line("Feb 30 00:00:00 fw type=x\n", 0), 2024);
  ASSERT_EQ(sink.events.size(), 1u);
  EXPECT_FALSE(sink.events[0].event_ts.has_value());
  EXPECT_EQ(st.active.last_event_ts_seen, "2024-01-01T00:00:00");
}

TEST(EventRouterTest, FailingSinkCountsAndDrops) {
  testutil::MemorySink sink;
  sink.fail_events = true;
  sink.fail_dlq = true;
  EventRouter router(sink);
  CheckpointState st;

  router.ingest_line(st, make_line(testutil::sample_traffic_line(), 0), 2024);
  router.ingest_line(st, make_line("garbage\n", 10), 2024);

  EXPECT_EQ(st.counters.lines_in_total, 2u);
  EXPECT_EQ(st.counters.events_out_total, 0u);
  EXPECT_EQ(st.counters.dlq_out_total, 0u);
  EXPECT_EQ(st.counters.parse_fail_total, 0u);
  EXPECT_EQ(st.counters.write_fail_total, 2u);
  EXPECT_FALSE(st.active.last_event_ts_seen.has_value());
  EXPECT_TRUE(sink.events.empty());
  EXPECT_TRUE(sink.dlq.empty());
}

TEST(EventRouterTest, EveryLineYieldsExactlyOneRecord) {
  testutil::MemorySink sink;
  EventRouter router(sink);
  CheckpointState st;

  const char* lines[] = {"\n", "x\n", "Jan 1 00:00:00 h a=1\n", "Foo 1 00:00:00 h a=1\n",
                         "Jan 1 00:00:00 h\n", "Dec 31 23:59:59 h type=t subtype=s action=a"};
  for (const char* l : lines) router.ingest_line(st, make_line(l, 0), 2024);

  EXPECT_EQ(sink.events.size() + sink.dlq.size(), std::size(lines));
  EXPECT_EQ(st.counters.lines_in_total, std::size(lines));
  EXPECT_EQ(st.counters.events_out_total + st.counters.dlq_out_total, std::size(lines));
}

}  // namespace fgt
