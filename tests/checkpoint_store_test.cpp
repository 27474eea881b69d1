// File: tests/checkpoint_store_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include <unistd.h>

#include "fgt/core/checkpoint/checkpoint_store.hpp"
#include "test_support.hpp"

namespace fgt {
namespace {

FileIdentity make_id(const std::string& path, std::uint64_t inode) {
  FileIdentity id;
  id.path = path;
  id.inode = inode;
  id.size = 100 + inode;
  id.mtime_s = 1700000000;
  return id;
}

}  // namespace

class CheckpointStoreTest : public ::testing::Test {
 protected:
  testutil::TempDir tmp_;
  std::string path_ = tmp_.file("checkpoint.json");
};

TEST_F(CheckpointStoreTest, MissingFileYieldsDefaults) {
  CheckpointStore store(path_, "/var/log/fortigate.log");
  auto st_r = store.load();
  ASSERT_TRUE(st_r.ok()) << st_r.status().message();

  const CheckpointState& st = *st_r;
  EXPECT_EQ(st.schema_version, kCheckpointSchemaVersion);
  EXPECT_EQ(st.active.path, "/var/log/fortigate.log");
  EXPECT_FALSE(st.active.inode.has_value());
  EXPECT_EQ(st.active.offset, 0u);
  EXPECT_TRUE(st.completed.empty());
  EXPECT_EQ(st.counters, Counters{});
}

TEST_F(CheckpointStoreTest, SaveLoadRoundTrip) {
  CheckpointStore store(path_, "/var/log/fortigate.log");
  CheckpointState st = store.default_state();
  st.active.inode = 4242;
  st.active.offset = 9876;
  st.active.last_event_ts_seen = "2024-01-15T10:30:45+05:30";
  st.counters.lines_in_total = 10;
  st.counters.bytes_in_total = 1000;
  st.counters.events_out_total = 8;
  st.counters.dlq_out_total = 2;
  st.counters.parse_fail_total = 2;
  store.mark_completed(st, make_id("/var/log/fortigate.log-20240101-000000.gz", 7));

  ASSERT_TRUE(store.save(st).ok());
  EXPECT_GT(st.updated_at, 0);
  EXPECT_FALSE(std::filesystem::exists(path_ + ".tmp." + std::to_string(::getpid())));

  auto loaded_r = store.load();
  ASSERT_TRUE(loaded_r.ok()) << loaded_r.status().message();
  const CheckpointState& loaded = *loaded_r;
  EXPECT_EQ(loaded.active, st.active);
  EXPECT_EQ(loaded.counters, st.counters);
  EXPECT_EQ(loaded.completed, st.completed);
  EXPECT_EQ(loaded.updated_at, st.updated_at);
}

TEST_F(CheckpointStoreTest, DocumentShape) {
  CheckpointStore store(path_, "/a.log");
  CheckpointState st = store.default_state();
  const std::string doc = checkpoint_to_json(st);
  EXPECT_EQ(doc.rfind("{\"schema_version\":1,\"active\":{\"path\":\"/a.log\",\"inode\":null,\"offset\":0,", 0), 0u)
      << doc;
  EXPECT_NE(doc.find("\"completed\":[]"), std::string::npos);
  EXPECT_NE(doc.find("\"checkpoint_fail_total\":0"), std::string::npos);
}

TEST_F(CheckpointStoreTest, CorruptDocumentIsRejected) {
  testutil::write_file(path_, "{\"schema_version\": 1, \"active\": ");
  CheckpointStore store(path_, "/a.log");
  auto st_r = store.load();
  ASSERT_FALSE(st_r.ok());
  EXPECT_EQ(st_r.status().code(), Status::Code::kCorruptData);

  testutil::write_file(path_, "[1,2,3]");
  EXPECT_EQ(store.load().status().code(), Status::Code::kCorruptData);
}

TEST_F(CheckpointStoreTest, MarkCompletedIsIdempotentForLookup) {
  CheckpointStore store(path_, "/a.log");
  CheckpointState st = store.default_state();
  const FileIdentity id = make_id("/a.log-20240101-000000", 1);

  EXPECT_FALSE(store.is_completed(st, id));
  store.mark_completed(st, id);
  store.mark_completed(st, id);
  EXPECT_TRUE(store.is_completed(st, id));

  // Same path, different generation: not completed.
  FileIdentity other = id;
  other.inode = 2;
  EXPECT_FALSE(store.is_completed(st, other));
  other = id;
  other.size += 1;
  EXPECT_FALSE(store.is_completed(st, other));
}

TEST_F(CheckpointStoreTest, LedgerKeepsMostRecentEntries) {
  CheckpointStore store(path_, "/a.log");
  CheckpointState st = store.default_state();
  for (std::uint64_t i = 0; i < 5001; ++i) store.mark_completed(st, make_id("/r", i));

  ASSERT_EQ(st.completed.size(), kDefaultCompletedCap);
  EXPECT_FALSE(store.is_completed(st, make_id("/r", 0)));
  EXPECT_TRUE(store.is_completed(st, make_id("/r", 1)));
  EXPECT_TRUE(store.is_completed(st, make_id("/r", 5000)));
  EXPECT_EQ(st.completed.front().identity.inode, 1u);
  EXPECT_EQ(st.completed.back().identity.inode, 5000u);
}

TEST_F(CheckpointStoreTest, CustomCap) {
  CheckpointStore store(path_, "/a.log", 3);
  CheckpointState st = store.default_state();
  for (std::uint64_t i = 0; i < 5; ++i) store.mark_completed(st, make_id("/r", i));
  ASSERT_EQ(st.completed.size(), 3u);
  EXPECT_EQ(st.completed.front().identity.inode, 2u);
}

TEST_F(CheckpointStoreTest, SaveIntoMissingDirectoryFails) {
  CheckpointStore store(tmp_.file("no/such/dir/checkpoint.json"), "/a.log");
  CheckpointState st = store.default_state();
  const Status s = store.save(st);
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.code(), Status::Code::kIoError);
}

TEST_F(CheckpointStoreTest, SaveReplacesPreviousDocument) {
  CheckpointStore store(path_, "/a.log");
  CheckpointState st = store.default_state();
  st.active.offset = 1;
  ASSERT_TRUE(store.save(st).ok());
  st.active.offset = 2;
  ASSERT_TRUE(store.save(st).ok());

  auto loaded = store.load();
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ(loaded->active.offset, 2u);
}

}  // namespace fgt
