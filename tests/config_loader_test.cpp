// File: tests/config_loader_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "fgt/core/util/config_loader.hpp"
#include "fgt/core/util/content_hash.hpp"
#include "test_support.hpp"

namespace fgt {

TEST(ConfigLoaderTest, DefaultsAndDerivedPaths) {
  auto cfg_r = default_config();
  ASSERT_TRUE(cfg_r.ok());
  const Config& cfg = *cfg_r;

  EXPECT_EQ(cfg.paths.active_log, "/data/fortigate/fortigate.log");
  EXPECT_EQ(cfg.rotated_dir(), "/data/fortigate");
  EXPECT_EQ(cfg.rotated_basename(), "fortigate.log");
  EXPECT_EQ(cfg.checkpoint_path(), "/data/fortigate/parsed/checkpoint.json");
  EXPECT_EQ(cfg.metrics_path(), "/data/fortigate/parsed/metrics.jsonl");
  EXPECT_EQ(cfg.timing.tail_slice_ms, 2000);
  EXPECT_EQ(cfg.timing.poll_interval_ms, 200);
  EXPECT_EQ(cfg.timing.checkpoint_interval_ms, 2000);
  EXPECT_EQ(cfg.timing.metrics_interval_ms, 10000);
  EXPECT_EQ(cfg.tail.read_chunk_bytes, 8192u);
  EXPECT_EQ(cfg.checkpoint.completed_cap, 5000u);
  EXPECT_EQ(cfg.logging.level, "info");
}

TEST(ConfigLoaderTest, IncludesAreLayered) {
  testutil::TempDir tmp;
  testutil::write_file(tmp.file("base.yaml"),
                       "paths:\n"
                       "  active_log: /var/log/fw/fortigate.log\n"
                       "  output_dir: /var/lib/fgt\n"
                       "timing:\n"
                       "  tail_slice_s: 1.5\n"
                       "  poll_interval_ms: 50\n");
  testutil::write_file(tmp.file("site.yaml"),
                       "includes: [base.yaml]\n"
                       "paths:\n"
                       "  output_dir: /srv/fgt\n"
                       "checkpoint:\n"
                       "  completed_cap: 10\n"
                       "logging:\n"
                       "  level: DEBUG\n");

  auto cfg_r = load_config(tmp.file("site.yaml"));
  ASSERT_TRUE(cfg_r.ok()) << cfg_r.status().message();
  const Config& cfg = *cfg_r;

  EXPECT_EQ(cfg.paths.active_log, "/var/log/fw/fortigate.log");
  EXPECT_EQ(cfg.paths.output_dir, "/srv/fgt");
  EXPECT_EQ(cfg.checkpoint_path(), "/srv/fgt/checkpoint.json");
  EXPECT_EQ(cfg.timing.tail_slice_ms, 1500);
  EXPECT_EQ(cfg.timing.poll_interval_ms, 50);
  EXPECT_EQ(cfg.checkpoint.completed_cap, 10u);
  EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(ConfigLoaderTest, ValidationRejectsBadValues) {
  testutil::TempDir tmp;

  testutil::write_file(tmp.file("zero.yaml"), "timing:\n  checkpoint_interval_s: 0\n");
  auto r1 = load_config(tmp.file("zero.yaml"));
  ASSERT_FALSE(r1.ok());
  EXPECT_EQ(r1.status().code(), Status::Code::kInvalidArgument);

  testutil::write_file(tmp.file("cap.yaml"), "checkpoint:\n  completed_cap: 0\n");
  EXPECT_EQ(load_config(tmp.file("cap.yaml")).status().code(), Status::Code::kInvalidArgument);

  testutil::write_file(tmp.file("type.yaml"), "tail:\n  read_chunk_bytes: lots\n");
  EXPECT_EQ(load_config(tmp.file("type.yaml")).status().code(), Status::Code::kInvalidArgument);

  testutil::write_file(tmp.file("level.yaml"), "logging:\n  level: chatty\n");
  EXPECT_EQ(load_config(tmp.file("level.yaml")).status().code(), Status::Code::kInvalidArgument);
}

TEST(ConfigLoaderTest, MissingAndMalformedFiles) {
  testutil::TempDir tmp;
  EXPECT_TRUE(load_config(tmp.file("nope.yaml")).status().is_not_found());

  testutil::write_file(tmp.file("bad.yaml"), "paths: [unclosed\n");
  EXPECT_EQ(load_config(tmp.file("bad.yaml")).status().code(), Status::Code::kParseError);
}

TEST(ConfigLoaderTest, ConfigHashTracksIngestSettings) {
  Config a;
  Config b;
  EXPECT_EQ(compute_config_hash(a), compute_config_hash(b));
  EXPECT_EQ(compute_config_hash(a).size(), 16u);

  b.timing.tail_slice_ms = 500;
  EXPECT_NE(compute_config_hash(a), compute_config_hash(b));

  // Explicit default path hashes like the implied one.
  Config c;
  c.paths.checkpoint = "/data/fortigate/parsed/checkpoint.json";
  EXPECT_EQ(compute_config_hash(a), compute_config_hash(c));

  Config d;
  d.logging.level = "debug";
  EXPECT_EQ(compute_config_hash(a), compute_config_hash(d));
}

}  // namespace fgt
