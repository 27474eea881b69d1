// File: tests/rotated_file_reader_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fgt/adapters/rotated/rotated_file_reader.hpp"
#include "test_support.hpp"

namespace fgt {
namespace {

std::vector<SourceLine> read_all(RotatedFileReader& reader, Status* final_status) {
  std::vector<SourceLine> out;
  SourceLine line;
  while (true) {
    const Status st = reader.next(&line);
    if (!st.ok()) {
      *final_status = st;
      return out;
    }
    out.push_back(line);
  }
}

}  // namespace

TEST(RotatedFileReaderTest, PlainFileReportsLineStartOffsets) {
  testutil::TempDir tmp;
  const std::string p = tmp.file("fortigate.log-20240101-000000");
  testutil::write_file(p, "a\nbb\n\nccc");

  RotatedFileReaderConfig cfg;
  cfg.path = p;
  cfg.read_chunk_bytes = 2;  // force lines to straddle chunks
  RotatedFileReader reader(cfg);
  ASSERT_TRUE(reader.open().ok());
  EXPECT_FALSE(reader.compressed());

  Status last;
  const auto lines = read_all(reader, &last);
  EXPECT_TRUE(last.is_eof());

  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].text, "a\n");
  EXPECT_EQ(lines[0].pos.offset, 0u);
  EXPECT_EQ(lines[1].text, "bb\n");
  EXPECT_EQ(lines[1].pos.offset, 2u);
  EXPECT_EQ(lines[2].text, "\n");
  EXPECT_EQ(lines[2].pos.offset, 5u);
  EXPECT_EQ(lines[3].text, "ccc");  // unterminated tail
  EXPECT_EQ(lines[3].pos.offset, 6u);

  EXPECT_EQ(lines[0].pos.path, p);
  EXPECT_EQ(lines[0].pos.inode, reader.identity().inode);
  EXPECT_EQ(lines[0].pos.size, 9u);
}

TEST(RotatedFileReaderTest, GzipFileHasNoOffsets) {
  testutil::TempDir tmp;
  const std::string p = tmp.file("fortigate.log-20240101-000000.gz");
  testutil::write_gzip(p, "first\nsecond\n");

  RotatedFileReader reader(RotatedFileReaderConfig{p, 4});
  ASSERT_TRUE(reader.open().ok());
  EXPECT_TRUE(reader.compressed());

  Status last;
  const auto lines = read_all(reader, &last);
  EXPECT_TRUE(last.is_eof());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].text, "first\n");
  EXPECT_EQ(lines[1].text, "second\n");
  EXPECT_FALSE(lines[0].pos.offset.has_value());
  EXPECT_FALSE(lines[1].pos.offset.has_value());
}

TEST(RotatedFileReaderTest, InvalidUtf8IsReplaced) {
  testutil::TempDir tmp;
  const std::string p = tmp.file("r");
  testutil::write_file(p, "ok \xff end\n");

  RotatedFileReader reader(RotatedFileReaderConfig{p, 8192});
  ASSERT_TRUE(reader.open().ok());
  SourceLine line;
  ASSERT_TRUE(reader.next(&line).ok());
  EXPECT_EQ(line.text, "ok \xEF\xBF\xBD end\n");
  EXPECT_EQ(line.pos.offset, 0u);
}

TEST(RotatedFileReaderTest, CorruptGzipIsAnError) {
  testutil::TempDir tmp;
  const std::string p = tmp.file("fortigate.log-20240101-000000.gz");
  // Valid gzip header, then a deflate block with a reserved block type.
  std::string data = {'\x1f', '\x8b', '\x08', '\x00', '\x00', '\x00', '\x00', '\x00', '\x00', '\x03'};
  data.append(32, '\xff');
  testutil::write_file(p, data);

  RotatedFileReader reader(RotatedFileReaderConfig{p, 8192});
  ASSERT_TRUE(reader.open().ok());

  Status last;
  (void)read_all(reader, &last);
  EXPECT_FALSE(last.ok());
  EXPECT_FALSE(last.is_eof());
}

TEST(RotatedFileReaderTest, MissingFileIsNotFound) {
  RotatedFileReader reader(RotatedFileReaderConfig{"/nonexistent/fgt.log-20240101-000000", 8192});
  EXPECT_TRUE(reader.open().is_not_found());
}

}  // namespace fgt
