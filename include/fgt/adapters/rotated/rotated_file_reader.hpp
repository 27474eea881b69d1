// File: include/fgt/adapters/rotated/rotated_file_reader.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include "fgt/core/io/line_source.hpp"

struct gzFile_s;  // zlib

namespace fgt {

struct RotatedFileReaderConfig {
  std::string path;
  std::size_t read_chunk_bytes{8192};
};

// Finite line stream over one rotated file, read start to finish.
// Paths ending in ".gz" are decompressed transparently; their offsets are
// reported as absent since a compressed byte position is useless for resume.
// Plain files report the exact byte offset at which each line starts.
class RotatedFileReader final : public ILineSource {
 public:
  explicit RotatedFileReader(RotatedFileReaderConfig cfg);
  ~RotatedFileReader() override;

  RotatedFileReader(const RotatedFileReader&) = delete;
  RotatedFileReader& operator=(const RotatedFileReader&) = delete;

  // Call once after construction. Keeps ctor simple (no throwing / no implicit IO).
  Status open();

  Status next(SourceLine* out) override;
  void close();

  const FileIdentity& identity() const { return identity_; }
  bool compressed() const { return compressed_; }

 private:
  struct GzCloser {
    void operator()(gzFile_s* gz) const noexcept;
  };

  // Appends up to one chunk to buf_. Sets eof_ when the underlying file is drained.
  Status fill_();

  RotatedFileReaderConfig cfg_;
  bool opened_{false};
  bool compressed_{false};
  bool eof_{false};

  FileIdentity identity_;

  std::ifstream plain_;
  std::unique_ptr<gzFile_s, GzCloser> gz_;

  std::string buf_;
  std::size_t buf_pos_{0};
  std::uint64_t offset_{0};
};

}  // namespace fgt
