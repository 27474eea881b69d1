// File: src/adapters/rotated/rotated_file_reader.cpp
#include "fgt/adapters/rotated/rotated_file_reader.hpp"

#include <string_view>
#include <utility>

#include <zlib.h>

#include "fgt/core/catalog/file_catalog.hpp"
#include "fgt/core/util/text.hpp"

namespace fgt {

void RotatedFileReader::GzCloser::operator()(gzFile_s* gz) const noexcept {
  if (gz) (void)gzclose(gz);
}

RotatedFileReader::RotatedFileReader(RotatedFileReaderConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.read_chunk_bytes == 0) cfg_.read_chunk_bytes = 8192;
}

RotatedFileReader::~RotatedFileReader() { close(); }

Status RotatedFileReader::open() {
  if (cfg_.path.empty()) return Status::invalid_argument("RotatedFileReader: path is empty");
  close();

  auto id_r = stat_file(cfg_.path);
  if (!id_r.ok()) return id_r.status();
  identity_ = id_r.take_value();

  compressed_ = has_gzip_suffix(cfg_.path);
  if (compressed_) {
    gz_.reset(gzopen(cfg_.path.c_str(), "rb"));
    if (!gz_) return Status::io_error("RotatedFileReader: failed to open " + cfg_.path);
  } else {
    plain_.open(cfg_.path, std::ios::binary);
    if (!plain_.is_open()) return Status::io_error("RotatedFileReader: failed to open " + cfg_.path);
  }

  opened_ = true;
  eof_ = false;
  buf_.clear();
  buf_pos_ = 0;
  offset_ = 0;
  return Status::ok_status();
}

Status RotatedFileReader::fill_() {
  // Drop the consumed prefix before growing the buffer.
  if (buf_pos_ > 0) {
    buf_.erase(0, buf_pos_);
    buf_pos_ = 0;
  }

  const std::size_t old = buf_.size();
  buf_.resize(old + cfg_.read_chunk_bytes);

  if (compressed_) {
    const int n = gzread(gz_.get(), &buf_[old], static_cast<unsigned>(cfg_.read_chunk_bytes));
    if (n < 0) {
      int errnum = 0;
      const char* msg = gzerror(gz_.get(), &errnum);
      buf_.resize(old);
      return Status::corrupt_data("RotatedFileReader: gzip read failed in " + cfg_.path + ": " +
                                  (msg ? msg : "unknown"));
    }
    buf_.resize(old + static_cast<std::size_t>(n));
    if (n == 0) eof_ = true;
    return Status::ok_status();
  }

  plain_.read(&buf_[old], static_cast<std::streamsize>(cfg_.read_chunk_bytes));
  const std::streamsize n = plain_.gcount();
  if (plain_.bad()) {
    buf_.resize(old);
    return Status::io_error("RotatedFileReader: read failed in " + cfg_.path);
  }
  buf_.resize(old + static_cast<std::size_t>(n));
  if (n == 0 || plain_.eof()) eof_ = true;
  return Status::ok_status();
}

Status RotatedFileReader::next(SourceLine* out) {
  if (!out) return Status::invalid_argument("RotatedFileReader::next: out is null");
  if (!opened_) return Status::invalid_argument("RotatedFileReader::next: not opened");

  while (true) {
    const std::size_t nl = buf_.find('\n', buf_pos_);

    std::size_t len = 0;
    if (nl != std::string::npos) {
      len = nl + 1 - buf_pos_;
    } else if (eof_) {
      if (buf_pos_ >= buf_.size()) return Status::out_of_range("eof");
      len = buf_.size() - buf_pos_;  // unterminated final line
    } else {
      FGT_RETURN_IF_ERROR(fill_());
      continue;
    }

    const std::string_view bytes(buf_.data() + buf_pos_, len);
    out->text = decode_utf8_lossy(bytes);
    out->pos.path = identity_.path;
    out->pos.inode = identity_.inode;
    out->pos.size = identity_.size;
    out->pos.mtime_s = identity_.mtime_s;
    if (compressed_) {
      out->pos.offset.reset();
    } else {
      out->pos.offset = offset_;
    }

    offset_ += len;
    buf_pos_ += len;
    return Status::ok_status();
  }
}

void RotatedFileReader::close() {
  if (plain_.is_open()) plain_.close();
  plain_.clear();
  gz_.reset();
  opened_ = false;
  buf_.clear();
  buf_pos_ = 0;
}

}  // namespace fgt
