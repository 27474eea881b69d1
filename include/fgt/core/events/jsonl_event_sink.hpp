// File: include/fgt/core/events/jsonl_event_sink.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <string>

#include "fgt/core/events/event_sink.hpp"
#include "fgt/core/status.hpp"

namespace fgt {

struct JsonlEventSinkConfig {
  std::string output_dir;
  std::string metrics_path;

  // Epoch seconds used to pick the hour bucket. Empty = wall clock.
  std::function<std::int64_t()> now_s;
};

// JSONL sink, one record per line, hourly buckets in local time:
//   <output_dir>/events-YYYYMMDD-HH.jsonl
//   <output_dir>/dlq-YYYYMMDD-HH.jsonl
//   <metrics_path>                         (single append-only file)
//
// Files are opened in append mode and every record is flushed before emit_*
// returns, so a successful emit is visible to readers of the file.
class JsonlEventSink final : public EventSink {
 public:
  explicit JsonlEventSink(JsonlEventSinkConfig cfg);
  ~JsonlEventSink() override;

  JsonlEventSink(const JsonlEventSink&) = delete;
  JsonlEventSink& operator=(const JsonlEventSink&) = delete;

  Status open() override;
  Status emit_event(const FirewallEvent& e) override;
  Status emit_dlq(const DlqRecord& d) override;
  Status emit_metrics(const MetricsRecord& m) override;
  Status flush() override;
  void close() override;

  // Path the next record of each kind would land in.
  std::string event_path_now() const;
  std::string dlq_path_now() const;

 private:
  struct Bucket {
    std::string prefix;
    std::string key;  // "YYYYMMDD-HH" of the open stream
    std::string path;
    std::ofstream f;
  };

  std::int64_t now_() const;
  std::string bucket_path_(const std::string& prefix, const std::string& key) const;
  Status write_bucket_(Bucket& b, const std::string& line);
  static Status write_line_(std::ofstream& f, const std::string& path, const std::string& line);

  JsonlEventSinkConfig cfg_;
  bool open_{false};

  Bucket events_;
  Bucket dlq_;
  std::ofstream metrics_;
};

}  // namespace fgt
