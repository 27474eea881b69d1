// File: src/core/events/jsonl_event_sink.cpp
#include "fgt/core/events/jsonl_event_sink.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "fgt/core/events/record_codec.hpp"
#include "fgt/core/util/text.hpp"

namespace fgt {
namespace {

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

Status ensure_dir(const std::string& dir) {
  if (dir.empty()) return Status::ok_status();
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) return Status::io_error("failed creating '" + dir + "': " + ec.message());
  return Status::ok_status();
}

}  // namespace

JsonlEventSink::JsonlEventSink(JsonlEventSinkConfig cfg) : cfg_(std::move(cfg)) {
  events_.prefix = "events";
  dlq_.prefix = "dlq";
}

JsonlEventSink::~JsonlEventSink() { close(); }

std::int64_t JsonlEventSink::now_() const { return cfg_.now_s ? cfg_.now_s() : wall_now_s(); }

std::string JsonlEventSink::bucket_path_(const std::string& prefix, const std::string& key) const {
  return join_path(cfg_.output_dir, prefix + "-" + key + ".jsonl");
}

std::string JsonlEventSink::event_path_now() const {
  return bucket_path_(events_.prefix, local_hour_key(now_()));
}

std::string JsonlEventSink::dlq_path_now() const {
  return bucket_path_(dlq_.prefix, local_hour_key(now_()));
}

Status JsonlEventSink::open() {
  close();

  FGT_RETURN_IF_ERROR(ensure_dir(cfg_.output_dir));

  if (!cfg_.metrics_path.empty()) {
    FGT_RETURN_IF_ERROR(ensure_dir(std::filesystem::path(cfg_.metrics_path).parent_path().string()));
    metrics_.open(cfg_.metrics_path, std::ios::out | std::ios::app);
    if (!metrics_.is_open()) return Status::io_error("failed opening '" + cfg_.metrics_path + "'");
  }

  open_ = true;
  return Status::ok_status();
}

Status JsonlEventSink::write_line_(std::ofstream& f, const std::string& path,
                                   const std::string& line) {
  f << line << '\n';
  f.flush();
  if (!f.good()) {
    f.close();  // reopened on the next record
    return Status::io_error("failed writing to '" + path + "'");
  }
  return Status::ok_status();
}

Status JsonlEventSink::write_bucket_(Bucket& b, const std::string& line) {
  const std::string key = local_hour_key(now_());
  if (!b.f.is_open() || key != b.key) {
    if (b.f.is_open()) b.f.close();
    FGT_RETURN_IF_ERROR(ensure_dir(cfg_.output_dir));
    b.key = key;
    b.path = bucket_path_(b.prefix, key);
    b.f.open(b.path, std::ios::out | std::ios::app);
    if (!b.f.is_open()) return Status::io_error("failed opening '" + b.path + "'");
  }
  return write_line_(b.f, b.path, line);
}

Status JsonlEventSink::emit_event(const FirewallEvent& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit_event called while not open");
  return write_bucket_(events_, to_json_line(event_to_json(e)));
}

Status JsonlEventSink::emit_dlq(const DlqRecord& d) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit_dlq called while not open");
  return write_bucket_(dlq_, to_json_line(dlq_to_json(d)));
}

Status JsonlEventSink::emit_metrics(const MetricsRecord& m) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit_metrics called while not open");
  if (cfg_.metrics_path.empty()) return Status::ok_status();
  if (!metrics_.is_open()) {
    metrics_.open(cfg_.metrics_path, std::ios::out | std::ios::app);
    if (!metrics_.is_open()) return Status::io_error("failed opening '" + cfg_.metrics_path + "'");
  }
  return write_line_(metrics_, cfg_.metrics_path, to_json_line(metrics_to_json(m)));
}

Status JsonlEventSink::flush() {
  if (!open_) return Status::ok_status();

  if (events_.f.is_open()) events_.f.flush();
  if (dlq_.f.is_open()) dlq_.f.flush();
  if (metrics_.is_open()) metrics_.flush();

  if (events_.f.is_open() && !events_.f.good()) return Status::io_error("failed flushing '" + events_.path + "'");
  if (dlq_.f.is_open() && !dlq_.f.good()) return Status::io_error("failed flushing '" + dlq_.path + "'");
  if (metrics_.is_open() && !metrics_.good()) return Status::io_error("failed flushing '" + cfg_.metrics_path + "'");

  return Status::ok_status();
}

void JsonlEventSink::close() {
  if (events_.f.is_open()) events_.f.close();
  if (dlq_.f.is_open()) dlq_.f.close();
  if (metrics_.is_open()) metrics_.close();
  events_.key.clear();
  dlq_.key.clear();
  open_ = false;
}

}  // namespace fgt
