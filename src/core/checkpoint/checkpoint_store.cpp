// File: src/core/checkpoint/checkpoint_store.cpp
#include "fgt/core/checkpoint/checkpoint_store.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "fgt/core/events/record_codec.hpp"
#include "fgt/core/util/text.hpp"

namespace fgt {
namespace {

using json = nlohmann::ordered_json;

std::string errno_message(const std::string& what, int err) {
  return what + ": " + std::strerror(err);
}

template <typename T>
std::optional<T> get_opt(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->template get<T>();
}

template <typename T>
T get_or(const json& j, const char* key, T fallback) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return fallback;
  return it->template get<T>();
}

Counters counters_from_json(const json& j) {
  Counters c;
  if (!j.is_object()) return c;
  c.lines_in_total = get_or<std::uint64_t>(j, "lines_in_total", 0);
  c.bytes_in_total = get_or<std::uint64_t>(j, "bytes_in_total", 0);
  c.events_out_total = get_or<std::uint64_t>(j, "events_out_total", 0);
  c.dlq_out_total = get_or<std::uint64_t>(j, "dlq_out_total", 0);
  c.parse_fail_total = get_or<std::uint64_t>(j, "parse_fail_total", 0);
  c.write_fail_total = get_or<std::uint64_t>(j, "write_fail_total", 0);
  c.checkpoint_fail_total = get_or<std::uint64_t>(j, "checkpoint_fail_total", 0);
  return c;
}

json active_to_json(const ActivePointer& a) {
  json j;
  j["path"] = a.path;
  j["inode"] = a.inode ? json(*a.inode) : json(nullptr);
  j["offset"] = a.offset;
  j["last_event_ts_seen"] = a.last_event_ts_seen ? json(*a.last_event_ts_seen) : json(nullptr);
  return j;
}

json completed_to_json(const CompletedFileRecord& r) {
  json j;
  j["key"] = r.key;
  j["path"] = r.identity.path;
  j["inode"] = r.identity.inode;
  j["size"] = r.identity.size;
  j["mtime"] = r.identity.mtime_s;
  j["completed_at"] = r.completed_at;
  return j;
}

CompletedFileRecord completed_from_json(const json& j) {
  CompletedFileRecord r;
  r.identity.path = get_or<std::string>(j, "path", "");
  r.identity.inode = get_or<std::uint64_t>(j, "inode", 0);
  r.identity.size = get_or<std::uint64_t>(j, "size", 0);
  r.identity.mtime_s = get_or<std::int64_t>(j, "mtime", 0);
  r.completed_at = get_or<std::int64_t>(j, "completed_at", 0);
  // Older documents may lack "key"; it is a pure function of the identity.
  r.key = get_or<std::string>(j, "key", r.identity.dedup_key());
  return r;
}

void sync_directory(const std::filesystem::path& dir) {
  const std::string d = dir.empty() ? std::string(".") : dir.string();
  const int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return;  // rename already happened; directory fsync is best-effort
  (void)::fsync(fd);
  ::close(fd);
}

}  // namespace

std::string checkpoint_to_json(const CheckpointState& state) {
  json j;
  j["schema_version"] = state.schema_version;
  j["active"] = active_to_json(state.active);

  json completed = json::array();
  for (const auto& r : state.completed) completed.push_back(completed_to_json(r));
  j["completed"] = std::move(completed);

  j["counters"] = counters_to_json(state.counters);
  j["updated_at"] = state.updated_at;
  return to_json_line(j);
}

Result<CheckpointState> checkpoint_from_json(std::string_view text) {
  try {
    const json j = json::parse(text.begin(), text.end());
    if (!j.is_object()) {
      return Result<CheckpointState>::err(Status::corrupt_data("checkpoint: top level is not an object"));
    }

    CheckpointState st;
    st.schema_version = get_or<int>(j, "schema_version", kCheckpointSchemaVersion);

    if (const auto it = j.find("active"); it != j.end() && it->is_object()) {
      const json& a = *it;
      st.active.path = get_or<std::string>(a, "path", "");
      st.active.inode = get_opt<std::uint64_t>(a, "inode");
      st.active.offset = get_or<std::uint64_t>(a, "offset", 0);
      st.active.last_event_ts_seen = get_opt<std::string>(a, "last_event_ts_seen");
    }

    if (const auto it = j.find("completed"); it != j.end() && it->is_array()) {
      st.completed.reserve(it->size());
      for (const auto& item : *it) {
        if (!item.is_object()) continue;
        st.completed.push_back(completed_from_json(item));
      }
    }

    if (const auto it = j.find("counters"); it != j.end()) {
      st.counters = counters_from_json(*it);
    }
    st.updated_at = get_or<std::int64_t>(j, "updated_at", 0);

    return Result<CheckpointState>::ok(std::move(st));
  } catch (const json::exception& e) {
    return Result<CheckpointState>::err(Status::corrupt_data(std::string("checkpoint: ") + e.what()));
  }
}

Status atomic_write_file(const std::string& path, std::string_view data) {
  namespace fs = std::filesystem;

  const std::string tmp = path + ".tmp." + std::to_string(::getpid());

  const int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) return Status::io_error(errno_message("open " + tmp, errno));

  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      return Status::io_error(errno_message("write " + tmp, err));
    }
    written += static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    return Status::io_error(errno_message("fsync " + tmp, err));
  }
  if (::close(fd) != 0) {
    const int err = errno;
    ::unlink(tmp.c_str());
    return Status::io_error(errno_message("close " + tmp, err));
  }

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    const int err = errno;
    ::unlink(tmp.c_str());
    return Status::io_error(errno_message("rename " + tmp + " -> " + path, err));
  }

  sync_directory(fs::path(path).parent_path());
  return Status::ok_status();
}

CheckpointStore::CheckpointStore(std::string path, std::string default_active_path,
                                 std::size_t completed_cap)
    : path_(std::move(path)),
      default_active_path_(std::move(default_active_path)),
      completed_cap_(completed_cap == 0 ? kDefaultCompletedCap : completed_cap) {}

CheckpointState CheckpointStore::default_state() const {
  CheckpointState st;
  st.active.path = default_active_path_;
  st.updated_at = wall_now_s();
  return st;
}

Result<CheckpointState> CheckpointStore::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) return Result<CheckpointState>::err(Status::io_error("stat " + path_ + ": " + ec.message()));
    return Result<CheckpointState>::ok(default_state());
  }

  std::ifstream f(path_, std::ios::binary);
  if (!f.is_open()) {
    return Result<CheckpointState>::err(Status::io_error("failed opening '" + path_ + "'"));
  }
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    return Result<CheckpointState>::err(Status::io_error("failed reading '" + path_ + "'"));
  }

  auto st_r = checkpoint_from_json(text);
  if (!st_r.ok()) return st_r;

  CheckpointState st = st_r.take_value();
  if (st.active.path.empty()) st.active.path = default_active_path_;
  return Result<CheckpointState>::ok(std::move(st));
}

Status CheckpointStore::save(CheckpointState& state) const {
  state.updated_at = wall_now_s();
  std::string doc = checkpoint_to_json(state);
  doc.push_back('\n');
  return atomic_write_file(path_, doc);
}

bool CheckpointStore::is_completed(const CheckpointState& state, const FileIdentity& id) const {
  const std::string key = id.dedup_key();
  for (const auto& r : state.completed) {
    if (r.key == key) return true;
  }
  return false;
}

void CheckpointStore::mark_completed(CheckpointState& state, const FileIdentity& id) const {
  CompletedFileRecord r;
  r.key = id.dedup_key();
  r.identity = id;
  r.completed_at = wall_now_s();
  state.completed.push_back(std::move(r));

  if (state.completed.size() > completed_cap_) {
    const auto excess = static_cast<std::ptrdiff_t>(state.completed.size() - completed_cap_);
    state.completed.erase(state.completed.begin(), state.completed.begin() + excess);
  }
}

}  // namespace fgt
