// File: src/core/events/record_codec.cpp
#include "fgt/core/events/record_codec.hpp"

#include <optional>

namespace fgt {
namespace {

template <typename T>
RecordJson opt(const std::optional<T>& v) {
  return v ? RecordJson(*v) : RecordJson(nullptr);
}

}  // namespace

RecordJson source_to_json(const SourceRef& s) {
  RecordJson j;
  j["path"] = s.path;
  j["inode"] = s.inode;
  j["offset"] = opt(s.offset);
  return j;
}

RecordJson counters_to_json(const Counters& c) {
  RecordJson j;
  j["lines_in_total"] = c.lines_in_total;
  j["bytes_in_total"] = c.bytes_in_total;
  j["events_out_total"] = c.events_out_total;
  j["dlq_out_total"] = c.dlq_out_total;
  j["parse_fail_total"] = c.parse_fail_total;
  j["write_fail_total"] = c.write_fail_total;
  j["checkpoint_fail_total"] = c.checkpoint_fail_total;
  return j;
}

RecordJson event_to_json(const FirewallEvent& e) {
  RecordJson j;
  j["schema_version"] = kRecordSchemaVersion;
  j["event_id"] = e.event_id;
  j["host"] = e.host;
  j["event_ts"] = opt(e.event_ts);

  j["type"] = opt(e.type);
  j["subtype"] = opt(e.subtype);
  j["level"] = opt(e.level);
  j["devname"] = opt(e.devname);
  j["devid"] = opt(e.devid);
  j["vd"] = opt(e.vd);
  j["action"] = opt(e.action);
  j["policyid"] = opt(e.policyid);
  j["proto"] = opt(e.proto);
  j["service"] = opt(e.service);

  j["srcip"] = opt(e.srcip);
  j["srcport"] = opt(e.srcport);
  j["srcintf"] = opt(e.srcintf);
  j["srcintfrole"] = opt(e.srcintfrole);
  j["dstip"] = opt(e.dstip);
  j["dstport"] = opt(e.dstport);
  j["dstintf"] = opt(e.dstintf);
  j["dstintfrole"] = opt(e.dstintfrole);

  j["sentbyte"] = opt(e.sentbyte);
  j["rcvdbyte"] = opt(e.rcvdbyte);
  j["sentpkt"] = opt(e.sentpkt);
  j["rcvdpkt"] = opt(e.rcvdpkt);

  j["raw"] = e.raw;
  j["parse_status"] = to_string(e.parse_status);
  j["ingest_ts"] = e.ingest_ts;
  j["source"] = source_to_json(e.source);
  return j;
}

RecordJson dlq_to_json(const DlqRecord& d) {
  RecordJson j;
  j["schema_version"] = kRecordSchemaVersion;
  j["ingest_ts"] = d.ingest_ts;
  j["reason"] = to_string(d.reason);
  j["source"] = source_to_json(d.source);
  j["raw"] = d.raw;
  return j;
}

RecordJson metrics_to_json(const MetricsRecord& m) {
  RecordJson j;
  j["schema_version"] = kRecordSchemaVersion;
  j["ts"] = m.ts;
  j["window_s"] = m.window_s;
  j["totals"] = counters_to_json(m.totals);
  j["deltas"] = counters_to_json(m.deltas);
  j["lines_per_s"] = m.lines_per_s;
  j["events_per_s"] = m.events_per_s;

  RecordJson active;
  active["path"] = m.active.path;
  active["inode"] = opt(m.active.inode);
  active["offset"] = m.active.offset;
  active["last_event_ts_seen"] = opt(m.active.last_event_ts_seen);
  j["active"] = std::move(active);

  j["completed_files"] = m.completed_files;
  j["checkpoint_updated_at"] = m.checkpoint_updated_at;
  j["config_hash"] = m.config_hash;
  return j;
}

std::string to_json_line(const RecordJson& j) {
  return j.dump(-1, ' ', false, RecordJson::error_handler_t::replace);
}

}  // namespace fgt
