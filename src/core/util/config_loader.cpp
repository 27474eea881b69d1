// src/core/util/config_loader.cpp
#include "fgt/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace fgt {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static void maybe_set_seconds(const YAML::Node& n, const char* key, DurationMs& out) {
  if (!n || !n[key]) return;
  out = seconds_to_ms(n[key].as<double>());
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static void apply_yaml(const YAML::Node& y, Config& cfg) {
  // --- paths
  if (is_map(y["paths"])) {
    const auto p = y["paths"];
    maybe_set(p, "active_log", cfg.paths.active_log);
    maybe_set(p, "rotated_dir", cfg.paths.rotated_dir);
    maybe_set(p, "output_dir", cfg.paths.output_dir);
    maybe_set(p, "checkpoint", cfg.paths.checkpoint);
    maybe_set(p, "metrics", cfg.paths.metrics);
  }

  // --- timing
  if (is_map(y["timing"])) {
    const auto t = y["timing"];
    maybe_set_seconds(t, "tail_slice_s", cfg.timing.tail_slice_ms);
    maybe_set(t, "poll_interval_ms", cfg.timing.poll_interval_ms);
    maybe_set_seconds(t, "checkpoint_interval_s", cfg.timing.checkpoint_interval_ms);
    maybe_set_seconds(t, "metrics_interval_s", cfg.timing.metrics_interval_ms);
  }

  // --- tail
  if (is_map(y["tail"])) {
    maybe_set(y["tail"], "read_chunk_bytes", cfg.tail.read_chunk_bytes);
  }

  // --- checkpoint
  if (is_map(y["checkpoint"])) {
    maybe_set(y["checkpoint"], "completed_cap", cfg.checkpoint.completed_cap);
  }

  // --- logging
  if (is_map(y["logging"])) {
    maybe_set(y["logging"], "level", cfg.logging.level);
    cfg.logging.level = to_lower(cfg.logging.level);
  }
}

Result<Config> default_config() {
  Config cfg;
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);
  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  Config cfg;  // defaults

  // Scalar conversions throw on type mismatch (e.g. "abc" for a number).
  try {
    apply_yaml(y, cfg);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::invalid_argument("bad value in " + path_str + ": " + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace fgt
