// src/core/config.cpp
#include "fgt/core/config.hpp"

#include <filesystem>

namespace fgt {
namespace fs = std::filesystem;

std::string Config::rotated_dir() const {
  if (!paths.rotated_dir.empty()) return paths.rotated_dir;
  const fs::path parent = fs::path(paths.active_log).parent_path();
  return parent.empty() ? std::string(".") : parent.string();
}

std::string Config::rotated_basename() const {
  return fs::path(paths.active_log).filename().string();
}

std::string Config::checkpoint_path() const {
  if (!paths.checkpoint.empty()) return paths.checkpoint;
  return (fs::path(paths.output_dir) / "checkpoint.json").string();
}

std::string Config::metrics_path() const {
  if (!paths.metrics.empty()) return paths.metrics;
  return (fs::path(paths.output_dir) / "metrics.jsonl").string();
}

}  // namespace fgt
