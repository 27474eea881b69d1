// File: include/fgt/core/catalog/file_catalog.hpp
#pragma once

#include <string>
#include <vector>

#include "fgt/core/status.hpp"
#include "fgt/core/types.hpp"

namespace fgt {

// Discovers rotated (closed, immutable) siblings of the active log:
//   <basename>-YYYYMMDD-HHMMSS
//   <basename>-YYYYMMDD-HHMMSS.gz
// and orders them oldest first by the embedded timestamp.
class FileCatalog {
 public:
  FileCatalog(std::string dir, std::string basename);

  const std::string& dir() const { return dir_; }
  const std::string& basename() const { return basename_; }

  // Full paths, ascending by timestamp. Missing directory -> empty list.
  Result<std::vector<std::string>> list_rotated_files() const;

  // Returns the "YYYYMMDD-HHMMSS" stamp if `filename` matches the rotation
  // pattern for this basename, else an empty string.
  std::string rotation_stamp(const std::string& filename) const;

 private:
  std::string dir_;
  std::string basename_;
};

// stat() snapshot (follows symlinks). not_found when the file vanished.
Result<FileIdentity> stat_file(const std::string& path);

bool has_gzip_suffix(const std::string& path);

}  // namespace fgt
