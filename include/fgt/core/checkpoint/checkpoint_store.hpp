// File: include/fgt/core/checkpoint/checkpoint_store.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "fgt/core/status.hpp"
#include "fgt/core/types.hpp"

namespace fgt {

constexpr std::size_t kDefaultCompletedCap = 5000;

// Owns the on-disk side of CheckpointState. The in-memory state itself is owned
// by the caller (one owner for the process lifetime); the store only reads and
// writes it.
//
// Durability contract for save():
//   write <path>.tmp.<pid> -> fsync -> rename over <path> -> fsync parent dir.
// A crash at any point leaves either the old or the new document, never a mix.
class CheckpointStore {
 public:
  CheckpointStore(std::string path, std::string default_active_path,
                  std::size_t completed_cap = kDefaultCompletedCap);

  const std::string& path() const { return path_; }

  // Missing file -> default_state(). Present but undecodable -> corrupt_data.
  Result<CheckpointState> load() const;

  // Stamps updated_at, then writes atomically.
  Status save(CheckpointState& state) const;

  CheckpointState default_state() const;

  // Ledger lookup by "path|inode|size|mtime".
  bool is_completed(const CheckpointState& state, const FileIdentity& id) const;

  // Appends, then trims the ledger to the most recent completed_cap entries.
  void mark_completed(CheckpointState& state, const FileIdentity& id) const;

 private:
  std::string path_;
  std::string default_active_path_;
  std::size_t completed_cap_;
};

// JSON codec (compact, field order stable).
std::string checkpoint_to_json(const CheckpointState& state);
Result<CheckpointState> checkpoint_from_json(std::string_view text);

// Write-then-rename with fsync of both the file and its directory.
Status atomic_write_file(const std::string& path, std::string_view data);

}  // namespace fgt
