#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "artifact/coordination/v1.hpp"
#include "internal/storage/shared_volume.hpp"

namespace artifact::storage {

/*
  Per-node subtree of the shared volume: worker/{owner_id}/

  Single owner. Only a handle obtained through ForOwner() may write; handles
  from OpenReadOnly() exist for diagnostics and refuse writes.
*/
class WorkerDirectory {
 public:
  static constexpr const char* kStateFileName = "state";
  static constexpr const char* kWorkDirName   = "work";

  // Creates the directory (and work/) if absent.
  static WorkerDirectory ForOwner(const SharedVolume& volume, const std::string& owner_id);

  // Does not create anything.
  static WorkerDirectory OpenReadOnly(const SharedVolume& volume, const std::string& owner_id);

  const std::string& owner_id() const {
    return owner_id_;
  }
  const std::filesystem::path& path() const {
    return path_;
  }
  std::filesystem::path state_file() const {
    return path_ / kStateFileName;
  }
  std::filesystem::path work_dir() const {
    return path_ / kWorkDirName;
  }
  bool read_only() const {
    return read_only_;
  }

  bool Exists() const;

  // Empty state (owner set, no entries) when nothing was written yet.
  artifact::coordination::v1::WorkerState ReadState() const;
  void                                    WriteState(const artifact::coordination::v1::WorkerState& state);

  std::optional<std::string> Get(const std::string& key) const;

  // Returns false and writes nothing when the value is unchanged.
  bool Put(const std::string& key, const std::string& value);

 private:
  WorkerDirectory(std::string owner_id, std::filesystem::path path, bool read_only);

  std::string           owner_id_;
  std::filesystem::path path_;
  bool                  read_only_;
};

} // namespace artifact::storage
