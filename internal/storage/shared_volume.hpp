#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace artifact::storage {

/*
  Identity of the filesystem backing the volume root.

  Nodes compare ToString() tokens to confirm they mount the same volume and not
  unrelated local directories that happen to share a path. Sanity check only.
*/
struct FilesystemIdentity {
  std::uint64_t device = 0;
  std::uint64_t inode  = 0;
  std::string   fsid;

  std::string ToString() const;

  bool operator==(const FilesystemIdentity& other) const = default;
};

struct StorageStats {
  std::uint64_t disk_usage_bytes = 0;
  std::uint64_t artifact_count   = 0;
  std::uint64_t worker_count     = 0;
  bool          provisioned      = false;
};

/*
  The mounted shared directory tree.

  Layout under root_path:
    bin/                    shared artifacts (single writer: lock holder)
    keys/                   shared keys
    worker/{owner_id}/      per-node state (single owner)
    .installed_version      version marker (primary only)
    .download_in_progress   progress marker (lock holder)
    .install.lock           flock target
    .shared_storage         written by provisioning, read only here

  Nothing is cached: every marker read goes to the filesystem.
*/
class SharedVolume {
 public:
  static constexpr const char* kNoVersion = "none";

  static constexpr const char* kArtifactDirName       = "bin";
  static constexpr const char* kKeysDirName           = "keys";
  static constexpr const char* kWorkerDirName         = "worker";
  static constexpr const char* kVersionMarkerName     = ".installed_version";
  static constexpr const char* kProgressMarkerName    = ".download_in_progress";
  static constexpr const char* kLockFileName          = ".install.lock";
  static constexpr const char* kProvisionedMarkerName = ".shared_storage";

  // Shared mode. Throws StorageNotMounted if root_path is missing or not a directory.
  static SharedVolume Open(const std::filesystem::path& root_path);

  // Local-only mode, for deployments that never asked for shared storage.
  static SharedVolume OpenLocal(const std::filesystem::path& root_path);

  const std::filesystem::path& root_path() const {
    return root_path_;
  }
  bool shared() const {
    return shared_;
  }

  std::filesystem::path artifact_dir() const {
    return root_path_ / kArtifactDirName;
  }
  std::filesystem::path keys_dir() const {
    return root_path_ / kKeysDirName;
  }
  std::filesystem::path worker_root() const {
    return root_path_ / kWorkerDirName;
  }
  std::filesystem::path lock_path() const {
    return root_path_ / kLockFileName;
  }
  std::filesystem::path version_marker_path() const {
    return root_path_ / kVersionMarkerName;
  }
  std::filesystem::path progress_marker_path() const {
    return root_path_ / kProgressMarkerName;
  }

  // Marker content, or kNoVersion when absent or empty.
  std::string ReadInstalledVersion() const;

  // Atomic; concurrent readers never observe a partial version.
  void WriteInstalledVersion(const std::string& version);

  FilesystemIdentity filesystem_identity() const;
  bool               MatchesIdentity(const std::string& expected) const;

  bool         IsWritable() const;
  StorageStats CollectStats() const;

 private:
  SharedVolume(std::filesystem::path root_path, bool shared);

  void EnsureLayout();

  std::filesystem::path root_path_;
  bool                  shared_;
};

} // namespace artifact::storage
