#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "internal/fetch/artifact_fetcher.hpp"
#include "internal/fetch/artifact_verifier.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/storage/shared_volume.hpp"
#include "internal/util/time.hpp"

namespace artifact::coordination {

enum class NodeRole : std::uint8_t {
  kPrimary  = 0,
  kFollower = 1,
};

std::string_view RoleName(NodeRole role);

// Throws std::invalid_argument for anything but "primary" or "follower".
NodeRole ParseRole(std::string_view name);

struct StorageCoordinatorOptions {
  util::Duration wait_timeout{std::chrono::seconds(300)};
  util::Duration poll_initial{std::chrono::seconds(5)};
  util::Duration poll_max{std::chrono::seconds(20)};
};

struct StorageResult {
  std::string           installed_version;
  bool                  downloaded      = false;
  bool                  reclaimed_stale = false;
  std::uint32_t         polls           = 0;
  std::filesystem::path worker_path;
};

/*
  Decides whether this node downloads the shared artifacts or reuses them.

  PRIMARY
    1. marker == target and artifacts verify -> step 5, nothing written
    2. stale progress marker -> reclaim
    3. TryAcquire; LockAlreadyHeld means a second primary -> RoleConflict
    4. mark in progress, re-check marker, fetch, verify, write marker, release
    5. ensure this node's WorkerDirectory

  FOLLOWER
    Polls the marker on the backoff schedule until it names the target and
    verifies, or wait_timeout expires (ArtifactWaitTimeout). Never fetches.
    Then ensures its WorkerDirectory.

  The version marker on the volume is the only source of truth; nothing is
  cached between calls.
*/
class StorageCoordinator {
 public:
  StorageCoordinator(std::shared_ptr<storage::SharedVolume> volume, std::shared_ptr<lock::LockCoordinator> lock,
                     fetch::ArtifactFetcherPtr fetcher, fetch::ArtifactVerifier verifier, std::string node_id,
                     std::shared_ptr<util::Clock> clock, StorageCoordinatorOptions options = {});

  StorageResult Initialize(const std::string& target_version, NodeRole role);

  StorageResult RunPrimary(const std::string& target_version);
  StorageResult RunFollower(const std::string& target_version);
  // Zero checks the marker once without sleeping.
  StorageResult RunFollower(const std::string& target_version, util::Duration wait_timeout);

  // Marker names target_version and the artifact set verifies.
  bool IsInstalled(const std::string& target_version) const;

  const std::string& node_id() const {
    return node_id_;
  }
  const storage::SharedVolume& volume() const {
    return *volume_;
  }
  const StorageCoordinatorOptions& options() const {
    return options_;
  }

 private:
  lock::LockHandle AcquireAsPrimary(StorageResult& result);
  void             InstallUnderLock(const std::string& target_version, StorageResult& result);
  void             EnsureWorkerDirectory(NodeRole role, StorageResult& result);

  std::shared_ptr<storage::SharedVolume>  volume_;
  std::shared_ptr<lock::LockCoordinator>  lock_;
  fetch::ArtifactFetcherPtr               fetcher_;
  fetch::ArtifactVerifier                 verifier_;
  std::string                             node_id_;
  std::shared_ptr<util::Clock>            clock_;
  StorageCoordinatorOptions               options_;
};

} // namespace artifact::coordination
