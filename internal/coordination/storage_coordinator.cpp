#include "storage_coordinator.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/worker_directory.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/errors.hpp"

namespace artifact::coordination {

using artifact::observability::BoolField;
using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

constexpr const char* kStateInstalledVersion = "installed_version";
constexpr const char* kStateRole             = "role";

std::int64_t Seconds(util::Duration d) {
  return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

} // namespace

std::string_view RoleName(NodeRole role) {
  return role == NodeRole::kPrimary ? "primary" : "follower";
}

NodeRole ParseRole(std::string_view name) {
  if (name == "primary") return NodeRole::kPrimary;
  if (name == "follower") return NodeRole::kFollower;
  throw std::invalid_argument("unknown node role: " + std::string(name));
}

StorageCoordinator::StorageCoordinator(std::shared_ptr<storage::SharedVolume> volume, std::shared_ptr<lock::LockCoordinator> lock,
                                       fetch::ArtifactFetcherPtr fetcher, fetch::ArtifactVerifier verifier, std::string node_id,
                                       std::shared_ptr<util::Clock> clock, StorageCoordinatorOptions options)
    : volume_(std::move(volume)),
      lock_(std::move(lock)),
      fetcher_(std::move(fetcher)),
      verifier_(std::move(verifier)),
      node_id_(std::move(node_id)),
      clock_(std::move(clock)),
      options_(options) {
}

StorageResult StorageCoordinator::Initialize(const std::string& target_version, NodeRole role) {
  ARTIFACT_LOG_INFO("Initializing shared storage", {StringField("node", node_id_), StringField("role", RoleName(role)),
                                                    StringField("target", target_version), StringField("root", volume_->root_path().string())});

  return role == NodeRole::kPrimary ? RunPrimary(target_version) : RunFollower(target_version);
}

bool StorageCoordinator::IsInstalled(const std::string& target_version) const {
  const auto installed = volume_->ReadInstalledVersion();
  if (installed != target_version) {
    return false;
  }

  const auto verification = verifier_.Verify(volume_->artifact_dir());
  if (!verification.ok) {
    ARTIFACT_LOG_WARN("Installed artifacts failed verification",
                      {StringField("node", node_id_), StringField("version", installed), StringField("problems", verification.Summary())});
    return false;
  }
  return true;
}

// ------------------------------------------------------------
// Primary
// ------------------------------------------------------------

StorageResult StorageCoordinator::RunPrimary(const std::string& target_version) {
  StorageResult result;

  if (IsInstalled(target_version)) {
    ARTIFACT_LOG_INFO("Artifacts already installed", {StringField("node", node_id_), StringField("version", target_version)});
  } else {
    InstallUnderLock(target_version, result);
  }

  result.installed_version = target_version;
  EnsureWorkerDirectory(NodeRole::kPrimary, result);
  return result;
}

lock::LockHandle StorageCoordinator::AcquireAsPrimary(StorageResult& result) {
  if (lock_->IsStale()) {
    result.reclaimed_stale = lock_->ReclaimStale() || result.reclaimed_stale;
  }

  for (int attempt = 0;; ++attempt) {
    try {
      return lock_->TryAcquire();
    } catch (const util::LockAlreadyHeld& e) {
      throw util::RoleConflict("node " + node_id_ + " is primary but the install lock is taken (" + e.what() +
                               "); check role assignment");
    } catch (const util::StaleLockDetected& e) {
      // The marker went stale between the check above and the acquire.
      if (attempt > 0) {
        throw;
      }
      ARTIFACT_LOG_WARN("Stale lock detected on acquire", {StringField("node", node_id_), StringField("detail", e.what())});
      result.reclaimed_stale = lock_->ReclaimStale() || result.reclaimed_stale;
    }
  }
}

void StorageCoordinator::InstallUnderLock(const std::string& target_version, StorageResult& result) {
  if (!fetcher_) {
    throw util::InvalidState("node " + node_id_ + " has no artifact fetcher and cannot act as primary");
  }

  auto handle = AcquireAsPrimary(result);
  handle.MarkInProgress(target_version);

  // Second line of defense on filesystems where flock is not shared.
  if (IsInstalled(target_version)) {
    ARTIFACT_LOG_INFO("Artifacts installed while acquiring the lock", {StringField("node", node_id_), StringField("version", target_version)});
    handle.Release();
    return;
  }

  const auto previous = volume_->ReadInstalledVersion();
  ARTIFACT_LOG_INFO("Downloading artifacts",
                    {StringField("node", node_id_), StringField("version", target_version), StringField("previous", previous)});

  const auto fetched = fetcher_->Fetch(target_version, volume_->artifact_dir());

  const auto verification = verifier_.Verify(volume_->artifact_dir());
  if (!verification.ok) {
    throw util::ArtifactIntegrityError("artifacts for " + target_version + " failed verification: " + verification.Summary());
  }

  volume_->WriteInstalledVersion(target_version);
  handle.Release();

  result.downloaded = true;
  ARTIFACT_LOG_INFO("Artifacts published", {StringField("node", node_id_), StringField("version", target_version),
                                            IntField("entries", static_cast<std::int64_t>(fetched.file_count)),
                                            IntField("duration_ms", fetched.duration.count())});
}

// ------------------------------------------------------------
// Follower
// ------------------------------------------------------------

StorageResult StorageCoordinator::RunFollower(const std::string& target_version) {
  return RunFollower(target_version, options_.wait_timeout);
}

StorageResult StorageCoordinator::RunFollower(const std::string& target_version, util::Duration wait_timeout) {
  StorageResult result;

  util::Backoff backoff(options_.poll_initial, options_.poll_max);
  const auto    deadline = clock_->Now() + wait_timeout;

  while (!IsInstalled(target_version)) {
    const auto now = clock_->Now();
    if (now >= deadline) {
      throw util::ArtifactWaitTimeout("artifacts " + target_version + " not installed after " + util::FormatDuration(wait_timeout) +
                                      " (marker shows " + volume_->ReadInstalledVersion() + ")");
    }

    const auto remaining = std::chrono::duration_cast<util::Duration>(deadline - now);
    const auto delay     = std::min(backoff.Next(), remaining);

    ARTIFACT_LOG_INFO("Waiting for artifacts", {StringField("node", node_id_), StringField("target", target_version),
                                                StringField("installed", volume_->ReadInstalledVersion()),
                                                BoolField("download_in_progress", lock_->IsDownloadInProgress()),
                                                IntField("retry_in_s", Seconds(delay))});
    clock_->SleepFor(delay);
    ++result.polls;
  }

  ARTIFACT_LOG_INFO("Reusing shared artifacts", {StringField("node", node_id_), StringField("version", target_version),
                                                 IntField("polls", result.polls)});

  result.installed_version = target_version;
  EnsureWorkerDirectory(NodeRole::kFollower, result);
  return result;
}

// ------------------------------------------------------------
// Worker directory
// ------------------------------------------------------------

void StorageCoordinator::EnsureWorkerDirectory(NodeRole role, StorageResult& result) {
  auto worker = storage::WorkerDirectory::ForOwner(*volume_, node_id_);
  worker.Put(kStateInstalledVersion, result.installed_version);
  worker.Put(kStateRole, std::string(RoleName(role)));
  result.worker_path = worker.path();
}

} // namespace artifact::coordination
