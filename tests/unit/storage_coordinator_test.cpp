#include <sys/stat.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/coordination/storage_coordinator.hpp"
#include "internal/storage/worker_directory.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

using artifact::coordination::NodeRole;
using artifact::coordination::StorageCoordinator;
using artifact::coordination::StorageCoordinatorOptions;
using artifact::fetch::ArtifactVerifier;
using artifact::lock::LockCoordinator;
using artifact::storage::SharedVolume;
using artifact::storage::WorkerDirectory;
using artifact::testing::CountingFetcher;
using artifact::testing::FakeClock;
using artifact::testing::MakeRelease;
using artifact::testing::TempDir;
using artifact::testing::WriteFile;

struct Node {
  std::shared_ptr<SharedVolume>       volume;
  std::shared_ptr<LockCoordinator>    lock;
  std::shared_ptr<CountingFetcher>    fetcher;
  std::shared_ptr<StorageCoordinator> storage;
};

// Every node opens its own SharedVolume instance, like separate processes.
Node MakeNode(const std::filesystem::path& root, const std::filesystem::path& releases, const std::string& id,
              const std::shared_ptr<FakeClock>& clock) {
  Node node;
  node.volume  = std::make_shared<SharedVolume>(SharedVolume::Open(root));
  node.lock    = std::make_shared<LockCoordinator>(*node.volume, id, 10min, clock);
  node.fetcher = std::make_shared<CountingFetcher>(releases);

  StorageCoordinatorOptions options;
  options.wait_timeout = 60s;

  node.storage = std::make_shared<StorageCoordinator>(node.volume, node.lock, node.fetcher, ArtifactVerifier({"concourse", "gdn"}, true), id,
                                                      clock, options);
  return node;
}

struct FileStamp {
  ino_t           inode = 0;
  struct timespec mtime {};

  bool operator==(const FileStamp& other) const {
    return inode == other.inode && mtime.tv_sec == other.mtime.tv_sec && mtime.tv_nsec == other.mtime.tv_nsec;
  }
};

FileStamp Stamp(const std::filesystem::path& path) {
  struct stat st {};
  assert(::stat(path.c_str(), &st) == 0);
  return FileStamp{st.st_ino, st.st_mtim};
}

// Two nodes start at the same time; the follower's first poll lets the primary run.
void TestPrimaryAndFollowerStartTogether() {
  TempDir volume_dir("storage_scenario1_volume");
  TempDir releases("storage_scenario1_releases");
  MakeRelease(releases.path(), "1.2.0");

  auto clock    = std::make_shared<FakeClock>();
  auto primary  = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);
  auto follower = MakeNode(volume_dir.path(), releases.path(), "node-b", clock);

  clock->SetSleepHook([&](int sleep) {
    if (sleep == 1) {
      const auto result = primary.storage->Initialize("1.2.0", NodeRole::kPrimary);
      assert(result.downloaded);
    }
  });

  const auto result = follower.storage->Initialize("1.2.0", NodeRole::kFollower);
  assert(result.installed_version == "1.2.0");
  assert(result.polls == 1);
  assert(!result.downloaded);

  assert(primary.fetcher->calls == 1);
  assert(follower.fetcher->calls == 0 && "followers never download");
  assert(follower.volume->ReadInstalledVersion() == "1.2.0");
  assert(!follower.lock->IsDownloadInProgress());

  auto worker = WorkerDirectory::OpenReadOnly(*follower.volume, "node-b");
  assert(worker.Exists());
  assert(worker.Get("installed_version") == "1.2.0");
  assert(worker.Get("role") == "follower");
  assert(WorkerDirectory::OpenReadOnly(*primary.volume, "node-a").Get("role") == "primary");
}

void TestPrimaryReentryWritesNothing() {
  TempDir volume_dir("storage_reentry_volume");
  TempDir releases("storage_reentry_releases");
  MakeRelease(releases.path(), "1.2.0");

  auto clock = std::make_shared<FakeClock>();
  auto node  = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);

  assert(node.storage->RunPrimary("1.2.0").downloaded);

  const auto marker   = Stamp(node.volume->version_marker_path());
  const auto binary   = Stamp(node.volume->artifact_dir() / "concourse");
  const auto state    = Stamp(node.volume->worker_root() / "node-a" / WorkerDirectory::kStateFileName);

  // Restart: fresh objects over the same volume.
  auto restarted = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);
  const auto result = restarted.storage->RunPrimary("1.2.0");

  assert(!result.downloaded);
  assert(restarted.fetcher->calls == 0);
  assert(Stamp(node.volume->version_marker_path()) == marker);
  assert(Stamp(node.volume->artifact_dir() / "concourse") == binary);
  assert(Stamp(node.volume->worker_root() / "node-a" / WorkerDirectory::kStateFileName) == state);
  assert(!std::filesystem::exists(node.volume->progress_marker_path()));
}

void TestFollowerFastPathNeverSleeps() {
  TempDir volume_dir("storage_fast_path_volume");
  TempDir releases("storage_fast_path_releases");
  MakeRelease(releases.path(), "1.2.0");

  auto primary_clock = std::make_shared<FakeClock>();
  MakeNode(volume_dir.path(), releases.path(), "node-a", primary_clock).storage->RunPrimary("1.2.0");

  auto clock    = std::make_shared<FakeClock>();
  auto follower = MakeNode(volume_dir.path(), releases.path(), "node-b", clock);

  const auto result = follower.storage->RunFollower("1.2.0");
  assert(result.polls == 0);
  assert(clock->sleep_count() == 0);
  assert(follower.fetcher->calls == 0);
}

void TestFollowerTimesOutOnOlderMarker() {
  TempDir volume_dir("storage_timeout_volume");
  TempDir releases("storage_timeout_releases");

  auto clock    = std::make_shared<FakeClock>();
  auto follower = MakeNode(volume_dir.path(), releases.path(), "node-b", clock);
  follower.volume->WriteInstalledVersion("1.1.0");

  bool threw = false;
  try {
    follower.storage->RunFollower("1.2.0");
  } catch (const artifact::util::ArtifactWaitTimeout& e) {
    threw = true;
    assert(std::string(e.what()).find("1.1.0") != std::string::npos);
  }
  assert(threw);

  // 5s -> 10s -> 20s, capped, and the last wait trimmed to the deadline.
  const auto& sleeps = clock->sleeps();
  assert(sleeps.size() == 5);
  assert(sleeps[0] == 5s && sleeps[1] == 10s && sleeps[2] == 20s && sleeps[3] == 20s && sleeps[4] == 5s);
  assert(clock->total_slept() == 60s);

  assert(follower.fetcher->calls == 0);
  assert(!WorkerDirectory::OpenReadOnly(*follower.volume, "node-b").Exists());
  assert(follower.volume->ReadInstalledVersion() == "1.1.0");
}

// Primary crashed after creating the progress marker; 11 minutes later a new
// primary reclaims it and completes the install.
void TestStaleMarkerIsReclaimedByNextPrimary() {
  TempDir volume_dir("storage_scenario2_volume");
  TempDir releases("storage_scenario2_releases");
  MakeRelease(releases.path(), "1.2.0");

  auto clock = std::make_shared<FakeClock>();
  auto node  = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);

  WriteFile(node.volume->progress_marker_path(), "started_at_ms=0\nholder=node-old\nversion=1.2.0\n");
  assert(node.volume->ReadInstalledVersion() == SharedVolume::kNoVersion);

  clock->Advance(11min);

  const auto result = node.storage->RunPrimary("1.2.0");
  assert(result.reclaimed_stale);
  assert(result.downloaded);
  assert(node.fetcher->calls == 1);
  assert(node.volume->ReadInstalledVersion() == "1.2.0");
  assert(!std::filesystem::exists(node.volume->progress_marker_path()));
}

void TestSecondPrimaryIsRoleConflict() {
  TempDir volume_dir("storage_conflict_volume");
  TempDir releases("storage_conflict_releases");
  MakeRelease(releases.path(), "1.2.0");

  auto clock = std::make_shared<FakeClock>();
  auto a     = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);
  auto b     = MakeNode(volume_dir.path(), releases.path(), "node-b", clock);

  auto held = a.lock->TryAcquire();
  held.MarkInProgress("1.2.0");

  bool threw = false;
  try {
    b.storage->RunPrimary("1.2.0");
  } catch (const artifact::util::RoleConflict&) {
    threw = true;
  }
  assert(threw);
  assert(b.fetcher->calls == 0);
  // The holder's marker is untouched.
  assert(a.lock->ReadProgressMarker()->holder_id == "node-a");
}

void TestFetchFailureReleasesLock() {
  TempDir volume_dir("storage_fetch_failure_volume");
  TempDir releases("storage_fetch_failure_releases");
  MakeRelease(releases.path(), "1.2.0");

  auto clock = std::make_shared<FakeClock>();
  auto node  = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);

  node.fetcher->before_fetch = [&] { assert(node.lock->IsDownloadInProgress() && "marker must exist before long work"); };
  node.fetcher->fail         = true;

  bool threw = false;
  try {
    node.storage->RunPrimary("1.2.0");
  } catch (const artifact::util::ArtifactFetchError&) {
    threw = true;
  }
  assert(threw);
  assert(node.volume->ReadInstalledVersion() == SharedVolume::kNoVersion);
  assert(!node.lock->IsDownloadInProgress());

  node.fetcher->fail = false;
  assert(node.storage->RunPrimary("1.2.0").downloaded);
}

void TestIntegrityFailureKeepsMarker() {
  TempDir volume_dir("storage_integrity_volume");
  TempDir releases("storage_integrity_releases");
  MakeRelease(releases.path(), "1.3.0");
  WriteFile(releases.path() / "1.3.0" / "gdn", "#!/bin/sh\necho truncated\n", true);

  auto clock = std::make_shared<FakeClock>();
  auto node  = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);

  bool threw = false;
  try {
    node.storage->RunPrimary("1.3.0");
  } catch (const artifact::util::ArtifactIntegrityError& e) {
    threw = true;
    assert(std::string(e.what()).find("gdn") != std::string::npos);
  }
  assert(threw);
  assert(node.fetcher->calls == 1);
  assert(node.volume->ReadInstalledVersion() == SharedVolume::kNoVersion);
  assert(!node.lock->IsDownloadInProgress());
  assert(!WorkerDirectory::OpenReadOnly(*node.volume, "node-a").Exists());
}

void TestTamperedInstallIsReinstalled() {
  TempDir volume_dir("storage_tampered_volume");
  TempDir releases("storage_tampered_releases");
  MakeRelease(releases.path(), "1.2.0");

  auto clock = std::make_shared<FakeClock>();
  auto node  = MakeNode(volume_dir.path(), releases.path(), "node-a", clock);
  node.storage->RunPrimary("1.2.0");

  WriteFile(node.volume->artifact_dir() / "gdn", "corrupted", true);
  assert(!node.storage->IsInstalled("1.2.0"));

  const auto result = node.storage->RunPrimary("1.2.0");
  assert(result.downloaded);
  assert(node.fetcher->calls == 2);
  assert(node.storage->IsInstalled("1.2.0"));
}

} // namespace

int main() {
  TestPrimaryAndFollowerStartTogether();
  TestPrimaryReentryWritesNothing();
  TestFollowerFastPathNeverSleeps();
  TestFollowerTimesOutOnOlderMarker();
  TestStaleMarkerIsReclaimedByNextPrimary();
  TestSecondPrimaryIsRoleConflict();
  TestFetchFailureReleasesLock();
  TestIntegrityFailureKeepsMarker();
  TestTamperedInstallIsReinstalled();

  std::cout << "artifact_unit_storage_coordinator: pass\n";
  return 0;
}
