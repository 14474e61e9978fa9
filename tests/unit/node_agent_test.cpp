#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/coordination/storage_coordinator.hpp"
#include "internal/coordination/upgrade_coordinator.hpp"
#include "internal/relation/memory_relation_store.hpp"
#include "internal/runtime/node_agent.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

using artifact::coordination::NodeRole;
using artifact::coordination::StorageCoordinator;
using artifact::coordination::StorageCoordinatorOptions;
using artifact::coordination::UpgradeCoordinator;
using artifact::coordination::UpgradeOptions;
using artifact::coordination::UpgradePhase;
using artifact::fetch::ArtifactVerifier;
using artifact::lock::LockCoordinator;
using artifact::relation::MemoryRelationHub;
using artifact::runtime::NodeAgent;
using artifact::runtime::NodeAgentOptions;
using artifact::runtime::NodeStatus;
using artifact::runtime::StaticRoleAssignment;
using artifact::storage::SharedVolume;
using artifact::testing::CountingFetcher;
using artifact::testing::FakeClock;
using artifact::testing::MakeRelease;
using artifact::testing::RecordingServiceManager;
using artifact::testing::TempDir;

namespace keys = artifact::coordination::keys;

struct Node {
  std::shared_ptr<SharedVolume>            volume;
  std::shared_ptr<CountingFetcher>         fetcher;
  std::shared_ptr<RecordingServiceManager> services;
  std::shared_ptr<StorageCoordinator>      storage;
  std::shared_ptr<UpgradeCoordinator>      upgrades;
  std::shared_ptr<NodeAgent>               agent;
};

class Fixture {
 public:
  explicit Fixture(const std::string& name)
      : volume_dir_(name + "_volume"), releases_(name + "_releases"), hub_(MemoryRelationHub::Create()), clock_(std::make_shared<FakeClock>()) {
    MakeRelease(releases_.path(), "1.2.0");
    MakeRelease(releases_.path(), "1.3.0");
  }

  Node Add(const std::string& unit, NodeRole role, const std::string& target, const std::string& expected_fs_id = "") {
    Node node;
    auto relation = hub_->Join(unit, role == NodeRole::kPrimary);
    node.volume   = std::make_shared<SharedVolume>(SharedVolume::Open(volume_dir_.path()));
    node.fetcher  = std::make_shared<CountingFetcher>(releases_.path());
    node.services = std::make_shared<RecordingServiceManager>();

    auto lock = std::make_shared<LockCoordinator>(*node.volume, unit, 10min, clock_);

    StorageCoordinatorOptions storage_options;
    storage_options.wait_timeout = 60s;
    node.storage = std::make_shared<StorageCoordinator>(node.volume, lock, node.fetcher, ArtifactVerifier({"concourse", "gdn"}, true), unit,
                                                        clock_, storage_options);

    UpgradeOptions upgrade_options;
    upgrade_options.service_name  = "concourse-worker";
    upgrade_options.ready_timeout = 30s;
    node.upgrades                 = std::make_shared<UpgradeCoordinator>(relation, node.storage, node.services, clock_, upgrade_options);

    NodeAgentOptions agent_options;
    agent_options.target_version         = target;
    agent_options.expected_filesystem_id = expected_fs_id;
    node.agent = std::make_shared<NodeAgent>(node.volume, std::make_shared<StaticRoleAssignment>(role), node.storage, node.upgrades, relation,
                                             agent_options);
    return node;
  }

  std::string PublishedStatus(const std::string& unit) const {
    const auto bag = hub_->GetUnitBag(unit);
    const auto it  = bag.find(keys::kNodeStatus);
    return it == bag.end() ? std::string() : it->second;
  }

  const std::shared_ptr<FakeClock>& clock() const {
    return clock_;
  }

 private:
  TempDir                            volume_dir_;
  TempDir                            releases_;
  std::shared_ptr<MemoryRelationHub> hub_;
  std::shared_ptr<FakeClock>         clock_;
};

void TestPrimaryStartsActive() {
  Fixture fixture("agent_primary");
  auto    primary = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.2.0");

  assert(primary.agent->Start() == NodeStatus::kActive);
  assert(primary.agent->role() == NodeRole::kPrimary);
  assert(primary.volume->ReadInstalledVersion() == "1.2.0");
  assert(fixture.PublishedStatus("concourse-ci/0") == "active");

  // Steady state: nothing to do, nothing fetched again.
  assert(primary.agent->Reconcile() == NodeStatus::kActive);
  assert(primary.fetcher->calls == 1);
  assert(primary.services->ops.empty());
}

void TestFollowerWaitsThenRecovers() {
  Fixture fixture("agent_follower");
  auto    follower = fixture.Add("concourse-ci/1", NodeRole::kFollower, "1.2.0");

  assert(follower.agent->Start() == NodeStatus::kWaiting);
  assert(fixture.PublishedStatus("concourse-ci/1") == "waiting");
  assert(follower.agent->status_detail().find("1.2.0") != std::string::npos);

  // A tick only looks at the marker; it does not sit out another wait.
  const auto sleeps_after_start = fixture.clock()->sleep_count();
  assert(follower.agent->Reconcile() == NodeStatus::kWaiting);
  assert(fixture.clock()->sleep_count() == sleeps_after_start);
  assert(fixture.PublishedStatus("concourse-ci/1") == "waiting");

  auto primary = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.2.0");
  assert(primary.agent->Start() == NodeStatus::kActive);

  const auto sleeps_before = fixture.clock()->sleep_count();
  assert(follower.agent->Reconcile() == NodeStatus::kActive);
  assert(fixture.clock()->sleep_count() == sleeps_before);
  assert(fixture.PublishedStatus("concourse-ci/1") == "active");
  assert(follower.fetcher->calls == 0);
}

void TestIdentityMismatchBlocks() {
  Fixture fixture("agent_identity");
  auto    follower = fixture.Add("concourse-ci/1", NodeRole::kFollower, "1.2.0", "ffffffffffffffff:1:1");

  bool threw = false;
  try {
    follower.agent->Start();
  } catch (const artifact::util::StorageNotMounted&) {
    threw = true;
  }
  assert(threw);
  assert(follower.agent->status() == NodeStatus::kBlocked);
  assert(fixture.PublishedStatus("concourse-ci/1") == "blocked");
  assert(fixture.clock()->sleep_count() == 0);
}

void TestMatchingIdentityIsAccepted() {
  Fixture    fixture("agent_identity_ok");
  auto       first = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.2.0");
  const auto token = first.volume->filesystem_identity().ToString();

  auto primary = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.2.0", token);
  assert(primary.agent->Start() == NodeStatus::kActive);
}

// Restarting the primary with a new target runs a full upgrade cycle.
void TestPrimaryDrivesUpgradeOnNewTarget() {
  Fixture fixture("agent_upgrade");
  auto    primary  = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.2.0");
  auto    follower = fixture.Add("concourse-ci/1", NodeRole::kFollower, "1.2.0");
  assert(primary.agent->Start() == NodeStatus::kActive);
  assert(follower.agent->Start() == NodeStatus::kActive);

  auto upgraded = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.3.0");
  fixture.clock()->SetSleepHook([&](int) { follower.agent->Reconcile(); });

  assert(upgraded.agent->Start() == NodeStatus::kActive);
  fixture.clock()->SetSleepHook(nullptr);

  assert(upgraded.volume->ReadInstalledVersion() == "1.3.0");
  assert(upgraded.upgrades->CurrentState().phase == UpgradePhase::kComplete);
  assert(upgraded.services->Count("restart:concourse-worker") == 1);
  assert(follower.services->Count("stop:concourse-worker") == 1);

  assert(follower.agent->Reconcile() == NodeStatus::kActive);
  assert(follower.services->Count("start:concourse-worker") == 1);
  assert(follower.agent->status_detail() == "version 1.3.0");

  assert(upgraded.agent->Reconcile() == NodeStatus::kActive);
  assert(upgraded.upgrades->CurrentState().phase == UpgradePhase::kIdle);
}

// Follower restarted between PREPARE and COMPLETE: the marker still shows the
// old version, so it waits on the volume instead of trusting the relation.
void TestFollowerRestartedMidUpgradeWaitsForMarker() {
  Fixture fixture("agent_scenario4");
  auto    primary  = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.2.0");
  auto    follower = fixture.Add("concourse-ci/1", NodeRole::kFollower, "1.2.0");
  assert(primary.agent->Start() == NodeStatus::kActive);
  assert(follower.agent->Start() == NodeStatus::kActive);

  primary.upgrades->InitiateUpgrade("1.3.0");
  follower.agent->Reconcile();
  assert(follower.upgrades->IsAcknowledged());
  primary.upgrades->WaitForFollowersReady();
  primary.upgrades->MarkDownloading();

  auto restarted = fixture.Add("concourse-ci/1", NodeRole::kFollower, "1.3.0");
  assert(restarted.volume->ReadInstalledVersion() == "1.2.0");

  const auto sleeps_before = fixture.clock()->sleep_count();
  fixture.clock()->SetSleepHook([&](int sleep) {
    if (sleep == sleeps_before + 2) {
      primary.storage->RunPrimary("1.3.0");
      primary.upgrades->CompleteUpgrade();
    }
  });

  assert(restarted.agent->Start() == NodeStatus::kActive);
  fixture.clock()->SetSleepHook(nullptr);

  assert(fixture.clock()->sleep_count() == sleeps_before + 2);
  assert(restarted.fetcher->calls == 0);
  assert(restarted.services->ops.empty());

  assert(restarted.agent->Reconcile() == NodeStatus::kActive);
  assert(restarted.services->Count("start:concourse-worker") == 1);
  assert(!restarted.upgrades->IsAcknowledged());
}

void TestFailedUpgradeBlocksUntilRetried() {
  Fixture fixture("agent_blocked");
  auto    primary = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.2.0");
  assert(primary.agent->Start() == NodeStatus::kActive);

  auto upgraded          = fixture.Add("concourse-ci/0", NodeRole::kPrimary, "1.3.0");
  upgraded.fetcher->fail = true;

  bool threw = false;
  try {
    upgraded.agent->Start();
  } catch (const artifact::util::ArtifactFetchError&) {
    threw = true;
  }
  assert(threw);
  assert(upgraded.agent->status() == NodeStatus::kBlocked);

  // Ticks do not retry on their own.
  assert(upgraded.agent->Reconcile() == NodeStatus::kBlocked);
  assert(upgraded.agent->status_detail().find("retry-upgrade") != std::string::npos);
  assert(upgraded.fetcher->calls == 1);

  upgraded.fetcher->fail = false;
  upgraded.upgrades->RetryUpgrade();

  assert(upgraded.agent->Reconcile() == NodeStatus::kActive);
  assert(upgraded.volume->ReadInstalledVersion() == "1.3.0");
  assert(fixture.PublishedStatus("concourse-ci/0") == "active");
}

} // namespace

int main() {
  TestPrimaryStartsActive();
  TestFollowerWaitsThenRecovers();
  TestIdentityMismatchBlocks();
  TestMatchingIdentityIsAccepted();
  TestPrimaryDrivesUpgradeOnNewTarget();
  TestFollowerRestartedMidUpgradeWaitsForMarker();
  TestFailedUpgradeBlocksUntilRetried();

  std::cout << "artifact_unit_node_agent: pass\n";
  return 0;
}
