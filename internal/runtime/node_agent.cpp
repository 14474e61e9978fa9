#include "node_agent.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace artifact::runtime {

using artifact::coordination::NodeRole;
using artifact::coordination::UpgradePhase;
using artifact::observability::StringField;

std::string_view StatusName(NodeStatus status) {
  switch (status) {
    case NodeStatus::kActive:
      return "active";
    case NodeStatus::kWaiting:
      return "waiting";
    case NodeStatus::kBlocked:
      return "blocked";
    case NodeStatus::kUnknown:
      break;
  }
  return "unknown";
}

NodeAgent::NodeAgent(std::shared_ptr<storage::SharedVolume> volume, RoleAssignmentPtr roles, std::shared_ptr<coordination::StorageCoordinator> storage,
                     std::shared_ptr<coordination::UpgradeCoordinator> upgrades, relation::RelationDataAccessorPtr relation, NodeAgentOptions options)
    : volume_(std::move(volume)),
      roles_(std::move(roles)),
      storage_(std::move(storage)),
      upgrades_(std::move(upgrades)),
      relation_(std::move(relation)),
      options_(std::move(options)) {
}

NodeStatus NodeAgent::Publish(NodeStatus status, std::string detail) {
  const bool changed = status != status_ || detail != detail_;
  status_            = status;
  detail_            = std::move(detail);

  relation_->SetUnitData(coordination::keys::kNodeStatus, std::string(StatusName(status_)));

  if (changed) {
    const auto level = status_ == NodeStatus::kBlocked   ? spdlog::level::err
                       : status_ == NodeStatus::kWaiting ? spdlog::level::warn
                                                         : spdlog::level::info;
    observability::Log(level, "Node status",
                       {StringField("node", relation_->local_unit()), StringField("status", StatusName(status_)), StringField("detail", detail_)});
  }
  return status_;
}

void NodeAgent::ValidateVolume() const {
  const auto identity = volume_->filesystem_identity().ToString();

  if (!options_.expected_filesystem_id.empty() && !volume_->MatchesIdentity(options_.expected_filesystem_id)) {
    ARTIFACT_LOG_ERROR("Shared volume identity mismatch", {StringField("node", relation_->local_unit()), StringField("expected", options_.expected_filesystem_id),
                                                          StringField("actual", identity)});
    throw util::StorageNotMounted("volume at " + volume_->root_path().string() + " is " + identity + ", expected " + options_.expected_filesystem_id);
  }
  if (!volume_->IsWritable()) {
    ARTIFACT_LOG_WARN("Shared volume is not writable", {StringField("node", relation_->local_unit()), StringField("root", volume_->root_path().string())});
  }

  ARTIFACT_LOG_INFO("Shared volume", {StringField("node", relation_->local_unit()), StringField("root", volume_->root_path().string()),
                                      StringField("identity", identity), StringField("mode", volume_->shared() ? "shared" : "local")});
}

NodeStatus NodeAgent::InitializeStorage(bool wait) {
  try {
    const auto result = role_ == NodeRole::kFollower && !wait ? storage_->RunFollower(options_.target_version, util::Duration::zero())
                                                              : storage_->Initialize(options_.target_version, role_);
    return Publish(NodeStatus::kActive, "version " + result.installed_version);
  } catch (const util::ArtifactWaitTimeout& e) {
    return Publish(NodeStatus::kWaiting, e.what());
  }
}

// ------------------------------------------------------------
// Start
// ------------------------------------------------------------

NodeStatus NodeAgent::Start() {
  role_ = roles_->Resolve();
  ARTIFACT_LOG_INFO("Node starting", {StringField("node", relation_->local_unit()), StringField("role", coordination::RoleName(role_)),
                                      StringField("target", options_.target_version)});

  try {
    ValidateVolume();

    if (role_ == NodeRole::kPrimary) {
      // A changed target on an installed volume is an upgrade, not a first install.
      const auto installed = volume_->ReadInstalledVersion();
      const auto phase     = upgrades_->CurrentState().phase;
      if (phase != UpgradePhase::kIdle ||
          (installed != storage::SharedVolume::kNoVersion && installed != options_.target_version)) {
        return ReconcilePrimary();
      }
    }
    return InitializeStorage(true);
  } catch (const std::exception& e) {
    Publish(NodeStatus::kBlocked, e.what());
    throw;
  }
}

// ------------------------------------------------------------
// Reconcile
// ------------------------------------------------------------

NodeStatus NodeAgent::Reconcile() {
  try {
    return role_ == NodeRole::kPrimary ? ReconcilePrimary() : ReconcileFollower();
  } catch (const std::exception& e) {
    return Publish(NodeStatus::kBlocked, e.what());
  }
}

NodeStatus NodeAgent::RunUpgrade(const std::string& target_version) {
  try {
    const auto state = upgrades_->RunPrimaryUpgrade(target_version);
    return Publish(NodeStatus::kActive, "version " + state.target_version);
  } catch (const util::UpgradeTimeout& e) {
    // Phase stays at PREPARE; the next tick resumes the wait.
    return Publish(NodeStatus::kWaiting, e.what());
  }
}

NodeStatus NodeAgent::ReconcilePrimary() {
  const auto state = upgrades_->CurrentState();

  switch (state.phase) {
    case UpgradePhase::kDownloading:
      return Publish(NodeStatus::kBlocked, "upgrade to " + state.target_version + " stopped in phase downloading; run retry-upgrade");

    case UpgradePhase::kComplete:
      upgrades_->MaybeResetAfterComplete();
      return status_ == NodeStatus::kActive ? status_ : InitializeStorage(true);

    case UpgradePhase::kPrepare:
      return RunUpgrade(state.target_version);

    case UpgradePhase::kIdle:
      break;
  }

  const auto installed = volume_->ReadInstalledVersion();
  if (installed == options_.target_version || installed == storage::SharedVolume::kNoVersion) {
    if (status_ != NodeStatus::kActive) {
      return InitializeStorage(true);
    }
    return status_;
  }
  return RunUpgrade(options_.target_version);
}

NodeStatus NodeAgent::ReconcileFollower() {
  const auto action = upgrades_->OnRelationChanged();
  if (action == coordination::FollowerAction::kStarted) {
    return Publish(NodeStatus::kActive, "version " + upgrades_->CurrentState().target_version);
  }

  const auto phase = upgrades_->CurrentState().phase;
  if (status_ != NodeStatus::kActive && (phase == UpgradePhase::kIdle || phase == UpgradePhase::kComplete)) {
    return InitializeStorage(false);
  }
  return status_;
}

} // namespace artifact::runtime
