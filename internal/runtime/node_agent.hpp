#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/coordination/storage_coordinator.hpp"
#include "internal/coordination/upgrade_coordinator.hpp"
#include "internal/relation/relation_data_accessor.hpp"
#include "internal/runtime/role_assignment.hpp"
#include "internal/storage/shared_volume.hpp"

namespace artifact::runtime {

enum class NodeStatus : std::uint8_t {
  kUnknown,
  kActive,
  kWaiting,  // artifacts not there yet, retried on the next reconcile
  kBlocked,  // needs an operator
};

std::string_view StatusName(NodeStatus status);

struct NodeAgentOptions {
  std::string target_version;
  std::string expected_filesystem_id;
};

/*
  Per-process driver.

  Start() runs once: resolves the role, checks the volume and initializes
  shared storage. Reconcile() runs on every tick: the primary drives upgrade
  cycles, followers react to the current phase and retry a timed-out wait.

  The resulting status is published as this unit's "node-status".
*/
class NodeAgent {
 public:
  NodeAgent(std::shared_ptr<storage::SharedVolume> volume, RoleAssignmentPtr roles, std::shared_ptr<coordination::StorageCoordinator> storage,
            std::shared_ptr<coordination::UpgradeCoordinator> upgrades, relation::RelationDataAccessorPtr relation, NodeAgentOptions options);

  // Fatal errors are published as blocked and rethrown.
  NodeStatus Start();

  // Never throws for coordination failures; they end up in the status.
  NodeStatus Reconcile();

  NodeStatus status() const {
    return status_;
  }
  const std::string& status_detail() const {
    return detail_;
  }
  coordination::NodeRole role() const {
    return role_;
  }

 private:
  void       ValidateVolume() const;
  // wait=false: a follower checks the marker once instead of polling.
  NodeStatus InitializeStorage(bool wait);
  NodeStatus ReconcilePrimary();
  NodeStatus ReconcileFollower();
  NodeStatus RunUpgrade(const std::string& target_version);
  NodeStatus Publish(NodeStatus status, std::string detail);

  std::shared_ptr<storage::SharedVolume>            volume_;
  RoleAssignmentPtr                                 roles_;
  std::shared_ptr<coordination::StorageCoordinator> storage_;
  std::shared_ptr<coordination::UpgradeCoordinator> upgrades_;
  relation::RelationDataAccessorPtr                 relation_;
  NodeAgentOptions                                  options_;

  coordination::NodeRole role_   = coordination::NodeRole::kFollower;
  NodeStatus             status_ = NodeStatus::kUnknown;
  std::string            detail_;
};

} // namespace artifact::runtime
