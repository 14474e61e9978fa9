#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/coordination/storage_coordinator.hpp"
#include "internal/coordination/upgrade_coordinator.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/relation/relation_data_accessor.hpp"
#include "internal/runtime/node_agent.hpp"
#include "internal/service/service_manager.hpp"
#include "internal/storage/shared_volume.hpp"
#include "internal/util/time.hpp"

namespace artifact::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects of one node process.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<util::Clock>                      clock;
  std::shared_ptr<storage::SharedVolume>            volume;
  std::shared_ptr<lock::LockCoordinator>            lock;
  relation::RelationDataAccessorPtr                 relation;
  service::ServiceManagerPtr                        services;
  std::shared_ptr<coordination::StorageCoordinator> storage;
  std::shared_ptr<coordination::UpgradeCoordinator> upgrades;
  std::shared_ptr<runtime::NodeAgent>               agent;
};

/*
  BuildRuntime

  Composition root. The only place that knows the concrete fetcher,
  service manager and relation channel types.
*/
RuntimeDependencies BuildRuntime(const artifact::runtime::config::RuntimeConfig& config);

// Shared or local volume depending on shared_storage.enabled.
std::shared_ptr<storage::SharedVolume> OpenVolume(const artifact::runtime::config::RuntimeConfig& config);

util::Duration ReconcileInterval(const artifact::runtime::config::RuntimeConfig& config);

} // namespace artifact::factory
