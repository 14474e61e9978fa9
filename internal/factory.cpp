#include "factory.hpp"

#include <string>
#include <vector>

#include "internal/fetch/artifact_verifier.hpp"
#include "internal/fetch/directory_fetcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/relation/file_relation_store.hpp"
#include "internal/runtime/role_assignment.hpp"
#include "internal/service/systemd_service_manager.hpp"

namespace artifact::factory {

using artifact::observability::StringField;
using artifact::runtime::config::RuntimeConfig;

namespace {

constexpr std::chrono::seconds kDefaultStaleAfter{600};
constexpr std::chrono::seconds kDefaultWaitTimeout{300};
constexpr std::chrono::seconds kDefaultPollInitial{5};
constexpr std::chrono::seconds kDefaultPollMax{20};
constexpr std::chrono::seconds kDefaultReadyTimeout{120};
constexpr std::chrono::seconds kDefaultCompleteGrace{300};
constexpr std::chrono::seconds kDefaultServiceTimeout{30};
constexpr std::chrono::seconds kDefaultReconcileInterval{30};

constexpr const char* kRelationDirName = ".relation";

coordination::StorageCoordinatorOptions MakeStorageOptions(const RuntimeConfig& config) {
  coordination::StorageCoordinatorOptions options;
  options.wait_timeout = util::FromProto(config.coordination().wait_timeout(), kDefaultWaitTimeout);
  options.poll_initial = util::FromProto(config.coordination().poll_initial(), kDefaultPollInitial);
  options.poll_max     = util::FromProto(config.coordination().poll_max(), kDefaultPollMax);
  return options;
}

coordination::UpgradeOptions MakeUpgradeOptions(const RuntimeConfig& config) {
  coordination::UpgradeOptions options;
  options.service_name           = config.service().name();
  options.service_timeout        = util::FromProto(config.service().op_timeout(), kDefaultServiceTimeout);
  options.ready_timeout          = util::FromProto(config.upgrade().ready_timeout(), kDefaultReadyTimeout);
  options.complete_grace_period  = util::FromProto(config.upgrade().complete_grace_period(), kDefaultCompleteGrace);
  options.require_full_consensus = config.upgrade().require_full_consensus();
  options.poll_initial           = util::FromProto(config.coordination().poll_initial(), kDefaultPollInitial);
  options.poll_max               = util::FromProto(config.coordination().poll_max(), kDefaultPollMax);
  return options;
}

} // namespace

std::shared_ptr<storage::SharedVolume> OpenVolume(const RuntimeConfig& config) {
  if (config.shared_storage().enabled()) {
    return std::make_shared<storage::SharedVolume>(storage::SharedVolume::Open(config.shared_storage().root_path()));
  }
  return std::make_shared<storage::SharedVolume>(storage::SharedVolume::OpenLocal(config.shared_storage().local_root_path()));
}

util::Duration ReconcileInterval(const RuntimeConfig& config) {
  return util::FromProto(config.runtime().reconcile_interval(), kDefaultReconcileInterval);
}

RuntimeDependencies BuildRuntime(const RuntimeConfig& config) {
  RuntimeDependencies deps;

  const auto& node_id = config.node().id();
  const auto  role    = coordination::ParseRole(config.node().role());

  deps.clock  = std::make_shared<util::RealClock>();
  deps.volume = OpenVolume(config);
  deps.lock   = std::make_shared<lock::LockCoordinator>(*deps.volume, node_id, util::FromProto(config.lock().stale_after(), kDefaultStaleAfter),
                                                       deps.clock);

  // ------------------------------------------------------------
  // Relation channel
  // ------------------------------------------------------------
  const std::filesystem::path relation_dir =
      config.relation().directory().empty() ? deps.volume->root_path() / kRelationDirName : std::filesystem::path(config.relation().directory());
  deps.relation = std::make_shared<relation::FileRelationStore>(relation_dir, node_id, role == coordination::NodeRole::kPrimary);

  // ------------------------------------------------------------
  // Service manager
  // ------------------------------------------------------------
  deps.services = std::make_shared<service::SystemdServiceManager>(
      config.service().systemctl_path().empty() ? std::string("systemctl") : config.service().systemctl_path());

  // ------------------------------------------------------------
  // Artifacts
  // ------------------------------------------------------------
  fetch::ArtifactFetcherPtr fetcher;
  if (!config.artifact().source_dir().empty()) {
    fetcher = std::make_shared<fetch::DirectoryArtifactFetcher>(config.artifact().source_dir());
  }

  std::vector<std::string> required(config.artifact().required_binaries().begin(), config.artifact().required_binaries().end());
  fetch::ArtifactVerifier  verifier(std::move(required), config.artifact().require_checksum_manifest());

  deps.storage  = std::make_shared<coordination::StorageCoordinator>(deps.volume, deps.lock, std::move(fetcher), std::move(verifier), node_id,
                                                                    deps.clock, MakeStorageOptions(config));
  deps.upgrades = std::make_shared<coordination::UpgradeCoordinator>(deps.relation, deps.storage, deps.services, deps.clock, MakeUpgradeOptions(config));

  runtime::NodeAgentOptions agent_options;
  agent_options.target_version         = config.coordination().target_version();
  agent_options.expected_filesystem_id = config.shared_storage().expected_filesystem_id();

  deps.agent = std::make_shared<runtime::NodeAgent>(deps.volume, std::make_shared<runtime::StaticRoleAssignment>(role), deps.storage, deps.upgrades,
                                                    deps.relation, std::move(agent_options));

  ARTIFACT_LOG_INFO("Runtime built", {StringField("node", node_id), StringField("role", coordination::RoleName(role)),
                                      StringField("relation", relation_dir.string())});
  return deps;
}

} // namespace artifact::factory
