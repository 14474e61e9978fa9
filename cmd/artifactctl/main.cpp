#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/coordination/upgrade_state.hpp"
#include "internal/factory.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/relation/file_relation_store.hpp"
#include "internal/storage/worker_directory.hpp"
#include "internal/util/time.hpp"

namespace config_ns = artifact::runtime::config;

static void Usage() {
  std::cout << "Usage:\n"
            << "  artifactctl <config.yaml> identity\n"
            << "  artifactctl <config.yaml> version\n"
            << "  artifactctl <config.yaml> stats\n"
            << "  artifactctl <config.yaml> lock\n"
            << "  artifactctl <config.yaml> upgrade-state\n"
            << "  artifactctl <config.yaml> worker-state <owner_id>\n"
            << "  artifactctl <config.yaml> retry-upgrade\n";
}

static std::filesystem::path RelationDir(const config_ns::RuntimeConfig& config, const artifact::storage::SharedVolume& volume) {
  if (!config.relation().directory().empty()) {
    return config.relation().directory();
  }
  return volume.root_path() / ".relation";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = artifact::config::ConfigLoader::LoadFromYaml(config_path);
    artifact::observability::InitializeLogging(config, artifact::observability::LogTarget::kStderr);

    auto volume = artifact::factory::OpenVolume(config);

    // ------------------------------------------------------------

    if (cmd == "identity") {
      std::cout << volume->filesystem_identity().ToString() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "version") {
      std::cout << volume->ReadInstalledVersion() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      const auto stats = volume->CollectStats();
      std::cout << "root=" << volume->root_path().string() << "\n"
                << "mode=" << (volume->shared() ? "shared" : "local") << "\n"
                << "installed_version=" << volume->ReadInstalledVersion() << "\n"
                << "disk_usage_bytes=" << stats.disk_usage_bytes << "\n"
                << "artifact_count=" << stats.artifact_count << "\n"
                << "worker_count=" << stats.worker_count << "\n"
                << "provisioned=" << (stats.provisioned ? "true" : "false") << "\n"
                << "writable=" << (volume->IsWritable() ? "true" : "false") << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "lock") {
      auto clock = std::make_shared<artifact::util::RealClock>();
      artifact::lock::LockCoordinator lock(*volume, config.node().id(),
                                           artifact::util::FromProto(config.lock().stale_after(), std::chrono::seconds(600)), clock);

      const auto marker = lock.ReadProgressMarker();
      if (!marker) {
        std::cout << "download_in_progress=false\n";
        return 0;
      }
      const auto age = lock.ProgressMarkerAge();
      std::cout << "download_in_progress=true\n"
                << "holder=" << marker->holder_id << "\n"
                << "version=" << marker->version << "\n"
                << "age=" << artifact::util::FormatDuration(age.value_or(artifact::util::Duration::zero())) << "\n"
                << "stale=" << (lock.IsStale() ? "true" : "false") << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "upgrade-state") {
      // Read-only: never the leader.
      artifact::relation::FileRelationStore relation(RelationDir(config, *volume), config.node().id(), false);

      const auto state = artifact::coordination::UpgradeState::FromRelationData(relation.GetApplicationBag());
      std::cout << state.DebugString() << "\n";
      if (state.timestamp) {
        std::cout << "timestamp=" << artifact::util::FormatTimestamp(*state.timestamp) << "\n";
      }
      for (const auto& unit : relation.GetAllUnits()) {
        const auto bag = relation.GetUnitBag(unit);
        auto       get = [&](const char* key) {
          auto it = bag.find(key);
          return it == bag.end() ? std::string("-") : it->second;
        };
        std::cout << unit << " status=" << get(artifact::coordination::keys::kNodeStatus)
                  << " ready=" << get(artifact::coordination::keys::kUpgradeReady)
                  << " ready_cycle=" << get(artifact::coordination::keys::kReadyCycle) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "worker-state") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto worker = artifact::storage::WorkerDirectory::OpenReadOnly(*volume, argv[3]);
      if (!worker.Exists()) {
        std::cerr << "no worker directory for " << argv[3] << "\n";
        return 2;
      }

      const auto state = worker.ReadState();
      std::cout << "owner=" << state.owner_id() << "\n";
      if (state.has_updated_at()) {
        std::cout << "updated_at=" << artifact::util::FormatTimestamp(artifact::util::FromProto(state.updated_at())) << "\n";
      }
      for (const auto& [key, value] : state.entries()) {
        std::cout << key << "=" << value << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "retry-upgrade") {
      auto deps  = artifact::factory::BuildRuntime(config);
      auto state = deps.upgrades->RetryUpgrade();
      std::cout << state.DebugString() << "\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
