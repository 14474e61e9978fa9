#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using artifact::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: artifact-coordinator <config.yaml> OR artifact-coordinator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = artifact::config::ConfigLoader::LoadFromYaml(config_path);

    artifact::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build node (dependency graph)
    // ------------------------------------------------------------
    auto deps = artifact::factory::BuildRuntime(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto status = deps.agent->Start();
    ARTIFACT_LOG_INFO("Artifact coordinator started", {StringField("node", config.node().id()), StringField("status", artifact::runtime::StatusName(status))});

    // ------------------------------------------------------------
    // Reconcile loop
    // ------------------------------------------------------------
    const auto interval = artifact::factory::ReconcileInterval(config);
    auto       next     = std::chrono::steady_clock::now() + interval;

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (std::chrono::steady_clock::now() < next) continue;

      deps.agent->Reconcile();
      next = std::chrono::steady_clock::now() + interval;
    }

    ARTIFACT_LOG_INFO("Shutting down artifact coordinator", {StringField("node", config.node().id())});
    artifact::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ARTIFACT_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    artifact::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
