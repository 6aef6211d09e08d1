#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/startup_reconciler.hpp"

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
    std::cerr << "Usage: avatar-pool <config.yaml> OR avatar-pool --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = avatarpool::config::ConfigLoader::LoadFromYaml(config_path);

    avatarpool::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = avatarpool::factory::Build(config);

    // Register signal handlers before starting background work.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (app.startup_reconciler) {
      app.startup_reconciler->Start();
    } else {
      AVATARPOOL_LOG_INFO("Startup reconciliation disabled");
    }

    AVATARPOOL_LOG_INFO("Avatar pool started", {avatarpool::observability::StringField("pool", config.pool().directory()),
                                                avatarpool::observability::StringField("profiles", config.profiles().root())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    AVATARPOOL_LOG_INFO("Shutting down avatar pool");

    if (app.startup_reconciler) {
      app.startup_reconciler->Stop();
    }
    avatarpool::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    AVATARPOOL_LOG_ERROR("Fatal error", {avatarpool::observability::StringField("error", e.what())});
    avatarpool::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
