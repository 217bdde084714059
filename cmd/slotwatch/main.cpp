#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using slotwatch::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  slotwatch::observability::ShutdownLogging();
  slotwatch::observability::ShutdownMetrics();
  slotwatch::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: slotwatch <config.yaml> OR slotwatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = slotwatch::config::ConfigLoader::LoadFromYaml(config_path);
    slotwatch::config::ConfigLoader::ApplyDefaults(config);

    slotwatch::observability::InitializeTracing(config);
    slotwatch::observability::InitializeMetrics(config);
    slotwatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = slotwatch::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.supervisor->StartAll();
    SLOTWATCH_LOG_INFO("slotwatch started", {slotwatch::observability::IntField("users", static_cast<std::int64_t>(app.supervisor->size()))});

    // ------------------------------------------------------------
    // Optional admin server
    // ------------------------------------------------------------
    std::unique_ptr<Server> server;
    if (!config.server().bind_address().empty()) {
      server = std::make_unique<Server>(config.server().bind_address(), std::move(app.grpc_services));
      server->Start();
    }

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SLOTWATCH_LOG_INFO("Shutting down slotwatch");

    app.supervisor->Shutdown("Monitoring stopped");
    app.sessions->CloseAll();
    if (server) server->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    SLOTWATCH_LOG_ERROR("Fatal error", {slotwatch::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
