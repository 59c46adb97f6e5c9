#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/runtime/server.hpp"

using routebroker::factory::Build;
using routebroker::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  routebroker::observability::ShutdownLogging();
  routebroker::observability::ShutdownMetrics();
  routebroker::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: route-broker <config.yaml> OR route-broker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = routebroker::config::ConfigLoader::LoadFromYaml(config_path);

    routebroker::observability::InitializeTracing(config);
    routebroker::observability::InitializeMetrics(config);
    routebroker::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ROUTEBROKER_LOG_INFO("route broker started",
                         {routebroker::observability::StringField("bind_address", config.server().bind_address()),
                          routebroker::observability::IntField("workers", config.computation_workers().threads())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ROUTEBROKER_LOG_INFO("shutting down route broker");

    server.Stop();
    app.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ROUTEBROKER_LOG_ERROR("Fatal error", {routebroker::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
