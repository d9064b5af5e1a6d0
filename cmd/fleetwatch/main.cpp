#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/scheduler/cycle_scheduler.hpp"

using fleetwatch::factory::Build;
using fleetwatch::runtime::Server;

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
    std::cerr << "Usage: fleetwatch <config.yaml> OR fleetwatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fleetwatch::config::ConfigLoader::LoadFromYaml(config_path);

    fleetwatch::observability::InitializeTracing(config);
    fleetwatch::observability::InitializeMetrics(config);
    fleetwatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app       = Build(config);
    auto scheduler = app.context.scheduler;

    // ------------------------------------------------------------
    // Start server and polling
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    if (config.polling().autostart()) {
      scheduler->Start();
    }
    FLEETWATCH_LOG_INFO("fleetwatch started", {fleetwatch::observability::StringField("bind_address", config.server().bind_address()),
                                               fleetwatch::observability::BoolField("polling", config.polling().autostart())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEETWATCH_LOG_INFO("Shutting down fleetwatch");

    // drain the in-flight cycle before the API goes away
    scheduler->Stop();
    server.Stop();
    fleetwatch::observability::ShutdownLogging();
    fleetwatch::observability::ShutdownMetrics();
    fleetwatch::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    FLEETWATCH_LOG_ERROR("Fatal error", {fleetwatch::observability::StringField("error", e.what())});
    fleetwatch::observability::ShutdownLogging();
    fleetwatch::observability::ShutdownMetrics();
    fleetwatch::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
