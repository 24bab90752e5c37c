#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

using tsbatch::factory::Build;
using tsbatch::runtime::Server;

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
    std::cerr << "Usage: tsbatch <config.yaml> OR tsbatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tsbatch::config::ConfigLoader::LoadFromYaml(config_path);

    tsbatch::observability::InitializeMetrics(config);
    tsbatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);
    app.pipeline->Start();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TSBATCH_LOG_INFO("tsbatch started", {tsbatch::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TSBATCH_LOG_INFO("Shutting down tsbatch");

    // Stop intake first so the final flush sees every accepted record.
    server.Stop();
    app.pipeline->Shutdown();

    tsbatch::observability::ShutdownLogging();
    tsbatch::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    TSBATCH_LOG_ERROR("Fatal error", {tsbatch::observability::StringField("error", e.what())});
    tsbatch::observability::ShutdownLogging();
    tsbatch::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
