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

using meshdispatch::factory::Build;
using meshdispatch::runtime::Server;

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
    std::cerr << "Usage: mesh-dispatch <config.yaml> OR mesh-dispatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = meshdispatch::config::ConfigLoader::LoadFromYaml(config_path);

    meshdispatch::observability::InitializeLogging(config);
    meshdispatch::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    MESHDISPATCH_LOG_INFO("mesh dispatch started", {meshdispatch::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    MESHDISPATCH_LOG_INFO("shutting down mesh dispatch");

    server.Stop();
    app.Stop();
    meshdispatch::observability::ShutdownMetrics();
    meshdispatch::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    MESHDISPATCH_LOG_ERROR("fatal error", {meshdispatch::observability::StringField("error", e.what())});
    meshdispatch::observability::ShutdownMetrics();
    meshdispatch::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
