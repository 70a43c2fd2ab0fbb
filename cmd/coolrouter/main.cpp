#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/events/event_hub.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/application.hpp"
#include "internal/runtime/server.hpp"

using coolrouter::runtime::Build;
using coolrouter::runtime::Server;

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
    std::cerr << "Usage: coolrouter <config.yaml> OR coolrouter --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = coolrouter::config::ConfigLoader::LoadFromYaml(config_path);

    coolrouter::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app    = Build(config);
    auto events = app.core.events;

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    COOLROUTER_LOG_INFO("coolrouter started", {coolrouter::observability::IntField("port", server.Port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    COOLROUTER_LOG_INFO("Shutting down coolrouter");

    // Wake streaming subscribers before the server drains.
    events->Close();
    server.Stop();
    coolrouter::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    COOLROUTER_LOG_ERROR("Fatal error", {coolrouter::observability::StringField("error", e.what())});
    coolrouter::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
