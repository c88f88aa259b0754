#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <libxml/parser.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using epg::factory::Build;
using epg::runtime::Server;

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
    std::cerr << "Usage: epg-guide <config.yaml> OR epg-guide --config <config.yaml>" << std::endl;
    return 1;
  }

  // process-wide library state, before any worker thread exists
  xmlInitParser();

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = epg::config::ConfigLoader::LoadFromYaml(config_path);

    epg::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server and sync worker
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.sync->Start();
    EPG_LOG_INFO("epg-guide started", {epg::observability::StringField("bind_address", config.server().bind_address()),
                                       epg::observability::StringField("feed", config.feed().url())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    EPG_LOG_INFO("Shutting down epg-guide");

    server.Stop();
    app.sync->Stop();
  } catch (const std::exception& e) {
    EPG_LOG_ERROR("Fatal error", {epg::observability::StringField("error", e.what())});
    exit_code = 2;
  }

  epg::observability::ShutdownLogging();
  xmlCleanupParser();
  return exit_code;
}
