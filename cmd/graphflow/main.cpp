#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/graph_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using graphflow::runtime::Server;

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
    std::cerr << "Usage: graphflow <config.yaml> OR graphflow --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = graphflow::config::ConfigLoader::LoadFromYaml(config_path);

    graphflow::observability::InitializeTracing(config);
    graphflow::observability::InitializeMetrics(config);
    graphflow::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = graphflow::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), graphflow::grpc::BuildServices(app.graph_service));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    GRAPHFLOW_LOG_INFO("graphflow started", {graphflow::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    GRAPHFLOW_LOG_INFO("Shutting down graphflow");

    server.Stop();
    graphflow::observability::ShutdownLogging();
    graphflow::observability::ShutdownMetrics();
    graphflow::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    GRAPHFLOW_LOG_ERROR("Fatal error", {graphflow::observability::StringField("error", e.what())});
    graphflow::observability::ShutdownLogging();
    graphflow::observability::ShutdownMetrics();
    graphflow::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
