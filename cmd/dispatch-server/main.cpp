#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

using dispatch::runtime::Server;

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
    std::cerr << "Usage: dispatch-server <config.yaml> OR dispatch-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = dispatch::config::ConfigLoader::LoadFromYaml(config_path);

    dispatch::observability::InitializeLogging(config);
    dispatch::observability::InitializeTelemetry(config);

    // ------------------------------------------------------------
    // Build application (dependency graph, background workers)
    // ------------------------------------------------------------
    auto app = dispatch::factory::Build(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50051") : config.server().bind_address();
    Server     server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    DISPATCH_LOG_INFO("Dispatch core started", {dispatch::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DISPATCH_LOG_INFO("Shutting down dispatch core");

    // closing live connections first lets open event streams return
    dispatch::factory::Shutdown(app);
    server.Stop();

    dispatch::observability::ShutdownTelemetry();
    dispatch::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("Fatal error", {dispatch::observability::StringField("error", e.what())});
    dispatch::observability::ShutdownTelemetry();
    dispatch::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
