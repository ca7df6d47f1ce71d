#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using fieldgate::observability::StringField;
using fieldgate::runtime::Server;

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
    std::cerr << "Usage: fieldgated <config.yaml> OR fieldgated --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fieldgate::config::ConfigLoader::LoadFromYaml(config_path);

    fieldgate::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fieldgate::factory::Build(config);

    Server server(config.server().bind_address(), app->grpc_services);

    // Register signal handlers before starting to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app->Start();
    FIELDGATE_LOG_INFO("fieldgate started", {StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FIELDGATE_LOG_INFO("shutting down fieldgate");

    app->Stop();
    server.Stop();
    fieldgate::observability::ShutdownLogging();
  } catch (const fieldgate::util::InvalidConfig& e) {
    std::cerr << "invalid configuration: " << e.what() << std::endl;
    fieldgate::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    FIELDGATE_LOG_ERROR("fatal error", {StringField("error", e.what())});
    fieldgate::observability::ShutdownLogging();
    return 3;
  }

  return 0;
}
