#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/rule_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using alarmsrv::runtime::Server;

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
    std::cerr << "Usage: alarmsrv <config.yaml> OR alarmsrv --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = alarmsrv::config::ConfigLoader::LoadFromYaml(config_path);

    alarmsrv::observability::InitializeLogging(config);

    if (config.has_message_bus()) {
      ALARMSRV_LOG_INFO("Message bus configured", {alarmsrv::observability::StringField("host", config.message_bus().host()),
                                                   alarmsrv::observability::IntField("port", config.message_bus().port()),
                                                   alarmsrv::observability::StringField("prefix", config.message_bus().prefix())});
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto deps = alarmsrv::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<alarmsrv::grpc::RuleServer>(deps.rule_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address();
    Server            server(bind_address, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ALARMSRV_LOG_INFO("alarmsrv started", {alarmsrv::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ALARMSRV_LOG_INFO("Shutting down alarmsrv");

    server.Stop();
    alarmsrv::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ALARMSRV_LOG_ERROR("Fatal error", {alarmsrv::observability::StringField("error", e.what())});
    alarmsrv::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
