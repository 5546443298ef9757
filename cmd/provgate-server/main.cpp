#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/audit_server.hpp"
#include "internal/grpc/review_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/audit_service.hpp"
#include "internal/service/review_service.hpp"

using provgate::runtime::Server;

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
    std::cerr << "Usage: provgate-server <config.yaml> OR provgate-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration and policy
    // ------------------------------------------------------------
    auto config = provgate::config::ConfigLoader::LoadFromYaml(config_path);
    provgate::observability::InitializeLogging(config);

    if (config.policy_path().empty()) {
      throw std::runtime_error("policy_path is required");
    }
    auto policy = provgate::config::ConfigLoader::LoadPolicyFromYaml(config.policy_path());

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto app = provgate::factory::Build(config, policy);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<provgate::grpc::AuditServer>(std::make_shared<provgate::service::AuditService>(app.Services())));
    services.push_back(std::make_unique<provgate::grpc::ReviewServer>(std::make_shared<provgate::service::ReviewService>(app.Services())));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PROVGATE_LOG_INFO("provgate started", {provgate::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PROVGATE_LOG_INFO("Shutting down provgate");

    server.Stop();
    app.Shutdown();
    provgate::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PROVGATE_LOG_ERROR("Fatal error", {provgate::observability::StringField("error", e.what())});
    provgate::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
