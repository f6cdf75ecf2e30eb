#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#if TASKORCH_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownTelemetry() {
  taskorch::observability::ShutdownLogging();
  taskorch::observability::ShutdownMetrics();
  taskorch::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: taskorchd <config.yaml> OR taskorchd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = taskorch::config::ConfigLoader::LoadFromYaml(config_path);

    taskorch::observability::InitializeTracing(config);
    taskorch::observability::InitializeMetrics(config);
    taskorch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = taskorch::factory::Build(config);

    // Register signal handlers before anything starts to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();

#if TASKORCH_WITH_GRPC
    std::unique_ptr<taskorch::runtime::Server> server;
    if (config.server().enabled()) {
      const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();
      server = std::make_unique<taskorch::runtime::Server>(bind_address, std::move(app.grpc_services));
      server->Start();
    }
#endif

    TASKORCH_LOG_INFO("taskorchd started", {taskorch::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TASKORCH_LOG_INFO("shutting down taskorchd");

#if TASKORCH_WITH_GRPC
    if (server) server->Stop();
#endif
    app.Shutdown();
    ShutdownTelemetry();
  } catch (const std::exception& e) {
    TASKORCH_LOG_ERROR("fatal error", {taskorch::observability::StringField("error", e.what())});
    ShutdownTelemetry();
    return 2;
  }

  return 0;
}
