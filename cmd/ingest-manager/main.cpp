#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

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
    std::cerr << "Usage: ingest-manager <config.yaml> OR ingest-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ingest::config::ConfigLoader::LoadFromYaml(config_path);

    ingest::observability::InitializeTracing(config);
    ingest::observability::InitializeMetrics(config);
    ingest::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = ingest::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    INGEST_LOG_INFO("Ingest Manager started",
                    {ingest::observability::IntField("accept_workers", config.queue().accept_workers()),
                     ingest::observability::IntField("processing_workers", config.queue().processing_workers()),
                     ingest::observability::BoolField("media", app.router->HasMedia()),
                     ingest::observability::BoolField("backup", app.router->BackupEnabled())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    INGEST_LOG_INFO("Shutting down ingest manager");

    app.Stop();
    ingest::observability::ShutdownLogging();
    ingest::observability::ShutdownMetrics();
    ingest::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    INGEST_LOG_ERROR("Fatal error", {ingest::observability::StringField("error", e.what())});
    ingest::observability::ShutdownLogging();
    ingest::observability::ShutdownMetrics();
    ingest::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
