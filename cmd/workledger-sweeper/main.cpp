#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lease/lock_sweeper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Shutdown() {
  workledger::observability::ShutdownLogging();
  workledger::observability::ShutdownMetrics();
  workledger::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: workledger-sweeper <config.yaml> OR workledger-sweeper --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = workledger::config::ConfigLoader::LoadFromYaml(config_path);

    workledger::observability::InitializeTracing(config);
    workledger::observability::InitializeMetrics(config);
    workledger::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = workledger::factory::Build(config);

    // Register signal handlers before starting the sweeper to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.sweeper->Start();
    WORKLEDGER_LOG_INFO("workledger sweeper running",
                        {workledger::observability::UintField("lock_timeout_sec", workledger::config::LockTimeoutSec(config)),
                         workledger::observability::UintField("sweep_interval_sec", workledger::config::SweepIntervalSec(config))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    WORKLEDGER_LOG_INFO("shutting down workledger sweeper");
    app.sweeper->Stop();
    Shutdown();
  } catch (const std::exception& e) {
    WORKLEDGER_LOG_ERROR("fatal error", {workledger::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
