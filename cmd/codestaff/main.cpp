#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <variant>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace obs = codestaff::observability;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

// Logs every bus event until the bus closes.
static void RunLogSubscriber(codestaff::bus::Subscription subscription) {
  for (;;) {
    auto result = subscription.Recv();
    if (result.status == codestaff::bus::RecvStatus::Closed) return;

    if (result.status == codestaff::bus::RecvStatus::Lagged) {
      CODESTAFF_LOG_WARN("log subscriber lagged", {obs::IntField("missed", static_cast<int64_t>(result.missed))});
      continue;
    }

    if (const auto* code = std::get_if<codestaff::bus::NewCode>(&result.event)) {
      CODESTAFF_LOG_INFO("bus event", {obs::StringField("event", codestaff::bus::EventName(result.event)), obs::StringField("code", code->code)});
    } else {
      CODESTAFF_LOG_INFO("bus event", {obs::StringField("event", codestaff::bus::EventName(result.event))});
      return;
    }
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: codestaff <config.yaml> OR codestaff --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = codestaff::config::ConfigLoader::LoadFromYaml(config_path);

    obs::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = codestaff::factory::Build(config);

    std::thread log_subscriber(RunLogSubscriber, app.bus->Subscribe());

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    CODESTAFF_LOG_INFO("codestaff started", {obs::StringField("database", config.database().path())});

    while (g_running && app.coordinator->State() == codestaff::coordinator::CoordinatorState::Running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    CODESTAFF_LOG_INFO("shutting down codestaff");

    if (!app.client->Terminate()) {
      CODESTAFF_LOG_WARN("coordinator already stopped");
    }

    try {
      app.coordinator->Wait();
    } catch (...) {
      log_subscriber.join();
      throw;
    }
    log_subscriber.join();

    obs::ShutdownLogging();
  } catch (const std::exception& e) {
    CODESTAFF_LOG_ERROR("Fatal error", {obs::StringField("error", e.what())});
    obs::ShutdownLogging();
    return 2;
  }

  return 0;
}
