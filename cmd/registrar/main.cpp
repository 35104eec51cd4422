#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

void PrintUsage() {
  std::cerr << "Usage: registrar [--check-config] [--config] <config.yaml>\n"
               "       registrar --version\n";
}

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (options.config_path.empty()) return std::nullopt;
  return options;
}

void ShutdownObservability() {
  registrar::observability::ShutdownLogging();
  registrar::observability::ShutdownMetrics();
  registrar::observability::ShutdownTracing();
}

void PrintConfigSummary(const registrar::runtime::config::RuntimeConfig& config) {
  std::cout << "bind_address=" << config.server().bind_address() << " backend="
            << (config.database().has_sqlite() ? "sqlite:" + config.database().sqlite().path() : std::string("memory"))
            << " max_allocation_retries=" << config.identity().max_allocation_retries() << "\n";
}

} // namespace

int main(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) == "--version") {
    std::cout << "registrar 0.1.0\n";
    return 0;
  }

  const auto options = ParseArgs(argc, argv);
  if (!options) {
    PrintUsage();
    return 1;
  }

  try {
    const auto config = registrar::config::ConfigLoader::LoadFromYaml(options->config_path);
    if (options->check_only) {
      PrintConfigSummary(config);
      return 0;
    }

    registrar::observability::InitializeTracing(config);
    registrar::observability::InitializeMetrics(config);
    registrar::observability::InitializeLogging(config);

    auto app = registrar::factory::Build(config);

    registrar::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services),
                                      std::chrono::milliseconds(config.server().shutdown_grace_ms()));

    // handlers go in before Start() so an early SIGTERM is not lost
    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    server.Start();
    REGISTRAR_LOG_INFO("Registrar started", {registrar::observability::StringField("config", options->config_path),
                                             registrar::observability::StringField("backend", app.repository->BackendName()),
                                             registrar::observability::IntField("max_allocation_retries",
                                                                                config.identity().max_allocation_retries())});

    while (!g_stop_requested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    REGISTRAR_LOG_INFO("Shutting down registrar");
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    REGISTRAR_LOG_ERROR("Fatal error", {registrar::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
