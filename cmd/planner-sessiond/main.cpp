#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/daemon/build_info.hpp"
#include "internal/daemon/port_file.hpp"
#include "internal/daemon/session_registry.hpp"
#include "internal/daemon/shutdown_signal.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using planner::factory::Build;
using planner::observability::IntField;
using planner::observability::StringField;
using planner::runtime::JoinHostPort;
using planner::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownTelemetry() {
  planner::observability::ShutdownLogging();
  planner::observability::ShutdownMetrics();
  planner::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: planner-sessiond [--config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? planner::config::ConfigLoader::Defaults() : planner::config::ConfigLoader::LoadFromYaml(config_path);

    planner::observability::InitializeTracing(config);
    planner::observability::InitializeMetrics(config);
    planner::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    const auto& bind_host = config.daemon().bind_host();
    Server      server(JoinHostPort(bind_host, config.daemon().port()), std::move(app.grpc_services));
    Server      subscriber_server(JoinHostPort(bind_host, config.daemon().subscriber_port()), std::move(app.subscriber_services));

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    subscriber_server.Start();

    // ------------------------------------------------------------
    // Discovery files
    // ------------------------------------------------------------
    planner::daemon::WriteTextFile(app.paths.PidFile(), std::to_string(::getpid()) + "\n");
    planner::daemon::WriteTextFile(app.paths.ShaFile(), planner::daemon::BuildSha() + "\n");

    planner::v1::PortFile port_file;
    port_file.set_port(static_cast<std::uint32_t>(server.port()));
    port_file.set_subscriber_port(static_cast<std::uint32_t>(subscriber_server.port()));
    port_file.set_token(app.token);
    planner::daemon::WritePortFile(app.paths.PortFile(), port_file);

    PLANNER_LOG_INFO("Session daemon started", {StringField("bind_host", bind_host), IntField("port", server.port()),
                                                IntField("subscriber_port", subscriber_server.port()),
                                                StringField("build_sha", planner::daemon::BuildSha()),
                                                StringField("home", app.paths.home.string())});

    while (g_running && !app.shutdown->WaitFor(std::chrono::milliseconds(500))) {
    }

    PLANNER_LOG_INFO("Shutting down session daemon", {StringField("reason", app.shutdown->Triggered() ? "rpc" : "signal")});

    app.registry->MarkShuttingDown();
    server.Stop();
    subscriber_server.Stop();
    app.Stop();

    planner::daemon::RemoveIfExists(app.paths.PortFile());
    planner::daemon::RemoveIfExists(app.paths.PidFile());

    ShutdownTelemetry();
  } catch (const std::exception& e) {
    PLANNER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownTelemetry();
    return 2;
  }

  return 0;
}
