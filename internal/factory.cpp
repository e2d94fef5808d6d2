#include "factory.hpp"

#include <chrono>

#include "internal/daemon/build_info.hpp"
#include "internal/daemon/file_access.hpp"
#include "internal/daemon/liveness_sweeper.hpp"
#include "internal/daemon/session_registry.hpp"
#include "internal/daemon/shutdown_signal.hpp"
#include "internal/daemon/subscriber_notifier.hpp"
#include "internal/daemon/upstream_link.hpp"
#include "internal/grpc/daemon_server.hpp"
#include "internal/grpc/file_server.hpp"
#include "internal/grpc/subscription_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/daemon_service.hpp"
#include "internal/service/file_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/subscription_service.hpp"
#include "internal/util/uuid.hpp"

namespace planner::factory {

namespace {

constexpr std::size_t kTokenLength = 32;

} // namespace

void Application::Stop() {
  if (upstream) upstream->Stop();
  if (sweeper) sweeper->Stop();
  if (notifier) notifier->Stop();
  if (registry) {
    try {
      registry->Persist();
    } catch (const std::exception& e) {
      PLANNER_LOG_ERROR("Final registry persist failed", {observability::StringField("error", e.what())});
    }
  }
}

/*
    Build full daemon dependency graph
*/
Application Build(const planner::runtime::config::RuntimeConfig& config) {
  Application app;
  app.paths = daemon::ResolvePaths(config);
  app.token = util::RandomAlphanumeric(kTokenLength);

  const auto& daemon_config = config.daemon();

  // ------------------------------------------------------------------
  // Registry
  // ------------------------------------------------------------------
  const std::int64_t unresponsive = daemon_config.unresponsive_timeout_secs();
  const std::int64_t stale        = daemon_config.stale_timeout_secs();

  app.registry = std::make_shared<daemon::SessionRegistry>(app.paths.RegistryFile(), daemon::BuildSha(),
                                                           [unresponsive, stale] { return daemon::ReadThresholds(unresponsive, stale); });
  app.registry->Load();

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  app.notifier = std::make_shared<daemon::SubscriberNotifier>(std::chrono::milliseconds(daemon_config.callback_timeout_ms()),
                                                              std::chrono::seconds(daemon_config.subscriber_ping_interval_secs()));
  app.notifier->Start();

  const auto target = daemon::ResolveUpstreamTarget(daemon_config.upstream());
  if (target) {
    const auto&                  upstream_config = daemon_config.upstream();
    daemon::UpstreamLink::Options options;
    options.call_timeout       = std::chrono::milliseconds(daemon_config.callback_timeout_ms());
    options.heartbeat_interval = std::chrono::seconds(upstream_config.heartbeat_interval_secs());
    options.initial_backoff    = std::chrono::milliseconds(upstream_config.initial_backoff_ms());
    options.max_backoff        = std::chrono::milliseconds(upstream_config.max_backoff_ms());

    std::weak_ptr<daemon::SessionRegistry> registry = app.registry;
    auto                                   snapshot = [registry] {
      auto r = registry.lock();
      return r ? r->Records() : std::vector<v1::SessionRecord>{};
    };
    app.upstream = std::make_shared<daemon::UpstreamLink>(*target, daemon::LocalContainerInfo(), snapshot, options);
    app.upstream->Start();
    PLANNER_LOG_INFO("Host aggregator link enabled", {observability::StringField("host", target->host), observability::IntField("port", target->port)});
  }

  // registry changes reach subscribers through the notifier worker, and
  // the host aggregator through the upstream link
  std::weak_ptr<daemon::SubscriberNotifier> notifier = app.notifier;
  std::weak_ptr<daemon::UpstreamLink>       upstream = app.upstream;
  app.registry->SetChangeListener([notifier, upstream](const v1::SessionRecord& record) {
    if (auto n = notifier.lock()) {
      v1::SessionChangedRequest changed;
      *changed.mutable_record() = record;
      n->Enqueue(std::move(changed));
    }
    if (auto u = upstream.lock()) {
      u->Enqueue(record);
    }
  });

  app.sweeper = std::make_shared<daemon::LivenessSweeper>(app.registry, std::chrono::milliseconds(daemon_config.sweep_interval_ms()));
  app.sweeper->Start();

  app.shutdown = std::make_shared<daemon::ShutdownSignal>();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry        = app.registry;
  ctx.notifier        = app.notifier;
  ctx.files           = std::make_shared<daemon::SessionFileAccess>(app.paths.SessionsDir());
  ctx.shutdown        = app.shutdown;
  ctx.token           = app.token;
  ctx.build_sha       = daemon::BuildSha();
  ctx.build_timestamp = daemon::BuildTimestamp();

  auto daemon_service       = std::make_shared<service::DaemonService>(ctx);
  auto file_service         = std::make_shared<service::FileService>(ctx);
  auto subscription_service = std::make_shared<service::SubscriptionService>(ctx);

  grpc::TokenCheck check = [daemon_service](const std::string& token) { return daemon_service->TokenMatches(token); };

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DaemonServer>(daemon_service));
  app.grpc_services.push_back(std::make_unique<grpc::FileServer>(file_service, check));
  app.subscriber_services.push_back(std::make_unique<grpc::SubscriptionServer>(subscription_service, check));

  return app;
}

} // namespace planner::factory
