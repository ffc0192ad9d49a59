#include "factory.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/geocode/retrying_geocoder.hpp"
#include "internal/geocode/static_geocoder.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reliable/retry_policy.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/transport/transport_factory.hpp"

namespace meshdispatch::factory {

using namespace std::chrono_literals;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const meshdispatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_memory()) {
    MESHDISPATCH_LOG_WARN("using in-memory store; state is lost on restart");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  if (!database.has_sqlite()) {
    throw std::runtime_error("no database backend configured");
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
  db::sqlite::BootstrapSchema(*sqlite_db);
  MESHDISPATCH_LOG_INFO("sqlite store opened", {observability::StringField("path", database.sqlite().path()),
                                                observability::BoolField("wal", database.sqlite().wal_mode())});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

std::shared_ptr<geocode::Geocoder> BuildGeocoder(const meshdispatch::runtime::config::GeocoderConfig& config) {
  auto gazetteer = std::make_shared<geocode::StaticGeocoder>(config);
  return std::make_shared<geocode::RetryingGeocoder>(gazetteer, config.retries(), util::ToMillis(config.retry_base_delay(), 1s));
}

core::CoordinatorOptions BuildCoordinatorOptions(const meshdispatch::runtime::config::UnitsConfig& units) {
  core::CoordinatorOptions options;
  if (units.arrival_proximity_meters() > 0.0) {
    options.arrival_proximity_m = units.arrival_proximity_meters();
  }
  if (units.has_base()) {
    options.base = util::LatLon{units.base().lat(), units.base().lon()};
  }
  options.offline_timeout = util::ToMillis(units.offline_timeout(), 5min);
  return options;
}

} // namespace

void Application::Start() {
  inbound_worker->Start();
  transport->Start();
  for (const auto& task : background_tasks) {
    task->Start();
  }
}

void Application::Stop() {
  for (auto it = background_tasks.rbegin(); it != background_tasks.rend(); ++it) {
    (*it)->Stop();
  }
  transport->Stop();
  inbound_queue->Shutdown();
  inbound_worker->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const meshdispatch::runtime::config::RuntimeConfig& config, const util::Clock& clock) {
  Application app;

  // ------------------------------------------------------------------
  // Store and radio link
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.transport  = transport::BuildTransport(config.radio());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto policy = reliable::RetryPolicy::FromConfig(config.reliability());
  app.outbound      = std::make_shared<reliable::ReliableOutbound>(app.repository, app.transport, policy, clock);
  app.coordinator   = std::make_shared<core::DispatchCoordinator>(app.repository, app.outbound, BuildGeocoder(config.geocoder()), clock,
                                                                  BuildCoordinatorOptions(config.units()));

  // ------------------------------------------------------------------
  // Inbound path: link reader -> queue -> single consumer
  // ------------------------------------------------------------------
  app.inbound_queue = std::make_shared<inbound::InboundQueue>(config.inbound().queue_capacity());
  auto coordinator  = app.coordinator;
  app.inbound_worker =
      std::make_shared<inbound::InboundWorker>(app.inbound_queue, [coordinator](const std::string& frame) { coordinator->Ingest(frame); });

  auto queue = app.inbound_queue;
  app.transport->Subscribe([queue](std::string frame) { queue->Push(std::move(frame)); });

  // ------------------------------------------------------------------
  // Background tasks
  // ------------------------------------------------------------------
  // Stored pending acks are re-armed on the first tick, once the link
  // has had recovery_delay to come up.
  auto outbound  = app.outbound;
  auto recovered = std::make_shared<std::atomic<bool>>(false);
  app.background_tasks.push_back(std::make_shared<runtime::PeriodicTask>(
      "retry-scheduler", util::ToMillis(config.reliability().scheduler_tick(), 500ms),
      [outbound, recovered] {
        if (!recovered->exchange(true)) {
          outbound->Recover();
        }
        outbound->Tick();
      },
      util::ToMillis(config.reliability().recovery_delay(), 5s)));

  app.background_tasks.push_back(std::make_shared<runtime::PeriodicTask>("offline-sweep", util::ToMillis(config.units().sweep_interval(), 30s),
                                                                         [coordinator] { coordinator->SweepOffline(); }));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator = app.coordinator;

  auto dispatch_service = std::make_shared<service::DispatchService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DispatchServer>(dispatch_service));

  return app;
}

} // namespace meshdispatch::factory
