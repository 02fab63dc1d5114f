#include "internal/factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/trip_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/fare/fare_calculator.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/grpc/event_server.hpp"
#include "internal/grpc/tracking_server.hpp"
#include "internal/grpc/trip_server.hpp"
#include "internal/lifecycle/trip_lifecycle.hpp"
#include "internal/location/location_registry.hpp"
#include "internal/matching/batch_dispatcher.hpp"
#include "internal/matching/candidate_selector.hpp"
#include "internal/matching/offer_timer.hpp"
#include "internal/matching/response_arbiter.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payment/hold_coordinator.hpp"
#include "internal/routing/route_provider.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/schedule/scheduled_trigger.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/event_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/tracking_service.hpp"
#include "internal/service/trip_service.hpp"
#if DISPATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DISPATCH_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace dispatch::factory {

namespace {

#if DISPATCH_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec(sql);
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};
#endif

#if DISPATCH_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec(sql);
    tx.commit();
  }

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DISPATCH_DB_SQLITE
    const auto path      = database.sqlite().path().empty() ? std::string("dispatch.db") : database.sqlite().path();
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, database.sqlite().wal_mode());
    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SchemaStatements(db::sql::Dialect::kSqlite));
    DISPATCH_LOG_INFO("Using sqlite repository", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DISPATCH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    PgMigrationExecutor executor(pool);
    db::sql::RunMigrations(executor, db::sql::SchemaStatements(db::sql::Dialect::kPostgres));
    DISPATCH_LOG_INFO("Using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DISPATCH_LOG_WARN("Using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const dispatch::runtime::config::RuntimeConfig& config) {
  Application app;
  app.settings       = config::LoadSettings(config);
  const auto& settings = app.settings;

  // ------------------------------------------------------------------
  // Store and shared infrastructure
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.notifier   = std::make_shared<notify::Notifier>();

  auto routes = std::make_shared<routing::StraightLineRouteProvider>(settings.average_speed_kmh);
  auto fares  = std::make_shared<fare::FareCalculator>(routes, settings.fares);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto registry = std::make_shared<location::LocationRegistry>(app.repository, settings.location);
  registry->Hydrate();

  auto lifecycle  = std::make_shared<lifecycle::TripLifecycle>(app.repository);
  auto holds      = std::make_shared<payment::HoldCoordinator>(app.repository, lifecycle, settings.store_retry);
  auto selector   = std::make_shared<matching::CandidateSelector>(app.repository, registry, settings.dispatch, settings.average_speed_kmh);
  auto dispatcher = std::make_shared<matching::BatchDispatcher>(app.repository, selector, lifecycle, holds, app.notifier, settings.dispatch,
                                                                settings.store_retry);
  auto arbiter    = std::make_shared<matching::ResponseArbiter>(app.repository, lifecycle, app.notifier, settings.store_retry);
  auto trigger    = std::make_shared<schedule::ScheduledTrigger>(app.repository, lifecycle, holds, dispatcher, app.notifier, settings.store_retry);

  auto manager = std::make_shared<core::TripManager>(app.repository, fares, holds, lifecycle, dispatcher, arbiter, registry, app.notifier, settings);

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  std::weak_ptr<matching::BatchDispatcher> weak_dispatcher = dispatcher;
  app.offer_timer = std::make_shared<matching::OfferTimer>([weak_dispatcher](const std::string& trip_id) {
    if (auto d = weak_dispatcher.lock()) {
      d->Reconcile(trip_id);
    }
  });
  dispatcher->AttachTimer(app.offer_timer);
  app.offer_timer->Start();

  app.background_tasks.push_back(
      std::make_shared<runtime::PeriodicTask>("dispatch_sweep", settings.dispatch.sweep_interval, [dispatcher] { dispatcher->Sweep(); }));
  app.background_tasks.push_back(
      std::make_shared<runtime::PeriodicTask>("scheduled_trigger", settings.schedule_poll_interval, [trigger] { trigger->RunOnce(); }));
  app.background_tasks.push_back(
      std::make_shared<runtime::PeriodicTask>("location_prune", settings.location.prune_interval, [registry] { registry->Prune(); }));

  for (auto& task : app.background_tasks) {
    task->Start();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager    = manager;
  ctx.holds      = holds;
  ctx.registry   = registry;
  ctx.notifier   = app.notifier;
  ctx.repository = app.repository;

  auto trip_service     = std::make_shared<service::TripService>(ctx);
  auto dispatch_service = std::make_shared<service::DispatchService>(ctx);
  auto tracking_service = std::make_shared<service::TrackingService>(ctx);
  auto event_service    = std::make_shared<service::EventService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TripServer>(trip_service));
  app.grpc_services.push_back(std::make_unique<grpc::DispatchServer>(dispatch_service));
  app.grpc_services.push_back(std::make_unique<grpc::TrackingServer>(tracking_service));
  app.grpc_services.push_back(std::make_unique<grpc::EventServer>(event_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

void Shutdown(Application& app) {
  for (auto& task : app.background_tasks) {
    task->Stop();
  }
  if (app.offer_timer) {
    app.offer_timer->Stop();
  }
  if (app.notifier) {
    app.notifier->Shutdown();
  }
}

} // namespace dispatch::factory
