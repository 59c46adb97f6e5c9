#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/core/mesh_selector.hpp"
#include "internal/core/route_evaluator.hpp"
#include "internal/core/route_matcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/mesh_admin_server.hpp"
#include "internal/grpc/route_server.hpp"
#include "internal/ingest/import_scheduler.hpp"
#include "internal/ingest/mesh_ingestor.hpp"
#include "internal/jobs/computation_worker.hpp"
#include "internal/jobs/job_tracker.hpp"
#include "internal/jobs/task_queue.hpp"
#include "internal/jobs/task_registry.hpp"
#include "internal/jobs/worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/planner/great_circle_planner.hpp"
#include "internal/service/mesh_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/service/service_context.hpp"
#if ROUTEBROKER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROUTEBROKER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace routebroker::factory {

using namespace routebroker;
using routebroker::observability::IntField;
using routebroker::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const routebroker::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROUTEBROKER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    ROUTEBROKER_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROUTEBROKER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    ROUTEBROKER_LOG_INFO("using postgres repository", {IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ROUTEBROKER_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const routebroker::runtime::config::RuntimeConfig& config, std::shared_ptr<planner::RoutePlanner> route_planner) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence + core
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  if (!route_planner) {
    route_planner = std::make_shared<planner::GreatCircleRoutePlanner>();
  }

  auto mesh_selector = std::make_shared<core::MeshSelector>(repository);
  auto route_matcher = std::make_shared<core::RouteMatcher>(repository, config.routing().waypoint_distance_tolerance_nm());
  auto route_evaluator = std::make_shared<core::RouteEvaluator>(repository, mesh_selector, route_planner);

  // ------------------------------------------------------------------
  // Computation system
  // ------------------------------------------------------------------
  auto queue       = std::make_shared<jobs::TaskQueue>();
  auto registry    = std::make_shared<jobs::TaskRegistry>(config.computation_workers().max_finished_tasks());
  auto worker      = std::make_shared<jobs::RouteComputationWorker>(repository, route_planner);
  auto job_tracker = std::make_shared<jobs::JobLifecycleTracker>(repository, queue, registry, config.routing().default_mesh_path());

  app.worker_pool = std::make_shared<jobs::WorkerPool>(queue, registry, worker, config.computation_workers().threads());
  app.worker_pool->Start();
  job_tracker->RequeueUnfinished();

  // ------------------------------------------------------------------
  // Mesh ingestion
  // ------------------------------------------------------------------
  std::shared_ptr<ingest::MeshIngestor> ingestor;
  if (!config.mesh_import().mesh_dir().empty()) {
    ingestor = std::make_shared<ingest::MeshIngestor>(repository, config.mesh_import().mesh_dir());
  }

  if (ingestor && config.mesh_import().enabled()) {
    app.import_scheduler = std::make_shared<ingest::MeshImportScheduler>(
        ingestor, std::chrono::seconds(config.mesh_import().interval_sec()), config.mesh_import().run_on_startup());
    app.import_scheduler->Start();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository        = repository;
  ctx.mesh_selector     = mesh_selector;
  ctx.route_matcher     = route_matcher;
  ctx.route_evaluator   = route_evaluator;
  ctx.job_tracker       = job_tracker;
  ctx.ingestor          = ingestor;
  ctx.status_url_prefix = config.routing().status_url_prefix();

  app.repository    = repository;
  app.route_service = std::make_shared<service::RouteService>(ctx);
  app.mesh_service  = std::make_shared<service::MeshService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RouteServer>(app.route_service));
  app.grpc_services.push_back(std::make_unique<grpc::MeshAdminServer>(app.mesh_service));

  return app;
}

void Application::Stop() {
  if (import_scheduler) import_scheduler->Stop();
  if (worker_pool) worker_pool->Stop();
}

} // namespace routebroker::factory
