#include "computation_worker.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/arrow_io.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace routebroker::jobs {

namespace {

db::model::RouteRecord LoadRoute(db::Repository& repository, db::Transaction& tx, int64_t route_id) {
  auto route = repository.GetRoute(tx, route_id);
  if (!route) {
    throw util::NotFound("route not found: " + std::to_string(route_id));
  }
  return *route;
}

} // namespace

RouteComputationWorker::RouteComputationWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<planner::RoutePlanner> planner)
    : repository_(std::move(repository)), planner_(std::move(planner)) {
}

std::string RouteComputationWorker::LoadMeshDocument(const MeshSource& source) {
  if (const auto* path = std::get_if<std::string>(&source)) {
    if (path->empty()) {
      throw util::InvalidArgument("no mesh path configured");
    }
    return util::ReadDocumentOrThrow(*path);
  }

  const int64_t mesh_id = std::get<int64_t>(source);
  auto          tx      = repository_->Begin();
  auto          json    = repository_->GetMeshJson(*tx, mesh_id);
  tx->Commit();
  if (!json) {
    throw util::NotFound("mesh not found: " + std::to_string(mesh_id));
  }
  return *json;
}

ComputationOutcome RouteComputationWorker::Execute(const ComputeRouteTask& task) {
  try {
    const auto mesh = util::ParseJsonObject(LoadMeshDocument(task.mesh));

    db::model::RouteRecord route;
    {
      auto tx = repository_->Begin();
      route   = LoadRoute(*repository_, *tx, task.route_id);
      tx->Commit();
    }

    std::vector<planner::Waypoint> waypoints = {
        {"Start", route.endpoints.start},
        {"End", route.endpoints.end},
    };

    auto session = planner_->Start(mesh, waypoints);

    const auto unsmoothed = session->ComputeRoutes();
    {
      auto tx                  = repository_->Begin();
      auto current             = LoadRoute(*repository_, *tx, task.route_id);
      current.json_unsmoothed  = util::ToJson(unsmoothed);
      current.calculated       = util::Now();
      current.planner_version  = planner_->Version();
      db::ThrowIfDbError(repository_->UpdateRoute(*tx, current), "checkpoint route");
      tx->Commit();
    }

    const auto smoothed = session->ComputeSmoothedRoutes();

    std::string geometry = util::ToJson(smoothed);
    {
      auto tx                 = repository_->Begin();
      auto current            = LoadRoute(*repository_, *tx, task.route_id);
      current.json            = geometry;
      current.calculated      = util::Now();
      current.planner_version = planner_->Version();
      db::ThrowIfDbError(repository_->UpdateRoute(*tx, current), "store route");
      tx->Commit();
    }

    return ComputationOutcome::Success(std::move(geometry));
  } catch (const std::exception& e) {
    RecordFailure(task.route_id, e.what());
    return ComputationOutcome::Failure(e.what());
  }
}

void RouteComputationWorker::RecordFailure(int64_t route_id, const std::string& error) {
  try {
    auto tx    = repository_->Begin();
    auto route = repository_->GetRoute(*tx, route_id);
    if (!route) {
      return;
    }
    route->info = error;
    db::ThrowIfDbError(repository_->UpdateRoute(*tx, *route), "record route failure");
    tx->Commit();
  } catch (const std::exception& e) {
    ROUTEBROKER_LOG_ERROR("failed to record route failure", {observability::RouteId(route_id),
                                                             observability::StringField("error", e.what())});
  }
}

} // namespace routebroker::jobs
