#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/jobs/compute_task.hpp"
#include "internal/planner/route_planner.hpp"

namespace routebroker::jobs {

/*
  Computes one route with the planner and persists it in two steps:

    1. unsmoothed geometry + calculated time + planner version
       (committed on its own, so the checkpoint survives a later failure)
    2. final geometry, calculated time and version refreshed

  Any failure is written to route.info and returned as a failed outcome.
*/
class RouteComputationWorker final : public TaskExecutor {
 public:
  RouteComputationWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<planner::RoutePlanner> planner);

  ComputationOutcome Execute(const ComputeRouteTask& task) override;

 private:
  std::string LoadMeshDocument(const MeshSource& source);
  void        RecordFailure(int64_t route_id, const std::string& error);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<planner::RoutePlanner> planner_;
};

} // namespace routebroker::jobs
