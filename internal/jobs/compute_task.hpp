#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace routebroker::jobs {

// Path of a mesh document on disk, or the id of a stored mesh.
using MeshSource = std::variant<std::string, int64_t>;

/*
  A queued route computation.

  task_id is also the Job id persisted for the route.
*/
struct ComputeRouteTask {
  std::string task_id;
  int64_t     route_id = 0;
  MeshSource  mesh;
};

/*
  Result of one computation. A failure is an ordinary value: the worker
  never reports failure by throwing.
*/
struct ComputationOutcome {
  bool        ok = false;
  std::string geometry;  // final GeoJSON on success
  std::string error;     // reason on failure

  static ComputationOutcome Success(std::string geometry) {
    return {true, std::move(geometry), {}};
  }

  static ComputationOutcome Failure(std::string error) {
    return {false, {}, std::move(error)};
  }

  explicit operator bool() const {
    return ok;
  }
};

/*
  Executes tasks taken off the queue. Implementations return a failure
  outcome instead of throwing.
*/
class TaskExecutor {
 public:
  virtual ~TaskExecutor() = default;

  virtual ComputationOutcome Execute(const ComputeRouteTask& task) = 0;
};

} // namespace routebroker::jobs
