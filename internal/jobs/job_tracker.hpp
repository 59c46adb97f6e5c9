#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/jobs/task_queue.hpp"
#include "internal/jobs/task_registry.hpp"

namespace routebroker::jobs {

struct JobStatus {
  std::string            job_id;
  TaskState              state = TaskState::kPending;
  db::model::RouteRecord route;
  std::string            error;  // set when state is kFailure
};

/*
  Dispatches route computations and reports their live state.

  The Job row is committed before the task is queued, so a status query
  can never miss a job that is already running. Job state is never
  stored: it is read from the TaskRegistry on every query. For jobs the
  registry no longer (or never) tracked, e.g. after a restart, the state
  is derived from the stored route: final geometry reads SUCCESS, a
  recorded error reads FAILURE, anything else PENDING.
*/
class JobLifecycleTracker {
 public:
  JobLifecycleTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<TaskQueue> queue, std::shared_ptr<TaskRegistry> registry,
                      std::string default_mesh_path);

  // A task that cannot be queued is recorded as failed on the route and
  // in the registry; the job is still returned.
  db::model::JobRecord Dispatch(const db::model::RouteRecord& route);

  // Queues the latest job of every unfinished route again, or a new job
  // for a route that has none. Jobs already tracked are skipped.
  // Returns the number of tasks queued.
  std::size_t RequeueUnfinished();

  // Throws util::NotFound for an unknown job id.
  JobStatus GetStatus(const std::string& job_id) const;

  // Best effort: a pending task never starts, a running one completes.
  void Cancel(const std::string& job_id);

  // Latest job of every route requested on the current UTC date.
  std::vector<JobStatus> ListRecent() const;

  std::optional<db::model::JobRecord> LatestJobForRoute(int64_t route_id) const;

  TaskState StateOf(const std::string& job_id) const;
  TaskState StateOf(const std::string& job_id, const db::model::RouteRecord& route) const;

 private:
  MeshSource  MeshSourceFor(const db::model::RouteRecord& route) const;
  void        Enqueue(const std::string& job_id, const db::model::RouteRecord& route);
  void        RecordDispatchFailure(int64_t route_id, const std::string& error);
  std::string ErrorFor(const std::string& job_id, const db::model::RouteRecord& route) const;

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<TaskQueue>      queue_;
  std::shared_ptr<TaskRegistry>   registry_;
  std::string                     default_mesh_path_;
};

} // namespace routebroker::jobs
