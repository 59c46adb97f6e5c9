#include "job_tracker.hpp"

#include <utility>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace routebroker::jobs {

JobLifecycleTracker::JobLifecycleTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<TaskQueue> queue,
                                         std::shared_ptr<TaskRegistry> registry, std::string default_mesh_path)
    : repository_(std::move(repository)),
      queue_(std::move(queue)),
      registry_(std::move(registry)),
      default_mesh_path_(std::move(default_mesh_path)) {
}

MeshSource JobLifecycleTracker::MeshSourceFor(const db::model::RouteRecord& route) const {
  if (route.mesh_id) {
    return *route.mesh_id;
  }
  return default_mesh_path_;
}

db::model::JobRecord JobLifecycleTracker::Dispatch(const db::model::RouteRecord& route) {
  db::model::JobRecord job;
  job.id       = util::NewTaskId();
  job.created  = util::Now();
  job.route_id = route.id;

  {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertJob(*tx, job), "insert job");
    tx->Commit();
  }

  Enqueue(job.id, route);
  return job;
}

void JobLifecycleTracker::Enqueue(const std::string& job_id, const db::model::RouteRecord& route) {
  registry_->Register(job_id);
  try {
    queue_->Enqueue(ComputeRouteTask{job_id, route.id, MeshSourceFor(route)});
  } catch (const std::exception& e) {
    const std::string error = std::string("dispatch failed: ") + e.what();
    registry_->Fail(job_id, error);
    RecordDispatchFailure(route.id, error);
    ROUTEBROKER_LOG_ERROR("route computation not queued", {observability::JobId(job_id),
                                                           observability::RouteId(route.id),
                                                           observability::StringField("error", error)});
    return;
  }

  ROUTEBROKER_LOG_INFO("route computation dispatched",
                       {observability::JobId(job_id), observability::RouteId(route.id)});
}

void JobLifecycleTracker::RecordDispatchFailure(int64_t route_id, const std::string& error) {
  auto tx    = repository_->Begin();
  auto route = repository_->GetRoute(*tx, route_id);
  if (!route) {
    return;
  }
  route->info = error;
  db::ThrowIfDbError(repository_->UpdateRoute(*tx, *route), "record dispatch failure");
  tx->Commit();
}

std::size_t JobLifecycleTracker::RequeueUnfinished() {
  std::vector<std::pair<db::model::RouteRecord, std::optional<db::model::JobRecord>>> pending;
  {
    auto tx = repository_->Begin();
    for (auto& route : repository_->ListUnfinishedRoutes(*tx)) {
      auto job = repository_->LatestJobForRoute(*tx, route.id);
      pending.emplace_back(std::move(route), std::move(job));
    }
    tx->Commit();
  }

  std::size_t queued = 0;
  for (const auto& [route, job] : pending) {
    if (!job) {
      Dispatch(route);
      ++queued;
      continue;
    }
    if (registry_->Find(job->id)) {
      continue;
    }
    Enqueue(job->id, route);
    ++queued;
  }

  observability::Metrics::Instance().RecordJobsRequeued(queued);
  ROUTEBROKER_LOG_INFO("unfinished routes requeued", {observability::IntField("count", static_cast<int64_t>(queued))});
  return queued;
}

std::string JobLifecycleTracker::ErrorFor(const std::string& job_id, const db::model::RouteRecord& route) const {
  if (auto error = registry_->Error(job_id)) {
    return *error;
  }
  return route.info;
}

JobStatus JobLifecycleTracker::GetStatus(const std::string& job_id) const {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  if (!job) {
    throw util::NotFound("job not found: " + job_id);
  }

  auto route = repository_->GetRoute(*tx, job->route_id);
  tx->Commit();
  if (!route) {
    throw util::NotFound("route not found for job: " + job_id);
  }

  JobStatus status;
  status.job_id = job_id;
  status.state  = StateOf(job_id, *route);
  status.route  = std::move(*route);
  if (status.state == TaskState::kFailure) {
    status.error = ErrorFor(job_id, status.route);
  }
  return status;
}

void JobLifecycleTracker::Cancel(const std::string& job_id) {
  const bool revoked = registry_->Revoke(job_id);
  ROUTEBROKER_LOG_INFO("route cancellation requested",
                       {observability::JobId(job_id), observability::BoolField("revoked", revoked)});
}

std::vector<JobStatus> JobLifecycleTracker::ListRecent() const {
  const auto now = util::Now();

  auto tx     = repository_->Begin();
  auto routes = repository_->ListRoutesRequestedBetween(*tx, util::StartOfUtcDay(now), util::EndOfUtcDay(now));

  std::vector<JobStatus> out;
  for (auto& route : routes) {
    auto job = repository_->LatestJobForRoute(*tx, route.id);
    if (!job) {
      continue;
    }

    JobStatus status;
    status.job_id = job->id;
    status.state  = StateOf(job->id, route);
    status.route  = std::move(route);
    if (status.state == TaskState::kFailure) {
      status.error = ErrorFor(job->id, status.route);
    }
    out.push_back(std::move(status));
  }
  tx->Commit();
  return out;
}

std::optional<db::model::JobRecord> JobLifecycleTracker::LatestJobForRoute(int64_t route_id) const {
  auto tx  = repository_->Begin();
  auto job = repository_->LatestJobForRoute(*tx, route_id);
  tx->Commit();
  return job;
}

TaskState JobLifecycleTracker::StateOf(const std::string& job_id) const {
  return registry_->Query(job_id);
}

TaskState JobLifecycleTracker::StateOf(const std::string& job_id, const db::model::RouteRecord& route) const {
  if (auto state = registry_->Find(job_id)) {
    return *state;
  }
  if (route.IsResolved()) {
    return TaskState::kSuccess;
  }
  if (!route.info.empty()) {
    return TaskState::kFailure;
  }
  return TaskState::kPending;
}

} // namespace routebroker::jobs
