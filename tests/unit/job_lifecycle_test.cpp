#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/jobs/computation_worker.hpp"
#include "internal/jobs/job_tracker.hpp"
#include "internal/jobs/task_queue.hpp"
#include "internal/jobs/task_registry.hpp"
#include "internal/jobs/worker_pool.hpp"
#include "internal/planner/great_circle_planner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using routebroker::db::memory::MemoryRepository;
using routebroker::db::model::MeshRecord;
using routebroker::db::model::RouteRecord;
using routebroker::jobs::ComputationOutcome;
using routebroker::jobs::ComputeRouteTask;
using routebroker::jobs::JobLifecycleTracker;
using routebroker::jobs::RouteComputationWorker;
using routebroker::jobs::TaskExecutor;
using routebroker::jobs::TaskQueue;
using routebroker::jobs::TaskRegistry;
using routebroker::jobs::TaskState;
using routebroker::jobs::WorkerPool;
using routebroker::planner::PlanningSession;
using routebroker::planner::RoutePlanner;
using routebroker::planner::Waypoint;

constexpr const char* kUnsmoothed = R"({"type":"FeatureCollection","features":[{"type":"Feature","properties":{"stage":"unsmoothed"}}]})";
constexpr const char* kSmoothed   = R"({"type":"FeatureCollection","features":[{"type":"Feature","properties":{"stage":"smoothed"}}]})";

class ScriptedSession final : public PlanningSession {
 public:
  explicit ScriptedSession(bool fail_smoothing) : fail_smoothing_(fail_smoothing) {
  }

  google::protobuf::Struct ComputeRoutes() override {
    return routebroker::util::ParseJsonObject(kUnsmoothed);
  }

  google::protobuf::Struct ComputeSmoothedRoutes() override {
    if (fail_smoothing_) {
      throw std::runtime_error("smoothing diverged");
    }
    return routebroker::util::ParseJsonObject(kSmoothed);
  }

 private:
  bool fail_smoothing_;
};

class ScriptedPlanner final : public RoutePlanner {
 public:
  explicit ScriptedPlanner(bool fail_smoothing) : fail_smoothing_(fail_smoothing) {
  }

  std::string Version() const override {
    return "scripted/0.1";
  }

  std::unique_ptr<PlanningSession> Start(const google::protobuf::Struct&, const std::vector<Waypoint>& waypoints) override {
    assert(waypoints.size() == 2);
    assert(waypoints[0].name == "Start");
    assert(waypoints[1].name == "End");
    return std::make_unique<ScriptedSession>(fail_smoothing_);
  }

  google::protobuf::Struct Evaluate(const google::protobuf::Struct&, const google::protobuf::Struct& route) override {
    return route;
  }

 private:
  bool fail_smoothing_;
};

class CountingExecutor final : public TaskExecutor {
 public:
  ComputationOutcome Execute(const ComputeRouteTask&) override {
    ++executed;
    return ComputationOutcome::Success("{}");
  }

  std::atomic<int> executed{0};
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<TaskQueue>        queue      = std::make_shared<TaskQueue>();
  std::shared_ptr<TaskRegistry>     registry   = std::make_shared<TaskRegistry>();
  std::shared_ptr<JobLifecycleTracker> tracker;

  explicit Fixture(std::string default_mesh_path = {}) {
    tracker = std::make_shared<JobLifecycleTracker>(repository, queue, registry, std::move(default_mesh_path));
  }

  MeshRecord StoreMesh(const std::string& json = R"({"cellboxes":[]})") {
    MeshRecord mesh;
    mesh.md5     = "md5-" + std::to_string(next_md5++);
    mesh.created = routebroker::util::Now();
    mesh.bounds  = {-80.0, -50.0, -80.0, -50.0};

    auto tx = repository->Begin();
    assert(repository->InsertMesh(*tx, mesh, json));
    tx->Commit();
    return mesh;
  }

  RouteRecord StoreRoute(std::optional<int64_t> mesh_id) {
    RouteRecord route;
    route.requested = routebroker::util::Now();
    route.mesh_id   = mesh_id;
    route.endpoints = {{-65.0, -65.0}, {-61.0, -61.0}};

    auto tx = repository->Begin();
    assert(repository->InsertRoute(*tx, route));
    tx->Commit();
    return route;
  }

  RouteRecord LoadRoute(int64_t id) {
    auto tx    = repository->Begin();
    auto route = repository->GetRoute(*tx, id);
    tx->Commit();
    assert(route.has_value());
    return *route;
  }

  TaskState Await(const std::string& job_id) {
    auto done = registry->Completion(job_id);
    assert(done.has_value());
    assert(done->wait_for(std::chrono::seconds(30)) == std::future_status::ready);
    return done->get();
  }

  int next_md5 = 0;
};

void TestSuccessfulComputationStoresBothStages() {
  Fixture fx;
  auto    mesh  = fx.StoreMesh();
  auto    route = fx.StoreRoute(mesh.id);

  RouteComputationWorker worker(fx.repository, std::make_shared<ScriptedPlanner>(false));
  auto outcome = worker.Execute(ComputeRouteTask{"task-ok", route.id, mesh.id});
  assert(outcome);

  auto stored = fx.LoadRoute(route.id);
  assert(stored.IsResolved());
  assert(routebroker::util::ParseJsonObject(stored.json_unsmoothed).fields().at("type").string_value() == "FeatureCollection");
  assert(stored.json == outcome.geometry);
  assert(stored.planner_version == "scripted/0.1");
  assert(stored.info.empty());
}

void TestSmoothingFailureKeepsCheckpoint() {
  Fixture fx;
  auto    mesh  = fx.StoreMesh();
  auto    route = fx.StoreRoute(mesh.id);

  RouteComputationWorker worker(fx.repository, std::make_shared<ScriptedPlanner>(true));
  auto outcome = worker.Execute(ComputeRouteTask{"task-smooth", route.id, mesh.id});
  assert(!outcome);
  assert(outcome.error == "smoothing diverged");

  auto stored = fx.LoadRoute(route.id);
  assert(!stored.json_unsmoothed.empty());
  assert(stored.calculated.has_value());
  assert(stored.json.empty());
  assert(stored.info == "smoothing diverged");
  assert(!stored.IsResolved());
}

void TestMissingMeshIsRecordedOnRoute() {
  Fixture fx;
  auto    route = fx.StoreRoute(std::nullopt);

  RouteComputationWorker worker(fx.repository, std::make_shared<ScriptedPlanner>(false));
  auto missing_id = worker.Execute(ComputeRouteTask{"task-mesh", route.id, int64_t{424242}});
  assert(!missing_id);
  assert(fx.LoadRoute(route.id).info.find("424242") != std::string::npos);

  auto missing_path = worker.Execute(ComputeRouteTask{"task-path", route.id, std::string()});
  assert(!missing_path);
  assert(!fx.LoadRoute(route.id).calculated.has_value());
}

void TestDefaultMeshPathIsLoadedFromDisk() {
  const auto mesh_path = std::filesystem::temp_directory_path() / "routebroker_job_lifecycle_default.vessel.json";
  {
    std::ofstream out(mesh_path);
    out << R"({"cellboxes":[],"config":{}})";
  }

  Fixture fx(mesh_path.string());
  auto    route = fx.StoreRoute(std::nullopt);

  auto executor = std::make_shared<RouteComputationWorker>(fx.repository, std::make_shared<routebroker::planner::GreatCircleRoutePlanner>());
  WorkerPool pool(fx.queue, fx.registry, executor, 1);
  pool.Start();

  auto job   = fx.tracker->Dispatch(route);
  auto state = fx.Await(job.id);
  pool.Stop();

  assert(state == TaskState::kSuccess);
  auto status = fx.tracker->GetStatus(job.id);
  assert(status.state == TaskState::kSuccess);
  assert(status.route.IsResolved());
  assert(status.route.planner_version == "great-circle/1.0");
  assert(status.error.empty());

  std::filesystem::remove(mesh_path);
}

void TestFailedJobReportsError() {
  Fixture fx;
  auto    mesh  = fx.StoreMesh();
  auto    route = fx.StoreRoute(mesh.id);

  auto       executor = std::make_shared<RouteComputationWorker>(fx.repository, std::make_shared<ScriptedPlanner>(true));
  WorkerPool pool(fx.queue, fx.registry, executor, 2);
  pool.Start();

  auto job = fx.tracker->Dispatch(route);
  assert(fx.Await(job.id) == TaskState::kFailure);
  pool.Stop();

  auto status = fx.tracker->GetStatus(job.id);
  assert(status.state == TaskState::kFailure);
  assert(status.error == "smoothing diverged");
  assert(!status.route.json_unsmoothed.empty());
}

void TestCancelledPendingJobNeverRuns() {
  Fixture fx;
  auto    mesh      = fx.StoreMesh();
  auto    cancelled = fx.tracker->Dispatch(fx.StoreRoute(mesh.id));
  fx.tracker->Cancel(cancelled.id);
  assert(fx.tracker->StateOf(cancelled.id) == TaskState::kRevoked);

  auto       executor = std::make_shared<CountingExecutor>();
  WorkerPool pool(fx.queue, fx.registry, executor, 1);
  pool.Start();

  // single FIFO worker: the revoked task is dequeued before this one
  auto follower = fx.tracker->Dispatch(fx.StoreRoute(mesh.id));
  assert(fx.Await(follower.id) == TaskState::kSuccess);
  pool.Stop();

  assert(executor->executed == 1);
  assert(fx.tracker->GetStatus(cancelled.id).state == TaskState::kRevoked);
  assert(fx.tracker->GetStatus(follower.id).state == TaskState::kSuccess);
}

void TestUnknownJobIsNotFound() {
  Fixture fx;
  bool    threw = false;
  try {
    (void)fx.tracker->GetStatus("no-such-job");
  } catch (const routebroker::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // cancelling an unknown id is acknowledged and leaves nothing behind
  fx.tracker->Cancel("no-such-job");
  fx.tracker->Cancel("");
  assert(fx.registry->Size() == 0);
}

void TestDispatchAfterShutdownRecordsFailure() {
  Fixture fx;
  auto    mesh  = fx.StoreMesh();
  auto    route = fx.StoreRoute(mesh.id);
  fx.queue->Shutdown();

  auto job    = fx.tracker->Dispatch(route);
  auto status = fx.tracker->GetStatus(job.id);
  assert(status.state == TaskState::kFailure);
  assert(status.error.find("task queue is shut down") != std::string::npos);
  assert(fx.LoadRoute(route.id).info == status.error);
}

void TestEvictedJobStateComesFromRoute() {
  Fixture fx;
  fx.registry = std::make_shared<TaskRegistry>(1);
  fx.tracker  = std::make_shared<JobLifecycleTracker>(fx.repository, fx.queue, fx.registry, "");

  auto mesh   = fx.StoreMesh();
  auto solved = fx.StoreRoute(mesh.id);
  auto failed = fx.StoreRoute(mesh.id);

  auto       executor = std::make_shared<RouteComputationWorker>(fx.repository, std::make_shared<ScriptedPlanner>(false));
  WorkerPool pool(fx.queue, fx.registry, executor, 1);
  pool.Start();
  auto solved_job = fx.tracker->Dispatch(solved);
  assert(fx.Await(solved_job.id) == TaskState::kSuccess);
  pool.Stop();

  // the queue is shut down now: this dispatch fails at once and pushes
  // the first finished task out of the registry
  auto failed_job = fx.tracker->Dispatch(failed);
  assert(!fx.registry->Find(solved_job.id).has_value());
  assert(fx.registry->Find(failed_job.id) == TaskState::kFailure);

  assert(fx.tracker->GetStatus(solved_job.id).state == TaskState::kSuccess);
  assert(fx.tracker->GetStatus(failed_job.id).state == TaskState::kFailure);
}

void TestRequeueAfterRestart() {
  Fixture before;
  auto    mesh     = before.StoreMesh();
  auto    queued   = before.StoreRoute(mesh.id);
  auto    no_job   = before.StoreRoute(mesh.id);
  auto    resolved = before.StoreRoute(mesh.id);
  auto    queued_job = before.tracker->Dispatch(queued);
  (void)no_job;

  RouteComputationWorker solver(before.repository, std::make_shared<ScriptedPlanner>(false));
  auto resolved_job = before.tracker->Dispatch(resolved);
  assert(solver.Execute(ComputeRouteTask{resolved_job.id, resolved.id, mesh.id}));

  // same store, fresh process state
  auto queue     = std::make_shared<TaskQueue>();
  auto registry  = std::make_shared<TaskRegistry>();
  auto restarted = std::make_shared<JobLifecycleTracker>(before.repository, queue, registry, "");

  assert(restarted->GetStatus(resolved_job.id).state == TaskState::kSuccess);
  assert(restarted->GetStatus(queued_job.id).state == TaskState::kPending);

  assert(restarted->RequeueUnfinished() == 2);
  assert(queue->Size() == 2);
  assert(registry->Find(queued_job.id) == TaskState::kPending);
  assert(queue->Dequeue()->task_id == queued_job.id);
  assert(queue->Dequeue()->route_id == no_job.id);

  // already tracked jobs are not queued twice
  assert(restarted->RequeueUnfinished() == 0);
}

void TestListRecentReportsLatestJobPerRoute() {
  Fixture fx;
  auto    mesh      = fx.StoreMesh();
  auto    with_jobs = fx.StoreRoute(mesh.id);
  auto    without   = fx.StoreRoute(mesh.id);
  (void)without;

  auto first  = fx.tracker->Dispatch(with_jobs);
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  auto second = fx.tracker->Dispatch(with_jobs);
  (void)first;

  auto recent = fx.tracker->ListRecent();
  assert(recent.size() == 1);
  assert(recent.front().job_id == second.id);
  assert(recent.front().route.id == with_jobs.id);
  assert(recent.front().state == TaskState::kPending);

  auto latest = fx.tracker->LatestJobForRoute(with_jobs.id);
  assert(latest.has_value());
  assert(latest->id == second.id);
  assert(fx.queue->Size() == 2);
}

} // namespace

int main() {
  TestSuccessfulComputationStoresBothStages();
  TestSmoothingFailureKeepsCheckpoint();
  TestMissingMeshIsRecordedOnRoute();
  TestDefaultMeshPathIsLoadedFromDisk();
  TestFailedJobReportsError();
  TestCancelledPendingJobNeverRuns();
  TestUnknownJobIsNotFound();
  TestDispatchAfterShutdownRecordsFailure();
  TestEvictedJobStateComesFromRoute();
  TestRequeueAfterRestart();
  TestListRecentReportsLatestJobPerRoute();

  std::cout << "routebroker_unit_job_lifecycle: pass\n";
  return 0;
}
