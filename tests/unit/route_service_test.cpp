#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/mesh_selector.hpp"
#include "internal/core/route_evaluator.hpp"
#include "internal/core/route_matcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/jobs/job_tracker.hpp"
#include "internal/jobs/task_queue.hpp"
#include "internal/jobs/task_registry.hpp"
#include "internal/planner/great_circle_planner.hpp"
#include "internal/service/mesh_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "routebroker/v1.hpp"

namespace {

using routebroker::db::memory::MemoryRepository;
using routebroker::db::model::MeshRecord;
using routebroker::service::MeshService;
using routebroker::service::RouteService;
using routebroker::service::ServiceContext;
using routebroker::v1::CancelRouteRequest;
using routebroker::v1::EvaluateRouteRequest;
using routebroker::v1::GetRouteStatusRequest;
using routebroker::v1::ImportMeshesRequest;
using routebroker::v1::JOB_STATE_FAILURE;
using routebroker::v1::JOB_STATE_PENDING;
using routebroker::v1::JOB_STATE_REVOKED;
using routebroker::v1::ListMeshesRequest;
using routebroker::v1::ListRecentRoutesRequest;
using routebroker::v1::RequestRouteRequest;

struct Harness {
  std::shared_ptr<MemoryRepository>             repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<routebroker::jobs::TaskQueue> queue      = std::make_shared<routebroker::jobs::TaskQueue>();
  std::shared_ptr<routebroker::jobs::TaskRegistry> registry = std::make_shared<routebroker::jobs::TaskRegistry>();
  ServiceContext                                ctx;

  Harness() {
    ctx.repository    = repository;
    ctx.mesh_selector = std::make_shared<routebroker::core::MeshSelector>(repository);
    ctx.route_matcher = std::make_shared<routebroker::core::RouteMatcher>(repository, 1.0);
    ctx.job_tracker   = std::make_shared<routebroker::jobs::JobLifecycleTracker>(repository, queue, registry, "");
  }

  MeshRecord StoreMesh() {
    MeshRecord mesh;
    mesh.md5     = "service-mesh";
    mesh.name    = "service.vessel.json";
    mesh.created = routebroker::util::Now();
    mesh.bounds  = {-80.0, -50.0, -80.0, -50.0};

    auto tx = repository->Begin();
    assert(repository->InsertMesh(*tx, mesh, "{}"));
    tx->Commit();
    return mesh;
  }

  std::size_t RouteCount() {
    auto tx     = repository->Begin();
    auto routes = repository->ListRoutesRequestedBetween(*tx, routebroker::util::FromUnixMillis(0),
                                                         routebroker::util::Now() + std::chrono::hours(1));
    tx->Commit();
    return routes.size();
  }
};

RequestRouteRequest MakeRequest(double start_lat, double start_lon, double end_lat, double end_lon) {
  RequestRouteRequest req;
  req.set_start_lat(start_lat);
  req.set_start_lon(start_lon);
  req.set_end_lat(end_lat);
  req.set_end_lon(end_lon);
  req.set_start_name("Rothera");
  req.set_end_name("Halley");
  return req;
}

void TestNoSuitableMesh() {
  Harness      h;
  RouteService service(h.ctx);

  auto resp = service.RequestRoute(MakeRequest(10.0, 10.0, 11.0, 11.0));
  assert(resp.status() == JOB_STATE_FAILURE);
  assert(resp.error() == "No suitable mesh available.");
  assert(resp.id().empty());
  assert(h.RouteCount() == 0);
}

void TestInvalidCoordinatesRejected() {
  Harness      h;
  RouteService service(h.ctx);

  bool threw = false;
  try {
    (void)service.RequestRoute(MakeRequest(-95.0, 0.0, 0.0, 0.0));
  } catch (const routebroker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  RequestRouteRequest partial;
  partial.set_start_lat(-65.0);
  threw = false;
  try {
    (void)service.RequestRoute(partial);
  } catch (const routebroker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNewRouteIsDispatched() {
  Harness      h;
  auto         mesh = h.StoreMesh();
  RouteService service(h.ctx);

  auto resp = service.RequestRoute(MakeRequest(-65.0, -65.0, -61.0, -61.0));
  assert(!resp.id().empty());
  assert(resp.status_url() == "/api/route/" + resp.id());
  assert(resp.status() == JOB_STATE_PENDING);
  assert(!resp.existing());
  assert(h.queue->Size() == 1);

  GetRouteStatusRequest status_req;
  status_req.set_id(resp.id());
  auto status = service.GetRouteStatus(status_req);
  assert(status.id() == resp.id());
  assert(status.status() == JOB_STATE_PENDING);
  assert(status.route().mesh_id() == mesh.id);
  assert(status.route().start_name() == "Rothera");
  assert(status.route().end_lat() == -61.0);
}

void TestExistingRouteIsReturned() {
  Harness      h;
  h.StoreMesh();
  RouteService service(h.ctx);

  auto first = service.RequestRoute(MakeRequest(-65.0, -65.0, -61.0, -61.0));

  // within 1nm at both ends
  auto again = service.RequestRoute(MakeRequest(-65.005, -65.0, -61.0, -61.005));
  assert(again.existing());
  assert(again.id() == first.id());
  assert(again.info().find("'force_recalculate': true") != std::string::npos);
  assert(again.route().start_lat() == -65.0);
  assert(h.RouteCount() == 1);
  assert(h.queue->Size() == 1);
}

void TestFailedExistingRouteReportsError() {
  Harness      h;
  h.StoreMesh();
  RouteService service(h.ctx);

  auto first = service.RequestRoute(MakeRequest(-65.0, -65.0, -61.0, -61.0));
  assert(h.registry->TryStart(first.id()));
  h.registry->Complete(first.id(), routebroker::jobs::ComputationOutcome::Failure("planner crashed"));

  {
    auto tx    = h.repository->Begin();
    auto route = h.repository->GetRoute(*tx, 1);
    route->info = "planner crashed";
    assert(h.repository->UpdateRoute(*tx, *route));
    tx->Commit();
  }

  auto again = service.RequestRoute(MakeRequest(-65.0, -65.0, -61.0, -61.0));
  assert(again.existing());
  assert(again.status() == JOB_STATE_FAILURE);
  assert(again.error() == "planner crashed");
}

void TestForceRecalculateCreatesNewRoute() {
  Harness      h;
  h.StoreMesh();
  RouteService service(h.ctx);

  auto first = service.RequestRoute(MakeRequest(-65.0, -65.0, -61.0, -61.0));

  auto forced_req = MakeRequest(-65.0, -65.0, -61.0, -61.0);
  forced_req.set_force_recalculate(true);
  auto forced = service.RequestRoute(forced_req);
  assert(!forced.existing());
  assert(forced.id() != first.id());
  assert(h.RouteCount() == 2);
  assert(h.queue->Size() == 2);
}

void TestConcurrentIdenticalRequestsShareOneRoute() {
  Harness      h;
  h.StoreMesh();
  RouteService service(h.ctx);

  constexpr int            kCallers = 8;
  std::vector<std::string> ids(kCallers);
  std::vector<std::thread> callers;
  for (int i = 0; i < kCallers; ++i) {
    callers.emplace_back([&, i] { ids[i] = service.RequestRoute(MakeRequest(-70.0, -70.0, -55.0, -55.0)).id(); });
  }
  for (auto& caller : callers) {
    caller.join();
  }

  std::set<std::string> distinct(ids.begin(), ids.end());
  assert(distinct.size() == 1);
  assert(h.RouteCount() == 1);
  assert(h.queue->Size() == 1);
}

void TestCancelAndRecent() {
  Harness      h;
  h.StoreMesh();
  RouteService service(h.ctx);

  auto resp = service.RequestRoute(MakeRequest(-65.0, -65.0, -61.0, -61.0));

  CancelRouteRequest cancel;
  cancel.set_id(resp.id());
  (void)service.CancelRoute(cancel);

  auto recent = service.ListRecentRoutes(ListRecentRoutesRequest{});
  assert(recent.routes_size() == 1);
  assert(recent.routes(0).id() == resp.id());
  assert(recent.routes(0).status() == JOB_STATE_REVOKED);

  GetRouteStatusRequest empty;
  bool                  threw = false;
  try {
    (void)service.GetRouteStatus(empty);
  } catch (const routebroker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestMeshServiceListsMeshes() {
  Harness h;
  auto    mesh = h.StoreMesh();

  MeshService service(h.ctx);
  auto        listed = service.ListMeshes(ListMeshesRequest{});
  assert(listed.meshes_size() == 1);
  assert(listed.meshes(0).id() == mesh.id);
  assert(listed.meshes(0).md5() == "service-mesh");
  assert(listed.meshes(0).size() == 900.0);

  bool threw = false;
  try {
    (void)service.ImportMeshes(ImportMeshesRequest{});
  } catch (const routebroker::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

void TestEvaluateRoute() {
  Harness      h;
  RouteService service(h.ctx);

  EvaluateRouteRequest req;
  *req.mutable_route() = routebroker::util::ParseJsonObject(
      R"({"type":"FeatureCollection","features":[{"type":"Feature","properties":{},)"
      R"("geometry":{"type":"LineString","coordinates":[[-65.0,-65.0],[-61.0,-61.0]]}}]})");

  bool threw = false;
  try {
    (void)service.EvaluateRoute(req);
  } catch (const routebroker::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  h.ctx.route_evaluator = std::make_shared<routebroker::core::RouteEvaluator>(
      h.repository, h.ctx.mesh_selector, std::make_shared<routebroker::planner::GreatCircleRoutePlanner>());
  RouteService evaluating(h.ctx);

  auto none = evaluating.EvaluateRoute(req);
  assert(none.error() == "No suitable mesh available.");
  assert(none.mesh_id() == 0);

  MeshRecord mesh;
  mesh.md5     = "evaluation-mesh";
  mesh.created = routebroker::util::Now();
  mesh.bounds  = {-80.0, -50.0, -80.0, -50.0};
  {
    auto tx = h.repository->Begin();
    assert(h.repository->InsertMesh(*tx, mesh, R"({"cellboxes":[],"config":{"vessel_info":{"max_speed":26.5}}})"));
    tx->Commit();
  }

  auto evaluated = evaluating.EvaluateRoute(req);
  assert(evaluated.error().empty());
  assert(evaluated.mesh_id() == mesh.id);
  assert(evaluated.time_days() > 0.0);
  assert(evaluated.fuel_tonnes() > 0.0);
  assert(!evaluated.time_str().empty());
  const auto& properties =
      evaluated.route().fields().at("features").list_value().values(0).struct_value().fields().at("properties").struct_value();
  assert(properties.fields().at("from").string_value() == "Start");
  assert(properties.fields().at("fuel").list_value().values_size() == 2);

  threw = false;
  try {
    (void)evaluating.EvaluateRoute(EvaluateRouteRequest{});
  } catch (const routebroker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  TestNoSuitableMesh();
  TestInvalidCoordinatesRejected();
  TestNewRouteIsDispatched();
  TestExistingRouteIsReturned();
  TestFailedExistingRouteReportsError();
  TestForceRecalculateCreatesNewRoute();
  TestConcurrentIdenticalRequestsShareOneRoute();
  TestCancelAndRecent();
  TestMeshServiceListsMeshes();
  TestEvaluateRoute();

  std::cout << "routebroker_unit_route_service: pass\n";
  return 0;
}
