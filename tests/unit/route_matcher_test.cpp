#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/route_matcher.hpp"
#include "internal/core/tolerance_ranker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace {

using routebroker::core::ClosestWithinTolerance;
using routebroker::core::RouteMatcher;
using routebroker::db::memory::MemoryRepository;
using routebroker::db::model::MeshRecord;
using routebroker::db::model::RouteRecord;
using routebroker::util::Endpoints;
using routebroker::util::HaversineNm;

const Endpoints kStored{{-65.00, -65.00}, {-60.00, -60.00}};

MeshRecord StoreMesh(MemoryRepository& repo, const std::string& md5) {
  MeshRecord mesh;
  mesh.md5     = md5;
  mesh.created = routebroker::util::Now();
  mesh.bounds  = {-80.0, -50.0, -80.0, -50.0};

  auto tx = repo.Begin();
  assert(repo.InsertMesh(*tx, mesh, "{}"));
  tx->Commit();
  return mesh;
}

RouteRecord StoreRoute(MemoryRepository& repo, int64_t mesh_id, const Endpoints& endpoints) {
  RouteRecord route;
  route.requested = routebroker::util::Now();
  route.mesh_id   = mesh_id;
  route.endpoints = endpoints;

  auto tx = repo.Begin();
  assert(repo.InsertRoute(*tx, route));
  tx->Commit();
  return route;
}

RouteRecord Candidate(int64_t id, const Endpoints& endpoints) {
  RouteRecord route;
  route.id        = id;
  route.endpoints = endpoints;
  return route;
}

void TestEndOutsideToleranceDoesNotMatch() {
  const Endpoints request{{-65.01, -64.99}, {-60.50, -60.00}};
  assert(HaversineNm(request.start, kStored.start) < 1.0);
  assert(HaversineNm(request.end, kStored.end) > 5.0);

  auto match = ClosestWithinTolerance({Candidate(1, kStored)}, request, 5.0);
  assert(!match.has_value());
}

void TestBothEndsWithinToleranceMatch() {
  const Endpoints request{{-65.01, -64.99}, {-60.02, -60.00}};
  auto            match = ClosestWithinTolerance({Candidate(1, kStored)}, request, 5.0);
  assert(match.has_value());
  assert(match->id == 1);
}

void TestSmallestSummedDistanceWins() {
  // 1.5nm off at each end (3.0nm total) versus 0.6nm (1.2nm total)
  const Endpoints far{{kStored.start.lat + 0.025, kStored.start.lon}, {kStored.end.lat + 0.025, kStored.end.lon}};
  const Endpoints near{{kStored.start.lat + 0.010, kStored.start.lon}, {kStored.end.lat + 0.010, kStored.end.lon}};

  auto match = ClosestWithinTolerance({Candidate(1, far), Candidate(2, near)}, kStored, 5.0);
  assert(match.has_value());
  assert(match->id == 2);
}

void TestToleranceIsStrict() {
  const Endpoints offset{{kStored.start.lat + 0.05, kStored.start.lon}, {kStored.end.lat, kStored.end.lon}};
  const double    distance = HaversineNm(offset.start, kStored.start);

  assert(!ClosestWithinTolerance({Candidate(1, offset)}, kStored, distance).has_value());
  assert(ClosestWithinTolerance({Candidate(1, offset)}, kStored, distance + 1e-6).has_value());
}

void TestEqualDistanceTieBreaksOnId() {
  auto match = ClosestWithinTolerance({Candidate(9, kStored), Candidate(4, kStored), Candidate(6, kStored)}, kStored, 1.0);
  assert(match.has_value());
  assert(match->id == 4);
}

void TestExactMatchPreferredOverCloser() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto mesh  = StoreMesh(*repo, "mesh");
  auto fuzzy = StoreRoute(*repo, mesh.id, {{-65.001, -65.0}, {-60.0, -60.0}});
  auto exact = StoreRoute(*repo, mesh.id, kStored);
  auto dup   = StoreRoute(*repo, mesh.id, kStored);
  (void)fuzzy;

  RouteMatcher matcher(repo, 5.0);
  for (int i = 0; i < 3; ++i) {
    auto match = matcher.FindExisting({mesh}, kStored);
    assert(match.has_value());
    assert(match->id == exact.id);
    assert(match->id < dup.id);
  }
}

void TestFirstMeshWithRoutesDecides() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto empty  = StoreMesh(*repo, "empty");
  auto first  = StoreMesh(*repo, "first");
  auto second = StoreMesh(*repo, "second");

  // only a far route in the first mesh; an exact one in the second
  StoreRoute(*repo, first.id, {{-70.0, -70.0}, {-55.0, -55.0}});
  StoreRoute(*repo, second.id, kStored);

  RouteMatcher matcher(repo, 5.0);
  assert(!matcher.FindExisting({empty, first, second}, kStored).has_value());

  auto match = matcher.FindExisting({empty, second, first}, kStored);
  assert(match.has_value());
  assert(match->mesh_id == second.id);
}

void TestNoMeshesNoMatch() {
  auto         repo = std::make_shared<MemoryRepository>();
  RouteMatcher matcher(repo, 1.0);
  assert(!matcher.FindExisting({}, kStored).has_value());
  assert(matcher.tolerance_nm() == 1.0);
}

} // namespace

int main() {
  TestEndOutsideToleranceDoesNotMatch();
  TestBothEndsWithinToleranceMatch();
  TestSmallestSummedDistanceWins();
  TestToleranceIsStrict();
  TestEqualDistanceTieBreaksOnId();
  TestExactMatchPreferredOverCloser();
  TestFirstMeshWithRoutesDecides();
  TestNoMeshesNoMatch();

  std::cout << "routebroker_unit_route_matcher: pass\n";
  return 0;
}
