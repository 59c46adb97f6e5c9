#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/mesh_selector.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using routebroker::core::MeshSelector;
using routebroker::db::memory::MemoryRepository;
using routebroker::db::model::MeshRecord;
using routebroker::util::BoundingBox;
using routebroker::util::ParseCompactUtc;

MeshRecord StoreMesh(MemoryRepository& repo, const std::string& md5, const std::string& created, BoundingBox bounds) {
  MeshRecord mesh;
  mesh.md5     = md5;
  mesh.name    = md5 + ".vessel.json";
  mesh.created = ParseCompactUtc(created);
  mesh.bounds  = bounds;

  auto tx = repo.Begin();
  assert(repo.InsertMesh(*tx, mesh, "{}"));
  tx->Commit();
  return mesh;
}

void TestLatestDateOnly() {
  auto repo = std::make_shared<MemoryRepository>();
  StoreMesh(*repo, "m1", "20240101T000000", {-70.0, -60.0, -70.0, -60.0});
  auto m2 = StoreMesh(*repo, "m2", "20240102T000000", {-80.0, -50.0, -80.0, -50.0});

  MeshSelector selector(repo);
  auto         selected = selector.Select({{-65.0, -65.0}, {-61.0, -61.0}});
  assert(selected.size() == 1);
  assert(selected.front().id == m2.id);
}

void TestSameDateOrderedByExtent() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto large = StoreMesh(*repo, "large", "20240301T010000", {-80.0, -50.0, -80.0, -50.0});
  auto small = StoreMesh(*repo, "small", "20240301T230000", {-70.0, -60.0, -70.0, -60.0});

  MeshSelector selector(repo);
  auto         selected = selector.Select({{-65.0, -65.0}, {-61.0, -61.0}});
  assert(selected.size() == 2);
  assert(selected[0].id == small.id);
  assert(selected[1].id == large.id);
}

void TestEqualExtentTieBreaksOnId() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto first  = StoreMesh(*repo, "first", "20240301T120000", {0.0, 10.0, 0.0, 10.0});
  auto second = StoreMesh(*repo, "second", "20240301T080000", {1.0, 11.0, 1.0, 11.0});

  MeshSelector selector(repo);
  for (int i = 0; i < 3; ++i) {
    auto selected = selector.Select({{5.0, 5.0}, {6.0, 6.0}});
    assert(selected.size() == 2);
    assert(selected[0].id == first.id);
    assert(selected[1].id == second.id);
  }
}

void TestBoundaryPointsAreContained() {
  auto repo = std::make_shared<MemoryRepository>();
  auto mesh = StoreMesh(*repo, "edge", "20240101T000000", {-70.0, -60.0, -70.0, -60.0});

  MeshSelector selector(repo);
  auto         on_corner = selector.Select({{-70.0, -70.0}, {-60.0, -60.0}});
  assert(on_corner.size() == 1);
  assert(on_corner.front().id == mesh.id);

  assert(selector.Select({{-70.0001, -65.0}, {-61.0, -61.0}}).empty());
  assert(selector.Select({{-65.0, -65.0}, {-61.0, -59.9999}}).empty());
}

void TestNoMeshContainsBothPoints() {
  auto repo = std::make_shared<MemoryRepository>();
  StoreMesh(*repo, "south", "20240101T000000", {-70.0, -60.0, -70.0, -60.0});
  StoreMesh(*repo, "north", "20240101T000000", {60.0, 70.0, -70.0, -60.0});

  MeshSelector selector(repo);
  assert(selector.Select({{-65.0, -65.0}, {65.0, -65.0}}).empty());
}

void TestRouteEnvelopeSelectsMeshHoldingEveryVertex() {
  auto repo    = std::make_shared<MemoryRepository>();
  auto narrow  = StoreMesh(*repo, "narrow", "20240401T000000", {-66.0, -60.0, -66.0, -60.0});
  auto covered = StoreMesh(*repo, "covered", "20240401T000000", {-75.0, -55.0, -75.0, -55.0});
  (void)narrow;

  // both ends inside "narrow", the middle vertex is not
  const std::vector<routebroker::util::GeoPoint> route = {{-65.0, -65.0}, {-70.0, -62.0}, {-61.0, -61.0}};

  auto envelope = MeshSelector::Envelope(route);
  assert(envelope.start.lat == -70.0);
  assert(envelope.start.lon == -65.0);
  assert(envelope.end.lat == -61.0);
  assert(envelope.end.lon == -61.0);

  MeshSelector selector(repo);
  auto         selected = selector.SelectForRoute(route);
  assert(selected.size() == 1);
  assert(selected.front().id == covered.id);

  assert(selector.SelectForRoute({{10.0, 10.0}}).empty());

  bool threw = false;
  try {
    (void)MeshSelector::Envelope({});
  } catch (const routebroker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestRankWithoutRepository() {
  MeshRecord a;
  a.id      = 7;
  a.created = ParseCompactUtc("20240105T000000");
  a.bounds  = {0.0, 2.0, 0.0, 2.0};

  MeshRecord b = a;
  b.id         = 3;
  b.created    = ParseCompactUtc("20240104T235959");
  b.bounds     = {0.0, 1.0, 0.0, 1.0};

  auto ranked = MeshSelector::Rank({a, b});
  assert(ranked.size() == 1);
  assert(ranked.front().id == 7);
  assert(MeshSelector::Rank({}).empty());
}

} // namespace

int main() {
  TestLatestDateOnly();
  TestSameDateOrderedByExtent();
  TestEqualExtentTieBreaksOnId();
  TestBoundaryPointsAreContained();
  TestNoMeshContainsBothPoints();
  TestRouteEnvelopeSelectsMeshHoldingEveryVertex();
  TestRankWithoutRepository();

  std::cout << "routebroker_unit_mesh_selector: pass\n";
  return 0;
}
