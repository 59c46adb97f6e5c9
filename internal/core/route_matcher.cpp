#include "route_matcher.hpp"

#include "internal/core/tolerance_ranker.hpp"

namespace routebroker::core {

bool SameCoordinates(const util::Endpoints& a, const util::Endpoints& b) {
  return a.start.lat == b.start.lat && a.start.lon == b.start.lon && a.end.lat == b.end.lat && a.end.lon == b.end.lon;
}

RouteMatcher::RouteMatcher(std::shared_ptr<db::Repository> repository, double tolerance_nm)
    : repository_(std::move(repository)), tolerance_nm_(tolerance_nm) {
}

std::optional<db::model::RouteRecord> RouteMatcher::FindExisting(const std::vector<db::model::MeshRecord>& meshes,
                                                                 const util::Endpoints& endpoints) const {
  auto tx = repository_->Begin();

  for (const auto& mesh : meshes) {
    auto routes = repository_->ListRoutesByMesh(*tx, mesh.id);
    if (routes.empty()) {
      continue;
    }
    tx->Commit();

    // routes arrive ordered by id, so the first exact hit is the lowest id
    for (const auto& route : routes) {
      if (SameCoordinates(route.endpoints, endpoints)) {
        return route;
      }
    }
    return ClosestWithinTolerance(routes, endpoints, tolerance_nm_);
  }

  tx->Commit();
  return std::nullopt;
}

} // namespace routebroker::core
