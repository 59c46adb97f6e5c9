#pragma once

#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace routebroker::core {

/*
  Picks the meshes able to serve a route request.

  Candidates contain both endpoints (closed bounds). Only meshes created on
  the latest UTC calendar date among the candidates are kept, ordered by
  ascending extent, ties by ascending id. Read only.
*/
class MeshSelector {
 public:
  explicit MeshSelector(std::shared_ptr<db::Repository> repository);

  std::vector<db::model::MeshRecord> Select(const util::Endpoints& endpoints) const;

  // Meshes able to evaluate an existing route: the request is the route's
  // envelope, (min lat, min lon) to (max lat, max lon), so every vertex
  // lies inside the selected mesh.
  std::vector<db::model::MeshRecord> SelectForRoute(const std::vector<util::GeoPoint>& vertices) const;

  static util::Endpoints Envelope(const std::vector<util::GeoPoint>& vertices);

  // Date filter and ordering applied to meshes already known to contain the endpoints.
  static std::vector<db::model::MeshRecord> Rank(std::vector<db::model::MeshRecord> containing);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace routebroker::core
