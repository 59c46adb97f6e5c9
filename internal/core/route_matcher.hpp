#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace routebroker::core {

/*
  Finds a stored route equivalent to a request.

  Candidate meshes are visited in the given order and the first mesh that
  owns any route decides the outcome: an exact coordinate match (lowest id
  when several), otherwise the closest route within tolerance. Later
  meshes are never consulted once one with routes has been found.
*/
class RouteMatcher {
 public:
  RouteMatcher(std::shared_ptr<db::Repository> repository, double tolerance_nm);

  std::optional<db::model::RouteRecord> FindExisting(const std::vector<db::model::MeshRecord>& meshes,
                                                     const util::Endpoints& endpoints) const;

  double tolerance_nm() const {
    return tolerance_nm_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  double                          tolerance_nm_;
};

bool SameCoordinates(const util::Endpoints& a, const util::Endpoints& b);

} // namespace routebroker::core
