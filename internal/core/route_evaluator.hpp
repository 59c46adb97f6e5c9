#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/core/mesh_selector.hpp"
#include "internal/planner/route_planner.hpp"

namespace routebroker::core {

struct RouteEvaluation {
  google::protobuf::Struct route;  // input route with traveltime / fuel arrays
  int64_t                  mesh_id     = 0;
  double                   time_days   = 0.0;
  std::string              time_str;
  double                   fuel_tonnes = 0.0;  // rounded to 2 decimals
};

/*
  Travel time and fuel of an existing GeoJSON route.

  The route is replayed by the planner over the first mesh MeshSelector
  ranks for the route's envelope. Runs on the caller's thread.
*/
class RouteEvaluator {
 public:
  RouteEvaluator(std::shared_ptr<db::Repository> repository, std::shared_ptr<MeshSelector> selector,
                 std::shared_ptr<planner::RoutePlanner> planner);

  // nullopt when no stored mesh contains the route.
  // Throws util::InvalidArgument for a route without usable coordinates.
  std::optional<RouteEvaluation> Evaluate(const google::protobuf::Struct& route) const;

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<MeshSelector>          selector_;
  std::shared_ptr<planner::RoutePlanner> planner_;
};

} // namespace routebroker::core
