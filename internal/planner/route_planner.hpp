#pragma once

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/util/geo.hpp"

namespace routebroker::planner {

struct Waypoint {
  std::string    name;
  util::GeoPoint point;
};

/*
  One planning run over a loaded mesh.

  ComputeRoutes must be called before ComputeSmoothedRoutes. Both return a
  GeoJSON FeatureCollection and throw on failure.
*/
class PlanningSession {
 public:
  virtual ~PlanningSession() = default;

  virtual google::protobuf::Struct ComputeRoutes()         = 0;
  virtual google::protobuf::Struct ComputeSmoothedRoutes() = 0;
};

/*
  Boundary to the external route optimizer.

  waypoints[0] is the source, waypoints[1] the destination.
*/
class RoutePlanner {
 public:
  virtual ~RoutePlanner() = default;

  // Version tag stored on every computed route.
  virtual std::string Version() const = 0;

  virtual std::unique_ptr<PlanningSession> Start(const google::protobuf::Struct& mesh, const std::vector<Waypoint>& waypoints) = 0;

  // Replays an existing GeoJSON route over the mesh. The returned route
  // carries cumulative "traveltime" (days) and "fuel" (tonnes) arrays, one
  // entry per vertex, in its first feature's properties. Throws on failure.
  virtual google::protobuf::Struct Evaluate(const google::protobuf::Struct& mesh, const google::protobuf::Struct& route) = 0;
};

} // namespace routebroker::planner
