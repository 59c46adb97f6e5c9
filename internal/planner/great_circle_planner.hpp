#pragma once

#include "internal/planner/route_planner.hpp"

namespace routebroker::planner {

// Vessel figures used when the mesh does not provide them.
struct VesselProfile {
  double speed_kmh           = 26.5;
  double fuel_tonnes_per_day = 21.0;
};

/*
  Planner that ignores the mesh content and follows the great circle
  between source and destination. The unsmoothed track has one vertex per
  segment boundary; smoothing densifies it.

  Evaluation sails every leg at config.vessel_info.max_speed (km/h) when
  the mesh carries it, at the profile speed otherwise, burning fuel at a
  constant daily rate.
*/
class GreatCircleRoutePlanner final : public RoutePlanner {
 public:
  explicit GreatCircleRoutePlanner(int segments = 8, VesselProfile vessel = {});

  std::string Version() const override;

  std::unique_ptr<PlanningSession> Start(const google::protobuf::Struct& mesh, const std::vector<Waypoint>& waypoints) override;

  google::protobuf::Struct Evaluate(const google::protobuf::Struct& mesh, const google::protobuf::Struct& route) override;

 private:
  double SpeedKmh(const google::protobuf::Struct& mesh) const;

  int           segments_;
  VesselProfile vessel_;
};

// Points along the great circle from a to b, both ends included.
// Throws std::invalid_argument for antipodal endpoints.
std::vector<util::GeoPoint> GreatCircleTrack(const util::GeoPoint& a, const util::GeoPoint& b, int segments);

} // namespace routebroker::planner
