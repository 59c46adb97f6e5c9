#include "great_circle_planner.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "internal/util/json.hpp"

namespace routebroker::planner {

namespace {

using util::ToDegrees;
using util::ToRadians;

constexpr double kHoursPerDay = 24.0;

// central angle this close to pi leaves the interpolation plane undefined
constexpr double kAntipodalEpsilon = 1e-6;

const google::protobuf::Value* Field(const google::protobuf::Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

google::protobuf::Struct FeatureCollection(const std::vector<Waypoint>& waypoints, const std::vector<util::GeoPoint>& track,
                                           const std::string& stage) {
  google::protobuf::Struct geometry;
  (*geometry.mutable_fields())["type"].set_string_value("LineString");
  auto* coordinates = (*geometry.mutable_fields())["coordinates"].mutable_list_value();
  for (const auto& p : track) {
    auto* pair = coordinates->add_values()->mutable_list_value();
    pair->add_values()->set_number_value(p.lon);
    pair->add_values()->set_number_value(p.lat);
  }

  google::protobuf::Struct properties;
  (*properties.mutable_fields())["from"].set_string_value(waypoints[0].name);
  (*properties.mutable_fields())["to"].set_string_value(waypoints[1].name);
  (*properties.mutable_fields())["stage"].set_string_value(stage);
  (*properties.mutable_fields())["distance_nm"].set_number_value(util::HaversineNm(waypoints[0].point, waypoints[1].point));

  google::protobuf::Struct feature;
  (*feature.mutable_fields())["type"].set_string_value("Feature");
  *(*feature.mutable_fields())["geometry"].mutable_struct_value()   = std::move(geometry);
  *(*feature.mutable_fields())["properties"].mutable_struct_value() = std::move(properties);

  google::protobuf::Struct collection;
  (*collection.mutable_fields())["type"].set_string_value("FeatureCollection");
  *(*collection.mutable_fields())["features"].mutable_list_value()->add_values()->mutable_struct_value() = std::move(feature);
  return collection;
}

class GreatCircleSession final : public PlanningSession {
 public:
  GreatCircleSession(std::vector<Waypoint> waypoints, int segments) : waypoints_(std::move(waypoints)), segments_(segments) {
  }

  google::protobuf::Struct ComputeRoutes() override {
    computed_ = true;
    return FeatureCollection(waypoints_, GreatCircleTrack(waypoints_[0].point, waypoints_[1].point, segments_), "unsmoothed");
  }

  google::protobuf::Struct ComputeSmoothedRoutes() override {
    if (!computed_) {
      throw std::logic_error("ComputeSmoothedRoutes called before ComputeRoutes");
    }
    return FeatureCollection(waypoints_, GreatCircleTrack(waypoints_[0].point, waypoints_[1].point, segments_ * 4), "smoothed");
  }

 private:
  std::vector<Waypoint> waypoints_;
  int                   segments_;
  bool                  computed_ = false;
};

} // namespace

GreatCircleRoutePlanner::GreatCircleRoutePlanner(int segments, VesselProfile vessel) : segments_(std::max(1, segments)), vessel_(vessel) {
}

std::string GreatCircleRoutePlanner::Version() const {
  return "great-circle/1.0";
}

std::unique_ptr<PlanningSession> GreatCircleRoutePlanner::Start(const google::protobuf::Struct& mesh, const std::vector<Waypoint>& waypoints) {
  if (waypoints.size() != 2) {
    throw std::invalid_argument("planner expects exactly two waypoints");
  }
  if (mesh.fields().empty()) {
    throw std::invalid_argument("mesh document is empty");
  }
  // fail here rather than in the first stage
  (void)GreatCircleTrack(waypoints[0].point, waypoints[1].point, 1);
  return std::make_unique<GreatCircleSession>(waypoints, segments_);
}

double GreatCircleRoutePlanner::SpeedKmh(const google::protobuf::Struct& mesh) const {
  const auto* config = Field(mesh, "config");
  if (config && config->has_struct_value()) {
    const auto* vessel = Field(config->struct_value(), "vessel_info");
    if (vessel && vessel->has_struct_value()) {
      const auto* speed = Field(vessel->struct_value(), "max_speed");
      if (speed && speed->has_number_value() && speed->number_value() > 0.0) {
        return speed->number_value();
      }
    }
  }
  return vessel_.speed_kmh;
}

google::protobuf::Struct GreatCircleRoutePlanner::Evaluate(const google::protobuf::Struct& mesh, const google::protobuf::Struct& route) {
  if (mesh.fields().empty()) {
    throw std::invalid_argument("mesh document is empty");
  }

  const auto   vertices = util::RouteVertices(route);
  const double speed    = SpeedKmh(mesh);

  google::protobuf::ListValue traveltime;
  google::protobuf::ListValue fuel;
  double                      distance_km = 0.0;
  for (size_t i = 0; i < vertices.size(); ++i) {
    if (i > 0) {
      distance_km += util::HaversineNm(vertices[i - 1], vertices[i]) * util::kKmPerNauticalMile;
    }
    const double days = distance_km / speed / kHoursPerDay;
    traveltime.add_values()->set_number_value(days);
    fuel.add_values()->set_number_value(days * vessel_.fuel_tonnes_per_day);
  }

  google::protobuf::Struct evaluated = route;
  auto* feature = (*evaluated.mutable_fields())["features"].mutable_list_value()->mutable_values(0)->mutable_struct_value();
  auto* properties = (*feature->mutable_fields())["properties"].mutable_struct_value();
  if (properties->fields().count("from") == 0) {
    (*properties->mutable_fields())["from"].set_string_value("Start");
  }
  if (properties->fields().count("to") == 0) {
    (*properties->mutable_fields())["to"].set_string_value("End");
  }
  *(*properties->mutable_fields())["traveltime"].mutable_list_value() = std::move(traveltime);
  *(*properties->mutable_fields())["fuel"].mutable_list_value()       = std::move(fuel);
  return evaluated;
}

std::vector<util::GeoPoint> GreatCircleTrack(const util::GeoPoint& a, const util::GeoPoint& b, int segments) {
  const double lat1 = ToRadians(a.lat);
  const double lon1 = ToRadians(a.lon);
  const double lat2 = ToRadians(b.lat);
  const double lon2 = ToRadians(b.lon);

  const double angle = util::HaversineNm(a, b) * util::kKmPerNauticalMile / util::kEarthRadiusKm;

  std::vector<util::GeoPoint> track;
  track.reserve(static_cast<size_t>(segments) + 1);

  // coincident endpoints: no interpolation possible
  if (angle < 1e-12) {
    track.push_back(a);
    track.push_back(b);
    return track;
  }

  if (std::numbers::pi - angle < kAntipodalEpsilon) {
    throw std::invalid_argument("endpoints are antipodal: great circle is undefined");
  }

  const double sin_angle = std::sin(angle);
  for (int i = 0; i <= segments; ++i) {
    const double f  = static_cast<double>(i) / segments;
    const double ka = std::sin((1.0 - f) * angle) / sin_angle;
    const double kb = std::sin(f * angle) / sin_angle;

    const double x = ka * std::cos(lat1) * std::cos(lon1) + kb * std::cos(lat2) * std::cos(lon2);
    const double y = ka * std::cos(lat1) * std::sin(lon1) + kb * std::cos(lat2) * std::sin(lon2);
    const double z = ka * std::sin(lat1) + kb * std::sin(lat2);

    track.push_back({ToDegrees(std::atan2(z, std::sqrt(x * x + y * y))), ToDegrees(std::atan2(y, x))});
  }
  track.front() = a;
  track.back()  = b;
  return track;
}

} // namespace routebroker::planner
