#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/planner/great_circle_planner.hpp"
#include "internal/util/json.hpp"

namespace {

using routebroker::planner::GreatCircleRoutePlanner;
using routebroker::planner::GreatCircleTrack;
using routebroker::planner::Waypoint;

const std::vector<Waypoint> kWaypoints = {{"Start", {-65.0, -65.0}}, {"End", {-61.0, -61.0}}};

google::protobuf::Struct Mesh() {
  return routebroker::util::ParseJsonObject(R"({"cellboxes":[],"config":{}})");
}

const google::protobuf::Struct& FirstFeature(const google::protobuf::Struct& collection) {
  return collection.fields().at("features").list_value().values(0).struct_value();
}

void TestTrackEndpointsAndSpacing() {
  auto track = GreatCircleTrack({0.0, 0.0}, {0.0, 90.0}, 3);
  assert(track.size() == 4);
  assert(track.front().lon == 0.0);
  assert(track.back().lon == 90.0);
  assert(std::fabs(track[1].lon - 30.0) < 1e-9);
  assert(std::fabs(track[1].lat) < 1e-9);

  auto degenerate = GreatCircleTrack({10.0, 10.0}, {10.0, 10.0}, 8);
  assert(degenerate.size() == 2);
}

void TestSessionProducesBothStages() {
  GreatCircleRoutePlanner planner(4);
  auto                    session = planner.Start(Mesh(), kWaypoints);

  auto unsmoothed = session->ComputeRoutes();
  assert(unsmoothed.fields().at("type").string_value() == "FeatureCollection");
  const auto& feature = FirstFeature(unsmoothed);
  assert(feature.fields().at("properties").struct_value().fields().at("stage").string_value() == "unsmoothed");
  assert(feature.fields().at("properties").struct_value().fields().at("from").string_value() == "Start");
  assert(feature.fields().at("geometry").struct_value().fields().at("coordinates").list_value().values_size() == 5);

  auto smoothed = session->ComputeSmoothedRoutes();
  const auto& smoothed_feature = FirstFeature(smoothed);
  assert(smoothed_feature.fields().at("properties").struct_value().fields().at("stage").string_value() == "smoothed");
  assert(smoothed_feature.fields().at("geometry").struct_value().fields().at("coordinates").list_value().values_size() == 17);
  assert(planner.Version() == "great-circle/1.0");
}

void TestSmoothingRequiresRoutes() {
  GreatCircleRoutePlanner planner;
  auto                    session = planner.Start(Mesh(), kWaypoints);

  bool threw = false;
  try {
    (void)session->ComputeSmoothedRoutes();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestStartRejectsBadInput() {
  GreatCircleRoutePlanner planner;

  bool threw = false;
  try {
    (void)planner.Start(google::protobuf::Struct{}, kWaypoints);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)planner.Start(Mesh(), {kWaypoints[0]});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestAntipodalEndpointsAreRejected() {
  bool threw = false;
  try {
    (void)GreatCircleTrack({0.0, 0.0}, {0.0, 180.0}, 4);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  GreatCircleRoutePlanner planner;
  threw = false;
  try {
    (void)planner.Start(Mesh(), {{"Start", {-45.0, 30.0}}, {"End", {45.0, -150.0}}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestEvaluateAddsCumulativeTimeAndFuel() {
  const auto route = routebroker::util::ParseJsonObject(
      R"({"type":"FeatureCollection","features":[{"type":"Feature",)"
      R"("geometry":{"type":"LineString","coordinates":[[0.0,0.0],[1.0,0.0],[2.0,0.0]]}}]})");
  const auto mesh = routebroker::util::ParseJsonObject(R"({"cellboxes":[],"config":{"vessel_info":{"max_speed":20.0}}})");

  GreatCircleRoutePlanner planner(8, {10.0, 24.0});
  auto                    evaluated = planner.Evaluate(mesh, route);

  const auto& properties = FirstFeature(evaluated).fields().at("properties").struct_value().fields();
  assert(properties.at("from").string_value() == "Start");
  assert(properties.at("to").string_value() == "End");

  const auto& traveltime = properties.at("traveltime").list_value();
  const auto& fuel       = properties.at("fuel").list_value();
  assert(traveltime.values_size() == 3);
  assert(fuel.values_size() == 3);
  assert(traveltime.values(0).number_value() == 0.0);

  // mesh speed wins over the profile speed; fuel burns 24 t/day
  const double leg_km = routebroker::util::HaversineNm({0.0, 0.0}, {0.0, 1.0}) * routebroker::util::kKmPerNauticalMile;
  const double days   = 2.0 * leg_km / 20.0 / 24.0;
  assert(std::fabs(traveltime.values(2).number_value() - days) < 1e-9);
  assert(std::fabs(fuel.values(2).number_value() - days * 24.0) < 1e-9);
  assert(traveltime.values(1).number_value() < traveltime.values(2).number_value());

  // geometry is untouched
  assert(FirstFeature(evaluated).fields().at("geometry").struct_value().fields().at("coordinates").list_value().values_size() == 3);

  const auto slow = planner.Evaluate(Mesh(), route);
  const auto& slow_time =
      FirstFeature(slow).fields().at("properties").struct_value().fields().at("traveltime").list_value();
  assert(std::fabs(slow_time.values(2).number_value() - 2.0 * days) < 1e-9);
}

void TestEvaluateRejectsRouteWithoutCoordinates() {
  GreatCircleRoutePlanner planner;
  bool                    threw = false;
  try {
    (void)planner.Evaluate(Mesh(), routebroker::util::ParseJsonObject(R"({"type":"FeatureCollection","features":[]})"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTrackEndpointsAndSpacing();
  TestSessionProducesBothStages();
  TestSmoothingRequiresRoutes();
  TestStartRejectsBadInput();
  TestAntipodalEndpointsAreRejected();
  TestEvaluateAddsCumulativeTimeAndFuel();
  TestEvaluateRejectsRouteWithoutCoordinates();

  std::cout << "routebroker_unit_great_circle_planner: pass\n";
  return 0;
}
