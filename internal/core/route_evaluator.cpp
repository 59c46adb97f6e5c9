#include "route_evaluator.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace routebroker::core {

namespace {

// Last entry of a numeric array in the first feature's properties.
double FinalValue(const google::protobuf::Struct& route, const std::string& key) {
  const auto& feature    = route.fields().at("features").list_value().values(0).struct_value();
  const auto& properties = feature.fields().at("properties").struct_value().fields();

  auto it = properties.find(key);
  if (it == properties.end() || it->second.list_value().values_size() == 0) {
    throw std::runtime_error("evaluated route has no " + key);
  }
  const auto& values = it->second.list_value().values();
  return values[values.size() - 1].number_value();
}

} // namespace

RouteEvaluator::RouteEvaluator(std::shared_ptr<db::Repository> repository, std::shared_ptr<MeshSelector> selector,
                               std::shared_ptr<planner::RoutePlanner> planner)
    : repository_(std::move(repository)), selector_(std::move(selector)), planner_(std::move(planner)) {
}

std::optional<RouteEvaluation> RouteEvaluator::Evaluate(const google::protobuf::Struct& route) const {
  std::vector<util::GeoPoint> vertices;
  try {
    vertices = util::RouteVertices(route);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidArgument(e.what());
  }

  auto meshes = selector_->SelectForRoute(vertices);
  if (meshes.empty()) {
    observability::Metrics::Instance().RecordRouteEvaluation(false);
    return std::nullopt;
  }
  const auto& mesh = meshes.front();

  std::optional<std::string> mesh_json;
  {
    auto tx   = repository_->Begin();
    mesh_json = repository_->GetMeshJson(*tx, mesh.id);
    tx->Commit();
  }
  if (!mesh_json) {
    throw util::NotFound("mesh not found: " + std::to_string(mesh.id));
  }

  RouteEvaluation out;
  out.route       = planner_->Evaluate(util::ParseJsonObject(*mesh_json), route);
  out.mesh_id     = mesh.id;
  out.time_days   = FinalValue(out.route, "traveltime");
  out.time_str    = util::FormatDecimalDays(out.time_days);
  out.fuel_tonnes = std::round(FinalValue(out.route, "fuel") * 100.0) / 100.0;

  observability::Metrics::Instance().RecordRouteEvaluation(true);
  ROUTEBROKER_LOG_INFO("route evaluated", {observability::MeshId(mesh.id),
                                           observability::IntField("vertices", static_cast<int64_t>(vertices.size())),
                                           observability::DoubleField("time_days", out.time_days),
                                           observability::DoubleField("fuel_tonnes", out.fuel_tonnes)});
  return out;
}

} // namespace routebroker::core
