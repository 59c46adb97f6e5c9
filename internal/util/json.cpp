#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace routebroker::util {

google::protobuf::Struct ParseJsonObject(const std::string& json) {
  google::protobuf::Struct value;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &value, options);
  if (!status.ok()) {
    throw std::invalid_argument("invalid JSON document: " + std::string(status.message()));
  }
  return value;
}

std::string ToJson(const google::protobuf::Struct& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize JSON document: " + std::string(status.message()));
  }
  return json;
}

std::vector<GeoPoint> RouteVertices(const google::protobuf::Struct& route) {
  const auto features = route.fields().find("features");
  if (features == route.fields().end() || features->second.list_value().values_size() == 0) {
    throw std::invalid_argument("route has no features");
  }

  const auto& feature  = features->second.list_value().values(0).struct_value().fields();
  const auto  geometry = feature.find("geometry");
  if (geometry == feature.end()) {
    throw std::invalid_argument("route feature has no geometry");
  }

  const auto& geometry_fields = geometry->second.struct_value().fields();
  const auto  coordinates     = geometry_fields.find("coordinates");
  if (coordinates == geometry_fields.end()) {
    throw std::invalid_argument("route geometry has no coordinates");
  }

  std::vector<GeoPoint> vertices;
  for (const auto& value : coordinates->second.list_value().values()) {
    const auto& pair = value.list_value();
    if (pair.values_size() < 2 || !pair.values(0).has_number_value() || !pair.values(1).has_number_value()) {
      throw std::invalid_argument("route coordinate is not a [lon, lat] pair");
    }
    vertices.push_back({pair.values(1).number_value(), pair.values(0).number_value()});
  }
  if (vertices.empty()) {
    throw std::invalid_argument("route has no coordinates");
  }
  return vertices;
}

} // namespace routebroker::util
