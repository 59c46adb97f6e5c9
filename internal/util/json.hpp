#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/util/geo.hpp"

namespace routebroker::util {

/*
  JSON documents (mesh content, GeoJSON routes) travel as text in the
  repository and as google.protobuf.Struct on the wire.
*/

// Throws std::invalid_argument when the text is not a JSON object.
google::protobuf::Struct ParseJsonObject(const std::string& json);

std::string ToJson(const google::protobuf::Struct& value);

// Vertices of the first feature of a GeoJSON FeatureCollection, read from
// [lon, lat] pairs. Throws std::invalid_argument when the document has no
// such feature or a vertex is malformed.
std::vector<GeoPoint> RouteVertices(const google::protobuf::Struct& route);

} // namespace routebroker::util
