#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace routebroker::db::model {

/*
  Persistent route row.

  A route is resolved once calculated is set and json (final geometry) is
  non-empty. json_unsmoothed set with json empty is the checkpoint left by
  the first computation stage.
*/

struct RouteRecord {
  int64_t id = 0;  // assigned by the repository on insert

  util::TimePoint                requested{};
  std::optional<util::TimePoint> calculated;

  std::string file;
  std::string info;  // error text of a failed computation

  std::optional<int64_t> mesh_id;

  util::Endpoints endpoints;
  std::string     start_name;
  std::string     end_name;

  // GeoJSON text, empty when absent.
  std::string json_unsmoothed;
  std::string json;

  std::string planner_version;

  bool IsResolved() const {
    return calculated.has_value() && !json.empty();
  }
};

} // namespace routebroker::db::model
