#pragma once

#include <optional>
#include <vector>

#include "internal/db/model/route_record.hpp"

namespace routebroker::core {

/*
  Fuzzy route lookup.

  A route qualifies when its start is strictly closer than tolerance_nm to
  the requested start and its end strictly closer to the requested end.
  The qualifier with the smallest summed distance wins; ties go to the
  lowest route id.
*/
std::optional<db::model::RouteRecord> ClosestWithinTolerance(const std::vector<db::model::RouteRecord>& routes,
                                                             const util::Endpoints& endpoints, double tolerance_nm);

} // namespace routebroker::core
