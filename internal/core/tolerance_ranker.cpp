#include "tolerance_ranker.hpp"

namespace routebroker::core {

std::optional<db::model::RouteRecord> ClosestWithinTolerance(const std::vector<db::model::RouteRecord>& routes,
                                                             const util::Endpoints& endpoints, double tolerance_nm) {
  const db::model::RouteRecord* best          = nullptr;
  double                        best_distance = 0.0;

  for (const auto& route : routes) {
    const double start_nm = util::HaversineNm(route.endpoints.start, endpoints.start);
    const double end_nm   = util::HaversineNm(route.endpoints.end, endpoints.end);
    if (start_nm >= tolerance_nm || end_nm >= tolerance_nm) {
      continue;
    }

    const double total = start_nm + end_nm;
    if (!best || total < best_distance || (total == best_distance && route.id < best->id)) {
      best          = &route;
      best_distance = total;
    }
  }

  if (!best) return std::nullopt;
  return *best;
}

} // namespace routebroker::core
