#pragma once

#include <array>
#include <mutex>

#include "routebroker/v1.hpp"
#include "service_context.hpp"

namespace routebroker::service {

/*
  Request resolution: mesh selection, deduplication against stored routes
  and dispatch of new computations.

  Identical concurrent requests are serialized on a lock stripe chosen by
  the exact coordinates, so they resolve to one Route and one Job.
  Requests that only match within tolerance are not serialized.
*/
class RouteService {
public:
  explicit RouteService(ServiceContext ctx);

  routebroker::v1::RequestRouteResponse
  RequestRoute(const routebroker::v1::RequestRouteRequest& req);

  routebroker::v1::RouteStatus
  GetRouteStatus(const routebroker::v1::GetRouteStatusRequest& req);

  routebroker::v1::CancelRouteResponse
  CancelRoute(const routebroker::v1::CancelRouteRequest& req);

  routebroker::v1::ListRecentRoutesResponse
  ListRecentRoutes(const routebroker::v1::ListRecentRoutesRequest& req);

  routebroker::v1::EvaluateRouteResponse
  EvaluateRoute(const routebroker::v1::EvaluateRouteRequest& req);

private:
  static constexpr std::size_t kLockStripes = 64;

  std::mutex& StripeFor(const util::Endpoints& endpoints);

  ServiceContext ctx_;
  std::array<std::mutex, kLockStripes> stripes_;
};

}
