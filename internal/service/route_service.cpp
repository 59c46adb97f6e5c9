#include "route_service.hpp"

#include <functional>

#include "internal/core/mesh_selector.hpp"
#include "internal/core/route_evaluator.hpp"
#include "internal/core/route_matcher.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/jobs/job_tracker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace routebroker::service {

using namespace routebroker::v1;
using namespace routebroker::observability;

namespace {

constexpr const char* kNoMeshError = "No suitable mesh available.";
constexpr const char* kExistingRouteInfo =
    "Pre-existing route found and returned. To force new calculation, include 'force_recalculate': true in request.";

util::Endpoints ValidatedEndpoints(const RequestRouteRequest& req) {
  if (!req.has_start_lat() || !req.has_start_lon() || !req.has_end_lat() || !req.has_end_lon()) {
    throw util::InvalidArgument("start_lat, start_lon, end_lat and end_lon are required");
  }

  util::Endpoints endpoints{{req.start_lat(), req.start_lon()}, {req.end_lat(), req.end_lon()}};
  if (!util::IsValidCoordinate(endpoints.start)) {
    throw util::InvalidArgument("start coordinate out of range");
  }
  if (!util::IsValidCoordinate(endpoints.end)) {
    throw util::InvalidArgument("end coordinate out of range");
  }
  return endpoints;
}

RouteStatus ToRouteStatus(const jobs::JobStatus& status) {
  RouteStatus out;
  out.set_id(status.job_id);
  out.set_status(ToProto(status.state));
  *out.mutable_route() = ToProto(status.route);
  if (status.state == jobs::TaskState::kFailure) {
    out.set_error(status.error);
  }
  return out;
}

} // namespace

RouteService::RouteService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::mutex& RouteService::StripeFor(const util::Endpoints& e) {
  std::size_t seed = 0;
  for (double v : {e.start.lat, e.start.lon, e.end.lat, e.end.lon}) {
    seed ^= std::hash<double>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  }
  return stripes_[seed % kLockStripes];
}

RequestRouteResponse RouteService::RequestRoute(const RequestRouteRequest& req) {
  return ObserveRpc("RouteService.RequestRoute", [&] {
    const auto endpoints = ValidatedEndpoints(req);

    RequestRouteResponse resp;

    auto meshes = ctx_.mesh_selector->Select(endpoints);
    if (meshes.empty()) {
      ROUTEBROKER_LOG_INFO("no suitable mesh", {DoubleField("start_lat", endpoints.start.lat), DoubleField("start_lon", endpoints.start.lon),
                                                DoubleField("end_lat", endpoints.end.lat), DoubleField("end_lon", endpoints.end.lon)});
      Metrics::Instance().RecordRouteRequest("no_mesh");
      resp.set_status(JOB_STATE_FAILURE);
      resp.set_error(kNoMeshError);
      return resp;
    }

    std::lock_guard lock(StripeFor(endpoints));

    if (auto existing = ctx_.route_matcher->FindExisting(meshes, endpoints)) {
      if (req.force_recalculate()) {
        ROUTEBROKER_LOG_INFO("existing route found, recalculating on request", {RouteId(existing->id)});
      } else if (auto job = ctx_.job_tracker->LatestJobForRoute(existing->id)) {
        ROUTEBROKER_LOG_INFO("existing route found", {RouteId(existing->id), JobId(job->id)});

        const auto state = ctx_.job_tracker->StateOf(job->id, *existing);
        resp.set_id(job->id);
        resp.set_status_url(ctx_.status_url_prefix + job->id);
        resp.set_status(ToProto(state));
        *resp.mutable_route() = ToProto(*existing);
        resp.set_existing(true);
        resp.set_info(kExistingRouteInfo);
        if (state == jobs::TaskState::kFailure) {
          resp.set_error(existing->info);
        }
        Metrics::Instance().RecordRouteRequest("existing");
        return resp;
      }
    }

    db::model::RouteRecord route;
    route.requested  = util::Now();
    route.mesh_id    = meshes.front().id;
    route.endpoints  = endpoints;
    route.start_name = req.start_name();
    route.end_name   = req.end_name();
    {
      auto tx = ctx_.repository->Begin();
      db::ThrowIfDbError(ctx_.repository->InsertRoute(*tx, route), "insert route");
      tx->Commit();
    }

    auto job = ctx_.job_tracker->Dispatch(route);
    Metrics::Instance().RecordRouteRequest("dispatched");

    resp.set_id(job.id);
    resp.set_status_url(ctx_.status_url_prefix + job.id);
    resp.set_status(ToProto(ctx_.job_tracker->StateOf(job.id)));
    return resp;
  });
}

RouteStatus RouteService::GetRouteStatus(const GetRouteStatusRequest& req) {
  return ObserveRpc("RouteService.GetRouteStatus", [&] {
    if (req.id().empty()) {
      throw util::InvalidArgument("route status: id is required");
    }
    return ToRouteStatus(ctx_.job_tracker->GetStatus(req.id()));
  });
}

CancelRouteResponse RouteService::CancelRoute(const CancelRouteRequest& req) {
  return ObserveRpc("RouteService.CancelRoute", [&] {
    ctx_.job_tracker->Cancel(req.id());
    return CancelRouteResponse{};
  });
}

ListRecentRoutesResponse RouteService::ListRecentRoutes(const ListRecentRoutesRequest&) {
  return ObserveRpc("RouteService.ListRecentRoutes", [&] {
    ListRecentRoutesResponse resp;
    for (const auto& status : ctx_.job_tracker->ListRecent()) {
      *resp.add_routes() = ToRouteStatus(status);
    }
    return resp;
  });
}

EvaluateRouteResponse RouteService::EvaluateRoute(const EvaluateRouteRequest& req) {
  return ObserveRpc("RouteService.EvaluateRoute", [&] {
    if (!ctx_.route_evaluator) {
      throw util::InvalidState("route evaluation is not configured");
    }
    if (!req.has_route()) {
      throw util::InvalidArgument("route is required");
    }

    EvaluateRouteResponse resp;
    auto evaluation = ctx_.route_evaluator->Evaluate(req.route());
    if (!evaluation) {
      resp.set_error(kNoMeshError);
      return resp;
    }

    *resp.mutable_route() = std::move(evaluation->route);
    resp.set_mesh_id(evaluation->mesh_id);
    resp.set_time_days(evaluation->time_days);
    resp.set_time_str(evaluation->time_str);
    resp.set_fuel_tonnes(evaluation->fuel_tonnes);
    return resp;
  });
}

}
