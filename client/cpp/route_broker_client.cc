#include "client/cpp/route_broker_client.h"

#include <string>
#include <string_view>
#include <thread>

#include <grpcpp/client_context.h>

namespace routebroker::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
  }
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

bool IsTerminal(routebroker::v1::JobState state) {
  return state == routebroker::v1::JOB_STATE_SUCCESS || state == routebroker::v1::JOB_STATE_FAILURE ||
         state == routebroker::v1::JOB_STATE_REVOKED;
}

} // namespace

RouteBrokerClient::RouteBrokerClient(std::shared_ptr<grpc::Channel> channel)
    : route_stub_(routebroker::services::v1::RouteService::NewStub(channel)),
      mesh_stub_(routebroker::services::v1::MeshAdminService::NewStub(channel)) {
}

arrow::Result<routebroker::v1::RequestRouteResponse> RouteBrokerClient::RequestRoute(const RouteRequest& request) const {
  routebroker::v1::RequestRouteRequest req;
  req.set_start_lat(request.start_lat);
  req.set_start_lon(request.start_lon);
  req.set_end_lat(request.end_lat);
  req.set_end_lon(request.end_lon);
  req.set_start_name(request.start_name);
  req.set_end_name(request.end_name);
  req.set_force_recalculate(request.force_recalculate);

  routebroker::v1::RequestRouteResponse resp;
  grpc::ClientContext                   ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(route_stub_->RequestRoute(&ctx, req, &resp), "RequestRoute"));
  return resp;
}

arrow::Result<routebroker::v1::RouteStatus> RouteBrokerClient::GetRouteStatus(const std::string& job_id) const {
  routebroker::v1::GetRouteStatusRequest req;
  req.set_id(job_id);

  routebroker::v1::RouteStatus resp;
  grpc::ClientContext          ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(route_stub_->GetRouteStatus(&ctx, req, &resp), "GetRouteStatus"));
  return resp;
}

arrow::Status RouteBrokerClient::CancelRoute(const std::string& job_id) const {
  routebroker::v1::CancelRouteRequest req;
  req.set_id(job_id);

  routebroker::v1::CancelRouteResponse resp;
  grpc::ClientContext                  ctx;
  return GrpcToArrow(route_stub_->CancelRoute(&ctx, req, &resp), "CancelRoute");
}

arrow::Result<routebroker::v1::ListRecentRoutesResponse> RouteBrokerClient::ListRecentRoutes() const {
  routebroker::v1::ListRecentRoutesResponse resp;
  grpc::ClientContext                       ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(route_stub_->ListRecentRoutes(&ctx, routebroker::v1::ListRecentRoutesRequest{}, &resp), "ListRecentRoutes"));
  return resp;
}

arrow::Result<routebroker::v1::ImportMeshesResponse> RouteBrokerClient::ImportMeshes() const {
  routebroker::v1::ImportMeshesResponse resp;
  grpc::ClientContext                   ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(mesh_stub_->ImportMeshes(&ctx, routebroker::v1::ImportMeshesRequest{}, &resp), "ImportMeshes"));
  return resp;
}

arrow::Result<routebroker::v1::ListMeshesResponse> RouteBrokerClient::ListMeshes() const {
  routebroker::v1::ListMeshesResponse resp;
  grpc::ClientContext                 ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(mesh_stub_->ListMeshes(&ctx, routebroker::v1::ListMeshesRequest{}, &resp), "ListMeshes"));
  return resp;
}

arrow::Result<routebroker::v1::RouteStatus> RouteBrokerClient::WaitForRoute(const std::string& job_id, std::chrono::milliseconds poll_interval,
                                                                            std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    ARROW_ASSIGN_OR_RAISE(auto status, GetRouteStatus(job_id));
    if (IsTerminal(status.status())) {
      return status;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return arrow::Status::IOError("route ", job_id, " still ", routebroker::v1::JobState_Name(status.status()), " after timeout");
    }
    std::this_thread::sleep_for(poll_interval);
  }
}

} // namespace routebroker::client
