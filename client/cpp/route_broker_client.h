#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "routebroker/services/v1/mesh_admin_service.grpc.pb.h"
#include "routebroker/services/v1/route_service.grpc.pb.h"
#include "routebroker/v1.hpp"

namespace routebroker::client {

class RouteBrokerClient {
 public:
  struct RouteRequest {
    double      start_lat = 0.0;
    double      start_lon = 0.0;
    double      end_lat   = 0.0;
    double      end_lon   = 0.0;
    std::string start_name;
    std::string end_name;
    bool        force_recalculate = false;
  };

  explicit RouteBrokerClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<routebroker::v1::RequestRouteResponse> RequestRoute(const RouteRequest& request) const;

  arrow::Result<routebroker::v1::RouteStatus> GetRouteStatus(const std::string& job_id) const;

  arrow::Status CancelRoute(const std::string& job_id) const;

  arrow::Result<routebroker::v1::ListRecentRoutesResponse> ListRecentRoutes() const;

  arrow::Result<routebroker::v1::ImportMeshesResponse> ImportMeshes() const;

  arrow::Result<routebroker::v1::ListMeshesResponse> ListMeshes() const;

  // Polls GetRouteStatus until the job leaves PENDING/RUNNING or timeout expires.
  arrow::Result<routebroker::v1::RouteStatus> WaitForRoute(const std::string& job_id, std::chrono::milliseconds poll_interval,
                                                           std::chrono::milliseconds timeout) const;

 private:
  std::unique_ptr<routebroker::services::v1::RouteService::Stub>     route_stub_;
  std::unique_ptr<routebroker::services::v1::MeshAdminService::Stub> mesh_stub_;
};

} // namespace routebroker::client
