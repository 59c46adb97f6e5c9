#include "route_server.hpp"

#include "grpc_error.hpp"
#include "routebroker/v1.hpp"

namespace routebroker::grpc {

using namespace routebroker::v1;

RouteServer::RouteServer(std::shared_ptr<routebroker::service::RouteService> svc) : service_(std::move(svc)) {
}

::grpc::Status RouteServer::RequestRoute(::grpc::ServerContext*, const RequestRouteRequest* req, RequestRouteResponse* resp) {
  try {
    *resp = service_->RequestRoute(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RouteServer::GetRouteStatus(::grpc::ServerContext*, const GetRouteStatusRequest* req, RouteStatus* resp) {
  try {
    *resp = service_->GetRouteStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RouteServer::CancelRoute(::grpc::ServerContext*, const CancelRouteRequest* req, CancelRouteResponse* resp) {
  try {
    *resp = service_->CancelRoute(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RouteServer::ListRecentRoutes(::grpc::ServerContext*, const ListRecentRoutesRequest* req, ListRecentRoutesResponse* resp) {
  try {
    *resp = service_->ListRecentRoutes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RouteServer::EvaluateRoute(::grpc::ServerContext*, const EvaluateRouteRequest* req, EvaluateRouteResponse* resp) {
  try {
    *resp = service_->EvaluateRoute(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace routebroker::grpc
