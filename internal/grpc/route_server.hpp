#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "routebroker/services/v1/route_service.grpc.pb.h"
#include "internal/service/route_service.hpp"

namespace routebroker::grpc {

class RouteServer final : public routebroker::services::v1::RouteService::Service {
public:
  explicit RouteServer(std::shared_ptr<routebroker::service::RouteService> svc);

  ::grpc::Status RequestRoute(::grpc::ServerContext*,
                              const routebroker::services::v1::RequestRouteRequest*,
                              routebroker::services::v1::RequestRouteResponse*) override;

  ::grpc::Status GetRouteStatus(::grpc::ServerContext*,
                                const routebroker::services::v1::GetRouteStatusRequest*,
                                routebroker::v1::RouteStatus*) override;

  ::grpc::Status CancelRoute(::grpc::ServerContext*,
                             const routebroker::services::v1::CancelRouteRequest*,
                             routebroker::services::v1::CancelRouteResponse*) override;

  ::grpc::Status ListRecentRoutes(::grpc::ServerContext*,
                                  const routebroker::services::v1::ListRecentRoutesRequest*,
                                  routebroker::services::v1::ListRecentRoutesResponse*) override;

  ::grpc::Status EvaluateRoute(::grpc::ServerContext*,
                               const routebroker::services::v1::EvaluateRouteRequest*,
                               routebroker::services::v1::EvaluateRouteResponse*) override;

private:
  std::shared_ptr<routebroker::service::RouteService> service_;
};

}
