#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "routebroker/services/v1/mesh_admin_service.grpc.pb.h"
#include "internal/service/mesh_service.hpp"

namespace routebroker::grpc {

class MeshAdminServer final : public routebroker::services::v1::MeshAdminService::Service {
public:
  explicit MeshAdminServer(std::shared_ptr<routebroker::service::MeshService> svc);

  ::grpc::Status ImportMeshes(::grpc::ServerContext*,
                              const routebroker::services::v1::ImportMeshesRequest*,
                              routebroker::services::v1::ImportMeshesResponse*) override;

  ::grpc::Status ListMeshes(::grpc::ServerContext*,
                            const routebroker::services::v1::ListMeshesRequest*,
                            routebroker::services::v1::ListMeshesResponse*) override;

private:
  std::shared_ptr<routebroker::service::MeshService> service_;
};

}
