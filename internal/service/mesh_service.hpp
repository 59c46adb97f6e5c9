#pragma once

#include "routebroker/v1.hpp"
#include "service_context.hpp"

namespace routebroker::service {

class MeshService {
public:
  explicit MeshService(ServiceContext ctx);

  routebroker::v1::ImportMeshesResponse
  ImportMeshes(const routebroker::v1::ImportMeshesRequest& req);

  routebroker::v1::ListMeshesResponse
  ListMeshes(const routebroker::v1::ListMeshesRequest& req);

private:
  ServiceContext ctx_;
};

}
