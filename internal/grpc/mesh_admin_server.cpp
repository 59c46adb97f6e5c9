#include "mesh_admin_server.hpp"

#include "grpc_error.hpp"
#include "routebroker/v1.hpp"

namespace routebroker::grpc {

using namespace routebroker::v1;

MeshAdminServer::MeshAdminServer(std::shared_ptr<routebroker::service::MeshService> svc) : service_(std::move(svc)) {
}

::grpc::Status MeshAdminServer::ImportMeshes(::grpc::ServerContext*, const ImportMeshesRequest* req, ImportMeshesResponse* resp) {
  try {
    *resp = service_->ImportMeshes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MeshAdminServer::ListMeshes(::grpc::ServerContext*, const ListMeshesRequest* req, ListMeshesResponse* resp) {
  try {
    *resp = service_->ListMeshes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace routebroker::grpc
