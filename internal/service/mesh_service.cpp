#include "mesh_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/ingest/mesh_ingestor.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace routebroker::service {

using namespace routebroker::v1;

MeshService::MeshService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ImportMeshesResponse MeshService::ImportMeshes(const ImportMeshesRequest&) {
  return ObserveRpc("MeshAdminService.ImportMeshes", [&] {
    if (!ctx_.ingestor) {
      throw util::InvalidState("mesh import is not configured");
    }

    ImportMeshesResponse resp;
    for (const auto& mesh : ctx_.ingestor->ImportNewMeshes()) {
      auto* added = resp.add_added();
      added->set_id(mesh.id);
      added->set_md5(mesh.md5);
      added->set_name(mesh.name);
    }
    return resp;
  });
}

ListMeshesResponse MeshService::ListMeshes(const ListMeshesRequest&) {
  return ObserveRpc("MeshAdminService.ListMeshes", [&] {
    auto tx     = ctx_.repository->Begin();
    auto meshes = ctx_.repository->ListMeshes(*tx);
    tx->Commit();

    ListMeshesResponse resp;
    for (const auto& mesh : meshes) {
      *resp.add_meshes() = ToSummary(mesh);
    }
    return resp;
  });
}

}
