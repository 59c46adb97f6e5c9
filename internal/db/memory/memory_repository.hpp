#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace routebroker::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMesh(Transaction&, model::MeshRecord&, const std::string& json) override;
  std::optional<model::MeshRecord> GetMesh(Transaction&, int64_t id) override;
  std::optional<model::MeshRecord> FindMeshByMd5(Transaction&, const std::string& md5) override;
  std::optional<std::string> GetMeshJson(Transaction&, int64_t id) override;
  std::vector<model::MeshRecord> ListMeshesContaining(Transaction&, const util::Endpoints&) override;
  std::vector<model::MeshRecord> ListMeshes(Transaction&) override;

  Result InsertRoute(Transaction&, model::RouteRecord&) override;
  std::optional<model::RouteRecord> GetRoute(Transaction&, int64_t id) override;
  Result UpdateRoute(Transaction&, const model::RouteRecord&) override;
  std::vector<model::RouteRecord> ListRoutesByMesh(Transaction&, int64_t mesh_id) override;
  std::vector<model::RouteRecord> ListRoutesRequestedBetween(Transaction&, util::TimePoint from, util::TimePoint to) override;
  std::vector<model::RouteRecord> ListUnfinishedRoutes(Transaction&) override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) override;
  std::optional<model::JobRecord> LatestJobForRoute(Transaction&, int64_t route_id) override;

private:
  friend class MemoryTransaction;

  struct StoredMesh {
    model::MeshRecord record;
    // shared so snapshot copies stay cheap; mesh documents are large
    std::shared_ptr<const std::string> json;
  };

  struct State {
    std::map<int64_t, StoredMesh>            meshes;
    std::unordered_map<std::string, int64_t> mesh_id_by_md5;
    std::map<int64_t, model::RouteRecord>    routes;
    std::map<std::string, model::JobRecord>  jobs;
    int64_t next_mesh_id  = 1;
    int64_t next_route_id = 1;
  };

  // held by a MemoryTransaction for its whole lifetime
  std::mutex tx_mutex_;
  State      committed_;
};

}
