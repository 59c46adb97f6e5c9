#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace routebroker::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
