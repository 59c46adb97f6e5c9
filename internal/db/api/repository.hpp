#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/mesh_record.hpp"
#include "internal/db/model/route_record.hpp"

namespace routebroker::db {

/*
  Repository abstraction over the Mesh / Route / Job entity store.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Each committed transaction is atomic
  - InsertMesh is an atomic insert-if-absent keyed by md5

  No cross-entity "check then create" sequence is made atomic here;
  callers that need it serialize above the repository.

  List queries return rows ordered by ascending id.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Meshes
  // ---------------------------------------------------------------------

  // Assigns mesh.id. Returns AlreadyExists when the md5 is already stored.
  virtual Result InsertMesh(Transaction&, model::MeshRecord& mesh, const std::string& json) = 0;

  virtual std::optional<model::MeshRecord> GetMesh(Transaction&, int64_t id) = 0;

  virtual std::optional<model::MeshRecord> FindMeshByMd5(Transaction&, const std::string& md5) = 0;

  virtual std::optional<std::string> GetMeshJson(Transaction&, int64_t id) = 0;

  // Meshes whose bounding box contains both endpoints (closed bounds).
  virtual std::vector<model::MeshRecord> ListMeshesContaining(Transaction&, const util::Endpoints& endpoints) = 0;

  virtual std::vector<model::MeshRecord> ListMeshes(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Routes
  // ---------------------------------------------------------------------

  // Assigns route.id.
  virtual Result InsertRoute(Transaction&, model::RouteRecord& route) = 0;

  virtual std::optional<model::RouteRecord> GetRoute(Transaction&, int64_t id) = 0;

  virtual Result UpdateRoute(Transaction&, const model::RouteRecord& route) = 0;

  virtual std::vector<model::RouteRecord> ListRoutesByMesh(Transaction&, int64_t mesh_id) = 0;

  // Routes with from <= requested < to.
  virtual std::vector<model::RouteRecord> ListRoutesRequestedBetween(Transaction&, util::TimePoint from, util::TimePoint to) = 0;

  // Routes with neither final geometry nor a recorded error.
  virtual std::vector<model::RouteRecord> ListUnfinishedRoutes(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord& job) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  // Job with the latest creation time for the route (ties: greatest id).
  virtual std::optional<model::JobRecord> LatestJobForRoute(Transaction&, int64_t route_id) = 0;
};

} // namespace routebroker::db
