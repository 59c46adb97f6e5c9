#include "pg_repository.hpp"

namespace routebroker::db::postgres {

namespace {

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::MeshRecord ReadMesh(const pqxx::row& row) {
  model::MeshRecord r;
  r.id             = row[0].as<int64_t>();
  r.md5            = row[1].c_str();
  r.name           = Text(row[2]);
  r.created        = util::FromUnixMillis(row[3].as<int64_t>());
  r.mesh_version   = Text(row[4]);
  r.bounds.lat_min = row[5].as<double>();
  r.bounds.lat_max = row[6].as<double>();
  r.bounds.lon_min = row[7].as<double>();
  r.bounds.lon_max = row[8].as<double>();
  return r;
}

model::RouteRecord ReadRoute(const pqxx::row& row) {
  model::RouteRecord r;
  r.id        = row[0].as<int64_t>();
  r.requested = util::FromUnixMillis(row[1].as<int64_t>());
  if (!row[2].is_null()) r.calculated = util::FromUnixMillis(row[2].as<int64_t>());
  r.file = Text(row[3]);
  r.info = Text(row[4]);
  if (!row[5].is_null()) r.mesh_id = row[5].as<int64_t>();
  r.endpoints.start.lat = row[6].as<double>();
  r.endpoints.start.lon = row[7].as<double>();
  r.endpoints.end.lat   = row[8].as<double>();
  r.endpoints.end.lon   = row[9].as<double>();
  r.start_name          = Text(row[10]);
  r.end_name            = Text(row[11]);
  r.json_unsmoothed     = Text(row[12]);
  r.json                = Text(row[13]);
  r.planner_version     = Text(row[14]);
  return r;
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id       = row[0].c_str();
  r.created  = util::FromUnixMillis(row[1].as<int64_t>());
  r.route_id = row[2].as<int64_t>();
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> CollectRows(const pqxx::result& res, Reader read) {
  std::vector<Row> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

std::optional<int64_t> CalculatedMillis(const model::RouteRecord& r) {
  if (!r.calculated) return std::nullopt;
  return util::ToUnixMillis(*r.calculated);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::Duplicate, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::InvalidReference, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Contention, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  return Result::Err(ErrorCode::Storage, e.what());
}

// ------------------------------------------------------------------
// Meshes
// ------------------------------------------------------------------

Result PgRepository::InsertMesh(Transaction& t, model::MeshRecord& r, const std::string& json) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_mesh", r.md5, NullIfEmpty(r.name), util::ToUnixMillis(r.created),
                                          NullIfEmpty(r.mesh_version), r.bounds.lat_min, r.bounds.lat_max, r.bounds.lon_min,
                                          r.bounds.lon_max, json);
    if (res.empty()) return Result::Err(ErrorCode::Duplicate, "mesh md5 " + r.md5);

    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MeshRecord> PgRepository::GetMesh(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_mesh", id);
  if (res.empty()) return std::nullopt;
  return ReadMesh(res[0]);
}

std::optional<model::MeshRecord> PgRepository::FindMeshByMd5(Transaction& t, const std::string& md5) {
  auto res = TX(t).Work().exec_prepared("find_mesh_by_md5", md5);
  if (res.empty()) return std::nullopt;
  return ReadMesh(res[0]);
}

std::optional<std::string> PgRepository::GetMeshJson(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_mesh_json", id);
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

std::vector<model::MeshRecord> PgRepository::ListMeshesContaining(Transaction& t, const util::Endpoints& e) {
  auto res = TX(t).Work().exec_prepared("list_meshes_containing", e.start.lat, e.start.lon, e.end.lat, e.end.lon);
  return CollectRows<model::MeshRecord>(res, ReadMesh);
}

std::vector<model::MeshRecord> PgRepository::ListMeshes(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_meshes");
  return CollectRows<model::MeshRecord>(res, ReadMesh);
}

// ------------------------------------------------------------------
// Routes
// ------------------------------------------------------------------

Result PgRepository::InsertRoute(Transaction& t, model::RouteRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared(
        "insert_route", util::ToUnixMillis(r.requested), CalculatedMillis(r), NullIfEmpty(r.file), NullIfEmpty(r.info), r.mesh_id,
        r.endpoints.start.lat, r.endpoints.start.lon, r.endpoints.end.lat, r.endpoints.end.lon, NullIfEmpty(r.start_name),
        NullIfEmpty(r.end_name), NullIfEmpty(r.json_unsmoothed), NullIfEmpty(r.json), NullIfEmpty(r.planner_version));

    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RouteRecord> PgRepository::GetRoute(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_route", id);
  if (res.empty()) return std::nullopt;
  return ReadRoute(res[0]);
}

Result PgRepository::UpdateRoute(Transaction& t, const model::RouteRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared(
        "update_route", util::ToUnixMillis(r.requested), CalculatedMillis(r), NullIfEmpty(r.file), NullIfEmpty(r.info), r.mesh_id,
        r.endpoints.start.lat, r.endpoints.start.lon, r.endpoints.end.lat, r.endpoints.end.lon, NullIfEmpty(r.start_name),
        NullIfEmpty(r.end_name), NullIfEmpty(r.json_unsmoothed), NullIfEmpty(r.json), NullIfEmpty(r.planner_version), r.id);

    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "route " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RouteRecord> PgRepository::ListRoutesByMesh(Transaction& t, int64_t mesh_id) {
  auto res = TX(t).Work().exec_prepared("list_routes_by_mesh", mesh_id);
  return CollectRows<model::RouteRecord>(res, ReadRoute);
}

std::vector<model::RouteRecord> PgRepository::ListRoutesRequestedBetween(Transaction& t, util::TimePoint from, util::TimePoint to) {
  auto res = TX(t).Work().exec_prepared("list_routes_requested_between", util::ToUnixMillis(from), util::ToUnixMillis(to));
  return CollectRows<model::RouteRecord>(res, ReadRoute);
}

std::vector<model::RouteRecord> PgRepository::ListUnfinishedRoutes(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_unfinished_routes");
  return CollectRows<model::RouteRecord>(res, ReadRoute);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_job", r.id, util::ToUnixMillis(r.created), r.route_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::optional<model::JobRecord> PgRepository::LatestJobForRoute(Transaction& t, int64_t route_id) {
  auto res = TX(t).Work().exec_prepared("latest_job_for_route", route_id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

} // namespace routebroker::db::postgres
