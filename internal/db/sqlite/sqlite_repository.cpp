#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <stdexcept>

namespace routebroker::db::sqlite {

using routebroker::db::ErrorCode;
using routebroker::db::Result;

namespace {

constexpr const char* kMeshColumns =
    "id,md5,name,created_ms,mesh_version,lat_min,lat_max,lon_min,lon_max";

constexpr const char* kRouteColumns =
    "id,requested_ms,calculated_ms,file,info,mesh_id,start_lat,start_lon,end_lat,end_lon,"
    "start_name,end_name,json_unsmoothed,json,planner_version";

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

model::MeshRecord ReadMesh(sqlite3_stmt* st) {
  model::MeshRecord r;
  r.id                = ColI64(st, 0);
  r.md5               = ColText(st, 1);
  r.name              = ColText(st, 2);
  r.created           = util::FromUnixMillis(ColI64(st, 3));
  r.mesh_version      = ColText(st, 4);
  r.bounds.lat_min    = ColDouble(st, 5);
  r.bounds.lat_max    = ColDouble(st, 6);
  r.bounds.lon_min    = ColDouble(st, 7);
  r.bounds.lon_max    = ColDouble(st, 8);
  return r;
}

model::RouteRecord ReadRoute(sqlite3_stmt* st) {
  model::RouteRecord r;
  r.id        = ColI64(st, 0);
  r.requested = util::FromUnixMillis(ColI64(st, 1));
  if (auto calculated = ColOptionalI64(st, 2)) r.calculated = util::FromUnixMillis(*calculated);
  r.file                = ColText(st, 3);
  r.info                = ColText(st, 4);
  r.mesh_id             = ColOptionalI64(st, 5);
  r.endpoints.start.lat = ColDouble(st, 6);
  r.endpoints.start.lon = ColDouble(st, 7);
  r.endpoints.end.lat   = ColDouble(st, 8);
  r.endpoints.end.lon   = ColDouble(st, 9);
  r.start_name          = ColText(st, 10);
  r.end_name            = ColText(st, 11);
  r.json_unsmoothed     = ColText(st, 12);
  r.json                = ColText(st, 13);
  r.planner_version     = ColText(st, 14);
  return r;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id       = ColText(st, 0);
  r.created  = util::FromUnixMillis(ColI64(st, 1));
  r.route_id = ColI64(st, 2);
  return r;
}

// Binds route columns 2..15 (everything but id) starting at first.
void BindRouteFields(sqlite3_stmt* st, int first, const model::RouteRecord& r) {
  BindI64(st, first + 0, util::ToUnixMillis(r.requested));
  BindOptionalI64(st, first + 1, r.calculated ? std::optional<int64_t>(util::ToUnixMillis(*r.calculated)) : std::nullopt);
  BindOptionalText(st, first + 2, r.file);
  BindOptionalText(st, first + 3, r.info);
  BindOptionalI64(st, first + 4, r.mesh_id);
  BindDouble(st, first + 5, r.endpoints.start.lat);
  BindDouble(st, first + 6, r.endpoints.start.lon);
  BindDouble(st, first + 7, r.endpoints.end.lat);
  BindDouble(st, first + 8, r.endpoints.end.lon);
  BindOptionalText(st, first + 9, r.start_name);
  BindOptionalText(st, first + 10, r.end_name);
  BindOptionalText(st, first + 11, r.json_unsmoothed);
  BindOptionalText(st, first + 12, r.json);
  BindOptionalText(st, first + 13, r.planner_version);
}

template <typename Row, typename Reader>
std::vector<Row> CollectRows(sqlite3_stmt* st, Reader read) {
  std::vector<Row> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Contention, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::InvalidReference, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::Storage, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Meshes
// ------------------------------------------------------------------

Result SqliteRepository::InsertMesh(Transaction& t, model::MeshRecord& r, const std::string& json) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO mesh(md5,name,created_ms,mesh_version,lat_min,lat_max,lon_min,lon_max,json) "
        "VALUES(?,?,?,?,?,?,?,?,?) ON CONFLICT(md5) DO NOTHING;");

    BindText(st.get(), 1, r.md5);
    BindOptionalText(st.get(), 2, r.name);
    BindI64(st.get(), 3, util::ToUnixMillis(r.created));
    BindOptionalText(st.get(), 4, r.mesh_version);
    BindDouble(st.get(), 5, r.bounds.lat_min);
    BindDouble(st.get(), 6, r.bounds.lat_max);
    BindDouble(st.get(), 7, r.bounds.lon_min);
    BindDouble(st.get(), 8, r.bounds.lon_max);
    BindText(st.get(), 9, json);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Duplicate, "mesh md5 " + r.md5);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::MeshRecord> SqliteRepository::GetMesh(Transaction& t, int64_t id) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kMeshColumns + " FROM mesh WHERE id=?;");
    BindI64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadMesh(st.get());
}

std::optional<model::MeshRecord> SqliteRepository::FindMeshByMd5(Transaction& t, const std::string& md5) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kMeshColumns + " FROM mesh WHERE md5=?;");
    BindText(st.get(), 1, md5);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadMesh(st.get());
}

std::optional<std::string> SqliteRepository::GetMeshJson(Transaction& t, int64_t id) {
    auto st = Prepare(TX(t).Handle(), "SELECT json FROM mesh WHERE id=?;");
    BindI64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ColText(st.get(), 0);
}

std::vector<model::MeshRecord> SqliteRepository::ListMeshesContaining(Transaction& t, const util::Endpoints& e) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kMeshColumns +
        " FROM mesh"
        " WHERE lat_min<=?1 AND lat_max>=?1 AND lon_min<=?2 AND lon_max>=?2"
        " AND lat_min<=?3 AND lat_max>=?3 AND lon_min<=?4 AND lon_max>=?4"
        " ORDER BY id;");
    BindDouble(st.get(), 1, e.start.lat);
    BindDouble(st.get(), 2, e.start.lon);
    BindDouble(st.get(), 3, e.end.lat);
    BindDouble(st.get(), 4, e.end.lon);

    return CollectRows<model::MeshRecord>(st.get(), ReadMesh);
}

std::vector<model::MeshRecord> SqliteRepository::ListMeshes(Transaction& t) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kMeshColumns + " FROM mesh ORDER BY id;");
    return CollectRows<model::MeshRecord>(st.get(), ReadMesh);
}

// ------------------------------------------------------------------
// Routes
// ------------------------------------------------------------------

Result SqliteRepository::InsertRoute(Transaction& t, model::RouteRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO route(requested_ms,calculated_ms,file,info,mesh_id,start_lat,start_lon,end_lat,end_lon,"
        "start_name,end_name,json_unsmoothed,json,planner_version) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
    BindRouteFields(st.get(), 1, r);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::RouteRecord> SqliteRepository::GetRoute(Transaction& t, int64_t id) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRouteColumns + " FROM route WHERE id=?;");
    BindI64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadRoute(st.get());
}

Result SqliteRepository::UpdateRoute(Transaction& t, const model::RouteRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE route SET requested_ms=?,calculated_ms=?,file=?,info=?,mesh_id=?,start_lat=?,start_lon=?,end_lat=?,end_lon=?,"
        "start_name=?,end_name=?,json_unsmoothed=?,json=?,planner_version=? WHERE id=?;");
    BindRouteFields(st.get(), 1, r);
    BindI64(st.get(), 15, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "route " + std::to_string(r.id));
    return Result::Ok();
}

std::vector<model::RouteRecord> SqliteRepository::ListRoutesByMesh(Transaction& t, int64_t mesh_id) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRouteColumns + " FROM route WHERE mesh_id=? ORDER BY id;");
    BindI64(st.get(), 1, mesh_id);
    return CollectRows<model::RouteRecord>(st.get(), ReadRoute);
}

std::vector<model::RouteRecord> SqliteRepository::ListRoutesRequestedBetween(Transaction& t, util::TimePoint from, util::TimePoint to) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRouteColumns +
        " FROM route WHERE requested_ms>=? AND requested_ms<? ORDER BY id;");
    BindI64(st.get(), 1, util::ToUnixMillis(from));
    BindI64(st.get(), 2, util::ToUnixMillis(to));
    return CollectRows<model::RouteRecord>(st.get(), ReadRoute);
}

std::vector<model::RouteRecord> SqliteRepository::ListUnfinishedRoutes(Transaction& t) {
    auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRouteColumns +
        " FROM route WHERE json IS NULL AND info IS NULL ORDER BY id;");
    return CollectRows<model::RouteRecord>(st.get(), ReadRoute);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO job(id,created_ms,route_id) VALUES(?,?,?);");
    BindText(st.get(), 1, r.id);
    BindI64(st.get(), 2, util::ToUnixMillis(r.created));
    BindI64(st.get(), 3, r.route_id);

    int rc = sqlite3_step(st.get());
    if ((rc & 0xFF) == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::Duplicate, "job " + r.id);
    }
    return Translate(db, rc);
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
    auto st = Prepare(TX(t).Handle(), "SELECT id,created_ms,route_id FROM job WHERE id=?;");
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadJob(st.get());
}

std::optional<model::JobRecord> SqliteRepository::LatestJobForRoute(Transaction& t, int64_t route_id) {
    auto st = Prepare(TX(t).Handle(),
        "SELECT id,created_ms,route_id FROM job WHERE route_id=? ORDER BY created_ms DESC, id DESC LIMIT 1;");
    BindI64(st.get(), 1, route_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadJob(st.get());
}

} // namespace routebroker::db::sqlite
