#include "pg_pool.hpp"

namespace routebroker::db::postgres {

namespace {

constexpr const char* kMeshColumns =
    "id,md5,name,created_ms,mesh_version,lat_min,lat_max,lon_min,lon_max";

constexpr const char* kRouteColumns =
    "id,requested_ms,calculated_ms,file,info,mesh_id,start_lat,start_lon,end_lat,end_lon,"
    "start_name,end_name,json_unsmoothed,json,planner_version";

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS mesh (id BIGSERIAL PRIMARY KEY, md5 TEXT NOT NULL UNIQUE, name TEXT, created_ms BIGINT NOT NULL, "
      "mesh_version TEXT, lat_min DOUBLE PRECISION NOT NULL, lat_max DOUBLE PRECISION NOT NULL, lon_min DOUBLE PRECISION NOT NULL, "
      "lon_max DOUBLE PRECISION NOT NULL, json TEXT NOT NULL)",
      "CREATE INDEX IF NOT EXISTS mesh_bounds_idx ON mesh(lat_min, lat_max, lon_min, lon_max)",
      "CREATE TABLE IF NOT EXISTS route (id BIGSERIAL PRIMARY KEY, requested_ms BIGINT NOT NULL, calculated_ms BIGINT, file TEXT, "
      "info TEXT, mesh_id BIGINT REFERENCES mesh(id), start_lat DOUBLE PRECISION NOT NULL, start_lon DOUBLE PRECISION NOT NULL, "
      "end_lat DOUBLE PRECISION NOT NULL, end_lon DOUBLE PRECISION NOT NULL, start_name TEXT, end_name TEXT, json_unsmoothed TEXT, "
      "json TEXT, planner_version TEXT)",
      "CREATE INDEX IF NOT EXISTS route_mesh_idx ON route(mesh_id)",
      "CREATE INDEX IF NOT EXISTS route_requested_idx ON route(requested_ms)",
      "CREATE TABLE IF NOT EXISTS job (id TEXT PRIMARY KEY, created_ms BIGINT NOT NULL, route_id BIGINT NOT NULL REFERENCES route(id))",
      "CREATE INDEX IF NOT EXISTS job_route_idx ON job(route_id, created_ms)"};

  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const auto& sql : kBootstrapSql) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_mesh",
               "INSERT INTO mesh(md5,name,created_ms,mesh_version,lat_min,lat_max,lon_min,lon_max,json) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) ON CONFLICT (md5) DO NOTHING RETURNING id");

  conn.prepare("get_mesh", Select(kMeshColumns, "FROM mesh WHERE id=$1"));
  conn.prepare("find_mesh_by_md5", Select(kMeshColumns, "FROM mesh WHERE md5=$1"));
  conn.prepare("get_mesh_json", "SELECT json FROM mesh WHERE id=$1");
  conn.prepare("list_meshes", Select(kMeshColumns, "FROM mesh ORDER BY id"));

  conn.prepare("list_meshes_containing",
               Select(kMeshColumns,
                      "FROM mesh"
                      " WHERE lat_min<=$1 AND lat_max>=$1 AND lon_min<=$2 AND lon_max>=$2"
                      " AND lat_min<=$3 AND lat_max>=$3 AND lon_min<=$4 AND lon_max>=$4"
                      " ORDER BY id"));

  conn.prepare("insert_route",
               "INSERT INTO route(requested_ms,calculated_ms,file,info,mesh_id,start_lat,start_lon,end_lat,end_lon,"
               "start_name,end_name,json_unsmoothed,json,planner_version) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14) RETURNING id");

  conn.prepare("update_route",
               "UPDATE route SET requested_ms=$1,calculated_ms=$2,file=$3,info=$4,mesh_id=$5,start_lat=$6,start_lon=$7,"
               "end_lat=$8,end_lon=$9,start_name=$10,end_name=$11,json_unsmoothed=$12,json=$13,planner_version=$14 "
               "WHERE id=$15");

  conn.prepare("get_route", Select(kRouteColumns, "FROM route WHERE id=$1"));
  conn.prepare("list_routes_by_mesh", Select(kRouteColumns, "FROM route WHERE mesh_id=$1 ORDER BY id"));
  conn.prepare("list_routes_requested_between",
               Select(kRouteColumns, "FROM route WHERE requested_ms>=$1 AND requested_ms<$2 ORDER BY id"));
  conn.prepare("list_unfinished_routes", Select(kRouteColumns, "FROM route WHERE json IS NULL AND info IS NULL ORDER BY id"));

  conn.prepare("insert_job", "INSERT INTO job(id,created_ms,route_id) VALUES($1,$2,$3)");
  conn.prepare("get_job", "SELECT id,created_ms,route_id FROM job WHERE id=$1");
  conn.prepare("latest_job_for_route",
               "SELECT id,created_ms,route_id FROM job WHERE route_id=$1 ORDER BY created_ms DESC, id DESC LIMIT 1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace routebroker::db::postgres
