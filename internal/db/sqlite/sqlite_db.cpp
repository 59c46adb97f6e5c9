#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace routebroker::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers from other processes proceed while a writer holds the lock
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS mesh (id INTEGER PRIMARY KEY AUTOINCREMENT, md5 TEXT NOT NULL UNIQUE, name TEXT, created_ms INTEGER NOT NULL, "
      "mesh_version TEXT, lat_min REAL NOT NULL, lat_max REAL NOT NULL, lon_min REAL NOT NULL, lon_max REAL NOT NULL, json TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS mesh_bounds_idx ON mesh(lat_min, lat_max, lon_min, lon_max);",
      "CREATE TABLE IF NOT EXISTS route (id INTEGER PRIMARY KEY AUTOINCREMENT, requested_ms INTEGER NOT NULL, calculated_ms INTEGER, file TEXT, "
      "info TEXT, mesh_id INTEGER REFERENCES mesh(id), start_lat REAL NOT NULL, start_lon REAL NOT NULL, end_lat REAL NOT NULL, "
      "end_lon REAL NOT NULL, start_name TEXT, end_name TEXT, json_unsmoothed TEXT, json TEXT, planner_version TEXT);",
      "CREATE INDEX IF NOT EXISTS route_mesh_idx ON route(mesh_id);",
      "CREATE INDEX IF NOT EXISTS route_requested_idx ON route(requested_ms);",
      "CREATE TABLE IF NOT EXISTS job (id TEXT PRIMARY KEY, created_ms INTEGER NOT NULL, route_id INTEGER NOT NULL REFERENCES route(id));",
      "CREATE INDEX IF NOT EXISTS job_route_idx ON job(route_id, created_ms);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace routebroker::db::sqlite
