#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace routebroker::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is shared by every thread; TxMutex() serializes the
  transactions running on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  // Creates the mesh/route/job tables when missing.
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace routebroker::db::sqlite
