#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace routebroker::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  Design notes:
  -------------
  - Each transaction holds one connection for its lifetime.
  - libpqxx connections are NOT thread-safe, never share one.
  - Prepared statements are installed once per connection.
  - Acquire blocks while max_connections are checked out.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
    Releasing the shared_ptr returns the connection to the pool
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

  // Creates tables and indexes when missing. Safe to run repeatedly.
  void BootstrapSchema();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace routebroker::db::postgres
