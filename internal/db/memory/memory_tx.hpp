#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace routebroker::db::memory {

/*
  Transaction = exclusive lock + snapshot + write set

  Transactions are serialized: the repository lock is taken at Begin()
  and released on Commit()/Rollback()/destruction, so commits never
  conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace routebroker::db::memory
