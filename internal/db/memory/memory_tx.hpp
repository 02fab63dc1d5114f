#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace dispatch::db::memory {

/*
  Transaction = snapshot + write set

  Commit publishes the working copy only if no other transaction
  committed writes since the snapshot was taken; otherwise it throws
  TransactionConflict. Read-only transactions never conflict.
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
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace dispatch::db::memory
