#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_store.hpp"

namespace seawatch::db::memory {

/*
  Transaction = snapshot + write set

  Read-only transactions never conflict; a transaction that called
  Mutable() fails its Commit() if another writer committed first.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryStore& store);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  MemoryStore::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryStore::State& View() const {
    return working_;
  }

 private:
  MemoryStore&       store_;
  MemoryStore::State working_;
  uint64_t           snapshot_version_ = 0;
  bool               dirty_            = false;
  bool               committed_        = false;
  bool               rolled_back_      = false;
};

} // namespace seawatch::db::memory
