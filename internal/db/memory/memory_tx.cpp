#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace seawatch::db::memory {

MemoryTransaction::MemoryTransaction(MemoryStore& store) : store_(store) {
  std::scoped_lock lock(store_.mutex_);
  working_          = store_.committed_; // snapshot copy
  snapshot_version_ = store_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  if (!dirty_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(store_.mutex_);
  if (store_.committed_version_ != snapshot_version_) {
    throw util::WriteConflict("transaction conflict: state was modified by a concurrent transaction");
  }
  store_.committed_ = std::move(working_);
  store_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace seawatch::db::memory
