#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace seawatch::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      SEAWATCH_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before the connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  tx_->commit();
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace seawatch::db::postgres
