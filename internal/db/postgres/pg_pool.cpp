#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace seawatch::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_record",
               "INSERT INTO raw_record(" SEAWATCH_RECORD_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,"
               "$15,$16,$17,$18,$19,$20,$21,$22,$23,$24,$25,$26,$27,$28)");

  conn.prepare("get_record", "SELECT " SEAWATCH_RECORD_COLUMNS " FROM raw_record WHERE id=$1");

  conn.prepare("query_recent",
               "SELECT " SEAWATCH_RECORD_COLUMNS " FROM raw_record"
               " WHERE occurred_at_ms >= $1 AND merge_status <> 'merged_into'"
               " ORDER BY occurred_at_ms DESC, id ASC LIMIT $2");

  conn.prepare("query_candidates",
               "SELECT " SEAWATCH_RECORD_COLUMNS " FROM raw_record"
               " WHERE occurred_at_ms BETWEEN $1 AND $2"
               " AND latitude BETWEEN $3 AND $4 AND longitude BETWEEN $5 AND $6"
               " AND canonical_incident_id IS NOT NULL AND merge_status <> 'merged_into'"
               " ORDER BY id ASC");

  conn.prepare("update_merge_state",
               "UPDATE raw_record SET merge_status=$1, merged_into_id=$2,"
               " processing_status=COALESCE($3, processing_status),"
               " processing_notes=CASE WHEN $4='' THEN processing_notes"
               "   WHEN processing_notes='' THEN $4 ELSE processing_notes || chr(10) || $4 END"
               " WHERE id=$5 AND merge_status=$6");

  conn.prepare("record_exists", "SELECT 1 FROM raw_record WHERE id=$1");

  conn.prepare("list_integrity_violations", sql::SELECT_INTEGRITY_VIOLATIONS);

  conn.prepare("insert_vessel_reference", "INSERT INTO vessel_reference(id,imo,normalized_name,display_name) VALUES($1,$2,$3,$4)");

  conn.prepare("find_vessel_by_imo",
               "SELECT id,imo,normalized_name,display_name FROM vessel_reference WHERE imo<>'' AND imo=$1 ORDER BY id ASC LIMIT 1");

  conn.prepare("find_vessel_by_name",
               "SELECT id,imo,normalized_name,display_name FROM vessel_reference WHERE normalized_name<>'' AND normalized_name=$1 ORDER BY id ASC LIMIT 1");
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

} // namespace seawatch::db::postgres
