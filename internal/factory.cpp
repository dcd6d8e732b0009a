#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_store.hpp"
#include "internal/observability/logging.hpp"
#if SEAWATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#endif
#if SEAWATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_store.hpp"
#endif

namespace seawatch::factory {

namespace {

#if SEAWATCH_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS raw_record ("
      " id TEXT PRIMARY KEY, source TEXT NOT NULL, reference_id TEXT NOT NULL DEFAULT '',"
      " occurred_at_ms INTEGER, latitude REAL, longitude REAL,"
      " title TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', region TEXT NOT NULL DEFAULT '',"
      " location TEXT NOT NULL DEFAULT '', incident_type_name TEXT NOT NULL DEFAULT '',"
      " vessel_name TEXT NOT NULL DEFAULT '', vessel_type TEXT NOT NULL DEFAULT '', vessel_flag TEXT NOT NULL DEFAULT '',"
      " vessel_imo TEXT NOT NULL DEFAULT '', vessel_status TEXT NOT NULL DEFAULT '',"
      " update_text TEXT NOT NULL DEFAULT '', processing_notes TEXT NOT NULL DEFAULT '', raw_json TEXT NOT NULL DEFAULT '',"
      " merge_status TEXT NOT NULL DEFAULT 'none', merged_into_id TEXT, canonical_incident_id TEXT,"
      " processing_status TEXT NOT NULL DEFAULT 'new', merged_at_ms INTEGER,"
      " merged_sources TEXT NOT NULL DEFAULT '[]', merged_record_ids TEXT NOT NULL DEFAULT '[]',"
      " vessel_ref_id TEXT, last_processed_at_ms INTEGER,"
      " CHECK (merge_status IN ('none','merged','merged_into')),"
      " CHECK ((merge_status = 'merged_into') = (merged_into_id IS NOT NULL)),"
      " CHECK (merged_into_id IS NULL OR merged_into_id <> id));",
      "CREATE INDEX IF NOT EXISTS raw_record_occurred_at ON raw_record(occurred_at_ms);",
      "CREATE INDEX IF NOT EXISTS raw_record_merge_status ON raw_record(merge_status);",
      "CREATE TABLE IF NOT EXISTS vessel_reference (id TEXT PRIMARY KEY, imo TEXT NOT NULL DEFAULT '', normalized_name TEXT NOT NULL DEFAULT '', display_name TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS vessel_reference_imo ON vessel_reference(imo);",
      "CREATE INDEX IF NOT EXISTS vessel_reference_name ON vessel_reference(normalized_name);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if SEAWATCH_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS raw_record ("
      " id TEXT PRIMARY KEY, source TEXT NOT NULL, reference_id TEXT NOT NULL DEFAULT '',"
      " occurred_at_ms BIGINT, latitude DOUBLE PRECISION, longitude DOUBLE PRECISION,"
      " title TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', region TEXT NOT NULL DEFAULT '',"
      " location TEXT NOT NULL DEFAULT '', incident_type_name TEXT NOT NULL DEFAULT '',"
      " vessel_name TEXT NOT NULL DEFAULT '', vessel_type TEXT NOT NULL DEFAULT '', vessel_flag TEXT NOT NULL DEFAULT '',"
      " vessel_imo TEXT NOT NULL DEFAULT '', vessel_status TEXT NOT NULL DEFAULT '',"
      " update_text TEXT NOT NULL DEFAULT '', processing_notes TEXT NOT NULL DEFAULT '', raw_json TEXT NOT NULL DEFAULT '',"
      " merge_status TEXT NOT NULL DEFAULT 'none', merged_into_id TEXT, canonical_incident_id TEXT,"
      " processing_status TEXT NOT NULL DEFAULT 'new', merged_at_ms BIGINT,"
      " merged_sources TEXT NOT NULL DEFAULT '[]', merged_record_ids TEXT NOT NULL DEFAULT '[]',"
      " vessel_ref_id TEXT, last_processed_at_ms BIGINT,"
      " CHECK (merge_status IN ('none','merged','merged_into')),"
      " CHECK ((merge_status = 'merged_into') = (merged_into_id IS NOT NULL)),"
      " CHECK (merged_into_id IS NULL OR merged_into_id <> id));");
  tx.exec("CREATE INDEX IF NOT EXISTS raw_record_occurred_at ON raw_record(occurred_at_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS raw_record_merge_status ON raw_record(merge_status);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS vessel_reference (id TEXT PRIMARY KEY, imo TEXT NOT NULL DEFAULT '',"
      " normalized_name TEXT NOT NULL DEFAULT '', display_name TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS vessel_reference_imo ON vessel_reference(imo);");
  tx.exec("CREATE INDEX IF NOT EXISTS vessel_reference_name ON vessel_reference(normalized_name);");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::IncidentStore> BuildStore(const seawatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SEAWATCH_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), !sqlite.disable_wal());
    BootstrapSqliteSchema(sqlite_db);
    SEAWATCH_LOG_INFO("incident store opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteStore>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SEAWATCH_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() > 0 ? postgres.max_connections() : 16);
    BootstrapPostgresSchema(pool);
    SEAWATCH_LOG_INFO("incident store opened", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgStore>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  if (database.has_memory()) {
    SEAWATCH_LOG_INFO("incident store opened", {observability::StringField("backend", "memory")});
  } else {
    SEAWATCH_LOG_WARN("no database configured, using in-memory store");
  }
  return std::make_shared<db::memory::MemoryStore>();
}

Runtime Build(const seawatch::runtime::config::RuntimeConfig& config) {
  Runtime runtime;
  runtime.store        = BuildStore(config);
  runtime.orchestrator = std::make_shared<dedup::DedupOrchestrator>(runtime.store, dedup::DedupSettings::FromConfig(config.dedup()));
  runtime.finder       = std::make_shared<matching::CandidateFinder>(runtime.store, matching::MatcherSettings::FromConfig(config.matcher()));
  return runtime;
}

} // namespace seawatch::factory
