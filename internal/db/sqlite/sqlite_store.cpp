#include "sqlite_store.hpp"

#include <sqlite3.h>

#include <type_traits>
#include <utility>

#include "internal/db/sql/sql_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace seawatch::db::sqlite {

using seawatch::db::ErrorCode;
using seawatch::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindParam(sqlite3_stmt* st, int idx, const sql::Param& param) {
  std::visit(
      [st, idx](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          BindI64(st, idx, value);
        } else if constexpr (std::is_same_v<T, double>) {
          sqlite3_bind_double(st, idx, value);
        } else {
          BindText(st, idx, value);
        }
      },
      param);
}

/*
  sql::Row over the current row of a stepped statement.
*/
class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  int64_t GetInt64(int col) const override {
    return static_cast<int64_t>(sqlite3_column_int64(st_, col));
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

/*
  Finalizes on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

  // Read path: failures surface as StoreUnavailable.
  void RequireReady(const char* what) const {
    if (!st_) {
      throw util::StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db_));
    }
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

template <typename Decode>
auto CollectRows(sqlite3* db, Statement& st, const char* what, Decode decode) {
  std::vector<decltype(decode(std::declval<const sql::Row&>()))> out;
  for (;;) {
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) {
      throw util::StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
    }
    SqliteRow row(st.get());
    out.push_back(decode(row));
  }
  return out;
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteStore::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteStore::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteStore::InsertRecord(Transaction& t, const model::RawRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_RECORD);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto params = sql::RecordParams(r);
  for (std::size_t i = 0; i < params.size(); ++i) {
    BindParam(st.get(), static_cast<int>(i + 1), params[i]);
  }

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RawRecord> SqliteStore::GetRecord(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_RECORD);
  st.RequireReady("get record");
  BindText(st.get(), 1, id);

  auto rows = CollectRows(db, st, "get record", sql::DecodeRecord);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::RawRecord> SqliteStore::QueryRecent(Transaction& t, util::TimePoint since, std::size_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_RECENT);
  st.RequireReady("query recent");
  BindI64(st.get(), 1, util::ToUnixMillis(since));
  BindI64(st.get(), 2, static_cast<int64_t>(limit));

  return CollectRows(db, st, "query recent", sql::DecodeRecord);
}

std::vector<model::RawRecord> SqliteStore::QueryCandidates(Transaction& t, const TimeWindow& window, const BoundingBox& box) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_CANDIDATES);
  st.RequireReady("query candidates");
  BindI64(st.get(), 1, util::ToUnixMillis(window.from));
  BindI64(st.get(), 2, util::ToUnixMillis(window.to));
  sqlite3_bind_double(st.get(), 3, box.min_lat);
  sqlite3_bind_double(st.get(), 4, box.max_lat);
  sqlite3_bind_double(st.get(), 5, box.min_lon);
  sqlite3_bind_double(st.get(), 6, box.max_lon);

  return CollectRows(db, st, "query candidates", sql::DecodeRecord);
}

Result SqliteStore::UpdateMergeState(Transaction& t, const std::string& id, const model::MergeStateUpdate& update,
                                     model::MergeStatus expected_prior) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPDATE_MERGE_STATE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, model::ToString(update.merge_status));
  if (update.merged_into_id) {
    BindText(st.get(), 2, *update.merged_into_id);
  } else {
    sqlite3_bind_null(st.get(), 2);
  }
  if (update.processing_status) {
    BindText(st.get(), 3, model::ToString(*update.processing_status));
  } else {
    sqlite3_bind_null(st.get(), 3);
  }
  BindText(st.get(), 4, update.note);
  BindText(st.get(), 5, update.note);
  BindText(st.get(), 6, update.note);
  BindText(st.get(), 7, id);
  BindText(st.get(), 8, model::ToString(expected_prior));

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  Statement exists(db, sql::SELECT_RECORD_EXISTS);
  if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(exists.get(), 1, id);
  int rc = sqlite3_step(exists.get());
  if (rc == SQLITE_ROW) {
    return Result::Err(ErrorCode::Conflict, "record " + id + " is no longer " + model::ToString(expected_prior));
  }
  if (rc == SQLITE_DONE) {
    return Result::Err(ErrorCode::NotFound, "record not found: " + id);
  }
  return Translate(db, rc);
}

Result SqliteStore::UpdateFields(Transaction& t, const std::string& id, const model::RawRecordPatch& patch) {
  auto* db = TX(t).Handle();

  const auto assignments = sql::PatchAssignments(patch);
  if (assignments.empty()) {
    Statement exists(db, sql::SELECT_RECORD_EXISTS);
    if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(exists.get(), 1, id);
    int rc = sqlite3_step(exists.get());
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "record not found: " + id);
    return Translate(db, rc);
  }

  std::string text = "UPDATE raw_record SET ";
  for (std::size_t i = 0; i < assignments.size(); ++i) {
    if (i > 0) text += ",";
    text += assignments[i].column;
    text += "=?";
  }
  text += " WHERE id=?;";

  Statement st(db, text.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int idx = 1;
  for (const auto& assignment : assignments) {
    BindParam(st.get(), idx++, assignment.value);
  }
  BindText(st.get(), idx, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "record not found: " + id);
  return Result::Ok();
}

std::vector<MergeIntegrityViolation> SqliteStore::ListMergeIntegrityViolations(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_INTEGRITY_VIOLATIONS);
  st.RequireReady("list integrity violations");

  return CollectRows(db, st, "list integrity violations", [](const sql::Row& row) {
    return MergeIntegrityViolation{row.GetText(0), row.GetText(1), row.GetText(2)};
  });
}

// ------------------------------------------------------------------
// Vessel references
// ------------------------------------------------------------------

std::optional<model::VesselReferenceRecord> SqliteStore::FindVesselReference(Transaction& t, const model::VesselReferenceKey& key) {
  auto* db = TX(t).Handle();

  const bool by_imo = std::holds_alternative<model::ByImo>(key);
  Statement  st(db, by_imo ? sql::SELECT_VESSEL_BY_IMO : sql::SELECT_VESSEL_BY_NAME);
  st.RequireReady("find vessel reference");
  BindText(st.get(), 1, by_imo ? std::get<model::ByImo>(key).imo : std::get<model::ByName>(key).normalized_name);

  auto rows = CollectRows(db, st, "find vessel reference", sql::DecodeVesselReference);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

Result SqliteStore::InsertVesselReference(Transaction& t, const model::VesselReferenceRecord& v) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_VESSEL_REFERENCE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, v.id);
  BindText(st.get(), 2, v.imo);
  BindText(st.get(), 3, v.normalized_name);
  BindText(st.get(), 4, v.display_name);

  return Translate(db, sqlite3_step(st.get()));
}

} // namespace seawatch::db::sqlite
