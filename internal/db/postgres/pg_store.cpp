#include "pg_store.hpp"

#include <type_traits>

#include "internal/db/sql/sql_codec.hpp"
#include "internal/util/errors.hpp"

namespace seawatch::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(pqxx::row row) : row_(std::move(row)) {
  }

  std::string GetText(int col) const override {
    return row_[col].c_str();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  double GetDouble(int col) const override {
    return row_[col].as<double>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  pqxx::row row_;
};

void AppendParam(pqxx::params& params, const sql::Param& param) {
  std::visit(
      [&params](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          params.append();
        } else {
          params.append(value);
        }
      },
      param);
}

template <typename Decode>
auto DecodeRows(const pqxx::result& res, Decode decode) {
  std::vector<decltype(decode(std::declval<const sql::Row&>()))> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    PgRow adapter(row);
    out.push_back(decode(adapter));
  }
  return out;
}

std::optional<std::string> ProcessingStatusText(const model::MergeStateUpdate& update) {
  if (!update.processing_status) return std::nullopt;
  return std::string(model::ToString(*update.processing_status));
}

} // namespace

PgStore::PgStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgStore::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgStore::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result PgStore::InsertRecord(Transaction& t, const model::RawRecord& r) {
  try {
    pqxx::params params;
    for (const auto& param : sql::RecordParams(r)) {
      AppendParam(params, param);
    }
    TX(t).Work().exec_prepared("insert_record", params);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RawRecord> PgStore::GetRecord(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_record", id);
    if (res.empty()) return std::nullopt;
    PgRow row(res[0]);
    return sql::DecodeRecord(row);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("get record: ") + e.what());
  }
}

std::vector<model::RawRecord> PgStore::QueryRecent(Transaction& t, util::TimePoint since, std::size_t limit) {
  try {
    auto res = TX(t).Work().exec_prepared("query_recent", util::ToUnixMillis(since), static_cast<int64_t>(limit));
    return DecodeRows(res, sql::DecodeRecord);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("query recent: ") + e.what());
  }
}

std::vector<model::RawRecord> PgStore::QueryCandidates(Transaction& t, const TimeWindow& window, const BoundingBox& box) {
  try {
    auto res = TX(t).Work().exec_prepared("query_candidates", util::ToUnixMillis(window.from), util::ToUnixMillis(window.to),
                                          box.min_lat, box.max_lat, box.min_lon, box.max_lon);
    return DecodeRows(res, sql::DecodeRecord);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("query candidates: ") + e.what());
  }
}

Result PgStore::UpdateMergeState(Transaction& t, const std::string& id, const model::MergeStateUpdate& update,
                                 model::MergeStatus expected_prior) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_merge_state", std::string(model::ToString(update.merge_status)), update.merged_into_id,
                                    ProcessingStatusText(update), update.note, id, std::string(model::ToString(expected_prior)));
    if (res.affected_rows() > 0) return Result::Ok();

    if (work.exec_prepared("record_exists", id).empty()) {
      return Result::Err(ErrorCode::NotFound, "record not found: " + id);
    }
    return Result::Err(ErrorCode::Conflict, "record " + id + " is no longer " + model::ToString(expected_prior));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgStore::UpdateFields(Transaction& t, const std::string& id, const model::RawRecordPatch& patch) {
  try {
    auto&      work        = TX(t).Work();
    const auto assignments = sql::PatchAssignments(patch);
    if (assignments.empty()) {
      if (work.exec_prepared("record_exists", id).empty()) {
        return Result::Err(ErrorCode::NotFound, "record not found: " + id);
      }
      return Result::Ok();
    }

    std::string  text = "UPDATE raw_record SET ";
    pqxx::params params;
    int          idx = 1;
    for (const auto& assignment : assignments) {
      if (idx > 1) text += ",";
      text += assignment.column;
      text += "=$" + std::to_string(idx++);
      AppendParam(params, assignment.value);
    }
    text += " WHERE id=$" + std::to_string(idx);
    params.append(id);

    auto res = work.exec_params(text, params);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "record not found: " + id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<MergeIntegrityViolation> PgStore::ListMergeIntegrityViolations(Transaction& t) {
  try {
    auto res = TX(t).Work().exec_prepared("list_integrity_violations");
    return DecodeRows(res, [](const sql::Row& row) { return MergeIntegrityViolation{row.GetText(0), row.GetText(1), row.GetText(2)}; });
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("list integrity violations: ") + e.what());
  }
}

// ------------------------------------------------------------------
// Vessel references
// ------------------------------------------------------------------

std::optional<model::VesselReferenceRecord> PgStore::FindVesselReference(Transaction& t, const model::VesselReferenceKey& key) {
  try {
    auto& work = TX(t).Work();
    auto  res  = std::holds_alternative<model::ByImo>(key)
                     ? work.exec_prepared("find_vessel_by_imo", std::get<model::ByImo>(key).imo)
                     : work.exec_prepared("find_vessel_by_name", std::get<model::ByName>(key).normalized_name);
    if (res.empty()) return std::nullopt;
    PgRow row(res[0]);
    return sql::DecodeVesselReference(row);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("find vessel reference: ") + e.what());
  }
}

Result PgStore::InsertVesselReference(Transaction& t, const model::VesselReferenceRecord& v) {
  try {
    TX(t).Work().exec_prepared("insert_vessel_reference", v.id, v.imo, v.normalized_name, v.display_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace seawatch::db::postgres
