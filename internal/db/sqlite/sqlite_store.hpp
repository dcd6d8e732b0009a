#pragma once

#include <memory>

#include "internal/db/api/incident_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace seawatch::db::sqlite {

class SqliteStore final : public db::IncidentStore {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertRecord(Transaction&, const model::RawRecord&) override;
  std::optional<model::RawRecord> GetRecord(Transaction&, const std::string& id) override;

  std::vector<model::RawRecord> QueryRecent(Transaction&, util::TimePoint since, std::size_t limit) override;
  std::vector<model::RawRecord> QueryCandidates(Transaction&, const TimeWindow& window, const BoundingBox& box) override;

  Result UpdateMergeState(Transaction&, const std::string& id, const model::MergeStateUpdate& update,
                          model::MergeStatus expected_prior) override;
  Result UpdateFields(Transaction&, const std::string& id, const model::RawRecordPatch& patch) override;

  std::vector<MergeIntegrityViolation> ListMergeIntegrityViolations(Transaction&) override;

  std::optional<model::VesselReferenceRecord> FindVesselReference(Transaction&, const model::VesselReferenceKey& key) override;
  Result                                      InsertVesselReference(Transaction&, const model::VesselReferenceRecord&) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace seawatch::db::sqlite
