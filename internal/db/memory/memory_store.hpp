#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/incident_store.hpp"

namespace seawatch::db::memory {

class MemoryTransaction;

/*
  In-process IncidentStore.

  Used by tests and by the memory database backend. Transactions work on
  a private snapshot; Commit() publishes it only if nothing else was
  committed since the snapshot was taken.
*/
class MemoryStore final : public db::IncidentStore {
 public:
  MemoryStore();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::RawRecord>             records;
    std::map<std::string, model::VesselReferenceRecord> vessels;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace seawatch::db::memory
