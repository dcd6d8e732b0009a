#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/merge_state_update.hpp"
#include "internal/db/model/raw_record.hpp"
#include "internal/db/model/raw_record_patch.hpp"
#include "internal/db/model/vessel_reference_record.hpp"
#include "internal/util/time.hpp"

namespace seawatch::db {

struct TimeWindow {
  util::TimePoint from;
  util::TimePoint to;
};

struct BoundingBox {
  double min_lat = 0.0;
  double max_lat = 0.0;
  double min_lon = 0.0;
  double max_lon = 0.0;
};

/*
  A stored record that breaks the one-level-deep merge invariant.
  reason is "self_merge", "chained_merge" or "dangling_merge".
*/
struct MergeIntegrityViolation {
  std::string record_id;
  std::string merged_into_id;
  std::string reason;
};

/*
  IncidentStore

  Persistence boundary of the dedup engine.

  Rules:
    - All operations run inside a Transaction obtained from Begin().
    - Writes report failures through Result; they never throw for
      expected outcomes (unknown id, lost conditional write).
    - Reads throw util::StoreUnavailable on backend failure.
    - Records are never deleted.
*/
class IncidentStore {
 public:
  virtual ~IncidentStore() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // --------------------------------------------------------------------------
  // Records
  // --------------------------------------------------------------------------
  virtual Result                          InsertRecord(Transaction&, const model::RawRecord&)           = 0;
  virtual std::optional<model::RawRecord> GetRecord(Transaction&, const std::string& id) = 0;

  // Records with occurred_at >= since that are not merged_into, ordered by
  // occurred_at descending then id ascending, at most limit rows.
  virtual std::vector<model::RawRecord> QueryRecent(Transaction&, util::TimePoint since, std::size_t limit) = 0;

  // Records inside window and box that carry a canonical incident link and
  // are not merged_into, ordered by id.
  virtual std::vector<model::RawRecord> QueryCandidates(Transaction&, const TimeWindow& window, const BoundingBox& box) = 0;

  // Conditional write: succeeds only while the stored merge_status equals
  // expected_prior. Conflict when it does not, NotFound for unknown ids.
  virtual Result UpdateMergeState(Transaction&, const std::string& id, const model::MergeStateUpdate& update,
                                  model::MergeStatus expected_prior) = 0;

  virtual Result UpdateFields(Transaction&, const std::string& id, const model::RawRecordPatch& patch) = 0;

  virtual std::vector<MergeIntegrityViolation> ListMergeIntegrityViolations(Transaction&) = 0;

  // --------------------------------------------------------------------------
  // Vessel reference entities
  // --------------------------------------------------------------------------
  virtual std::optional<model::VesselReferenceRecord> FindVesselReference(Transaction&, const model::VesselReferenceKey& key) = 0;
  virtual Result                                      InsertVesselReference(Transaction&, const model::VesselReferenceRecord&) = 0;
};

} // namespace seawatch::db
