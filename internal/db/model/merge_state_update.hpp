#pragma once

#include <optional>
#include <string>

#include "raw_record.hpp"

namespace seawatch::db::model {

/*
  Linkage-state write applied by IncidentStore::UpdateMergeState.

  merged_into_id must be set iff merge_status is kMergedInto. A non-empty
  note is appended to processing_notes on its own line.
*/
struct MergeStateUpdate {
  MergeStatus                     merge_status = MergeStatus::kNone;
  std::optional<std::string>      merged_into_id;
  std::optional<ProcessingStatus> processing_status;
  std::string                     note;
};

} // namespace seawatch::db::model
