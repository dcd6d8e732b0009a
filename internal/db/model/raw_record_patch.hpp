#pragma once

#include <optional>
#include <string>
#include <vector>

#include "raw_record.hpp"

namespace seawatch::db::model {

/*
  Partial field set for IncidentStore::UpdateFields.

  Only engaged fields are written. Merge-state columns are not part of a
  patch; they change only through the conditional UpdateMergeState.
*/
struct RawRecordPatch {
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<std::string> region;
  std::optional<std::string> location;
  std::optional<std::string> incident_type_name;

  std::optional<std::string> vessel_name;
  std::optional<std::string> vessel_type;
  std::optional<std::string> vessel_flag;
  std::optional<std::string> vessel_imo;
  std::optional<std::string> vessel_status;

  std::optional<double> latitude;
  std::optional<double> longitude;

  std::optional<std::string> update_text;
  std::optional<std::string> processing_notes;

  std::optional<std::string>              canonical_incident_id;
  std::optional<util::TimePoint>          merged_at;
  std::optional<std::vector<std::string>> merged_sources;
  std::optional<std::vector<std::string>> merged_record_ids;
  std::optional<std::string>              vessel_ref_id;

  std::optional<ProcessingStatus> processing_status;
  std::optional<util::TimePoint>  last_processed_at;

  bool Empty() const;
};

void ApplyPatch(RawRecord& record, const RawRecordPatch& patch);

} // namespace seawatch::db::model
