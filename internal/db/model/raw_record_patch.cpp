#include "raw_record_patch.hpp"

namespace seawatch::db::model {

namespace {

template <typename T>
void Assign(T& target, const std::optional<T>& value) {
  if (value) {
    target = *value;
  }
}

template <typename T>
void Assign(std::optional<T>& target, const std::optional<T>& value) {
  if (value) {
    target = *value;
  }
}

} // namespace

bool RawRecordPatch::Empty() const {
  return !title && !description && !region && !location && !incident_type_name && !vessel_name && !vessel_type && !vessel_flag &&
         !vessel_imo && !vessel_status && !latitude && !longitude && !update_text && !processing_notes && !canonical_incident_id &&
         !merged_at && !merged_sources && !merged_record_ids && !vessel_ref_id && !processing_status && !last_processed_at;
}

void ApplyPatch(RawRecord& record, const RawRecordPatch& patch) {
  Assign(record.title, patch.title);
  Assign(record.description, patch.description);
  Assign(record.region, patch.region);
  Assign(record.location, patch.location);
  Assign(record.incident_type_name, patch.incident_type_name);

  Assign(record.vessel_name, patch.vessel_name);
  Assign(record.vessel_type, patch.vessel_type);
  Assign(record.vessel_flag, patch.vessel_flag);
  Assign(record.vessel_imo, patch.vessel_imo);
  Assign(record.vessel_status, patch.vessel_status);

  Assign(record.latitude, patch.latitude);
  Assign(record.longitude, patch.longitude);

  Assign(record.update_text, patch.update_text);
  Assign(record.processing_notes, patch.processing_notes);

  Assign(record.canonical_incident_id, patch.canonical_incident_id);
  Assign(record.merged_at, patch.merged_at);
  Assign(record.merged_sources, patch.merged_sources);
  Assign(record.merged_record_ids, patch.merged_record_ids);
  Assign(record.vessel_ref_id, patch.vessel_ref_id);

  Assign(record.processing_status, patch.processing_status);
  Assign(record.last_processed_at, patch.last_processed_at);
}

} // namespace seawatch::db::model
