#include "sql_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace seawatch::db::sql {

namespace {

Param OptionalText(const std::optional<std::string>& value) {
  if (!value) return nullptr;
  return *value;
}

Param OptionalDouble(const std::optional<double>& value) {
  if (!value) return nullptr;
  return *value;
}

Param OptionalMillis(const std::optional<util::TimePoint>& value) {
  if (!value) return nullptr;
  return util::ToUnixMillis(*value);
}

std::optional<std::string> ColOptionalText(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return row.GetText(col);
}

std::string ColText(const Row& row, int col) {
  if (row.IsNull(col)) return {};
  return row.GetText(col);
}

std::optional<double> ColOptionalDouble(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return row.GetDouble(col);
}

std::optional<util::TimePoint> ColOptionalTime(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return util::FromUnixMillis(row.GetInt64(col));
}

} // namespace

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw util::InvalidState("failed to encode list column: " + std::string(status.message()));
  }
  return json;
}

std::vector<std::string> DecodeStringList(const std::string& json) {
  if (json.empty()) {
    return {};
  }

  google::protobuf::ListValue list;
  const auto                  status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw util::StoreUnavailable("corrupt list column: " + std::string(status.message()));
  }

  std::vector<std::string> values;
  values.reserve(list.values_size());
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::StoreUnavailable("corrupt list column: non-string element");
    }
    values.push_back(value.string_value());
  }
  return values;
}

Params RecordParams(const model::RawRecord& r) {
  Params params;
  params.reserve(28);
  params.emplace_back(r.id);
  params.emplace_back(r.source);
  params.emplace_back(r.reference_id);
  params.push_back(OptionalMillis(r.occurred_at));
  params.push_back(OptionalDouble(r.latitude));
  params.push_back(OptionalDouble(r.longitude));
  params.emplace_back(r.title);
  params.emplace_back(r.description);
  params.emplace_back(r.region);
  params.emplace_back(r.location);
  params.emplace_back(r.incident_type_name);
  params.emplace_back(r.vessel_name);
  params.emplace_back(r.vessel_type);
  params.emplace_back(r.vessel_flag);
  params.emplace_back(r.vessel_imo);
  params.emplace_back(r.vessel_status);
  params.emplace_back(r.update_text);
  params.emplace_back(r.processing_notes);
  params.emplace_back(r.raw_json);
  params.emplace_back(std::string(model::ToString(r.merge_status)));
  params.push_back(OptionalText(r.merged_into_id));
  params.push_back(OptionalText(r.canonical_incident_id));
  params.emplace_back(std::string(model::ToString(r.processing_status)));
  params.push_back(OptionalMillis(r.merged_at));
  params.emplace_back(EncodeStringList(r.merged_sources));
  params.emplace_back(EncodeStringList(r.merged_record_ids));
  params.push_back(OptionalText(r.vessel_ref_id));
  params.push_back(OptionalMillis(r.last_processed_at));
  return params;
}

std::vector<Assignment> PatchAssignments(const model::RawRecordPatch& p) {
  std::vector<Assignment> out;

  auto text = [&out](const char* column, const std::optional<std::string>& value) {
    if (value) out.push_back({column, *value});
  };

  text("title", p.title);
  text("description", p.description);
  text("region", p.region);
  text("location", p.location);
  text("incident_type_name", p.incident_type_name);
  text("vessel_name", p.vessel_name);
  text("vessel_type", p.vessel_type);
  text("vessel_flag", p.vessel_flag);
  text("vessel_imo", p.vessel_imo);
  text("vessel_status", p.vessel_status);
  if (p.latitude) out.push_back({"latitude", *p.latitude});
  if (p.longitude) out.push_back({"longitude", *p.longitude});
  text("update_text", p.update_text);
  text("processing_notes", p.processing_notes);
  text("canonical_incident_id", p.canonical_incident_id);
  if (p.merged_at) out.push_back({"merged_at_ms", util::ToUnixMillis(*p.merged_at)});
  if (p.merged_sources) out.push_back({"merged_sources", EncodeStringList(*p.merged_sources)});
  if (p.merged_record_ids) out.push_back({"merged_record_ids", EncodeStringList(*p.merged_record_ids)});
  text("vessel_ref_id", p.vessel_ref_id);
  if (p.processing_status) out.push_back({"processing_status", std::string(model::ToString(*p.processing_status))});
  if (p.last_processed_at) out.push_back({"last_processed_at_ms", util::ToUnixMillis(*p.last_processed_at)});

  return out;
}

model::RawRecord DecodeRecord(const Row& row) {
  model::RawRecord r;
  r.id                 = ColText(row, 0);
  r.source             = ColText(row, 1);
  r.reference_id       = ColText(row, 2);
  r.occurred_at        = ColOptionalTime(row, 3);
  r.latitude           = ColOptionalDouble(row, 4);
  r.longitude          = ColOptionalDouble(row, 5);
  r.title              = ColText(row, 6);
  r.description        = ColText(row, 7);
  r.region             = ColText(row, 8);
  r.location           = ColText(row, 9);
  r.incident_type_name = ColText(row, 10);
  r.vessel_name        = ColText(row, 11);
  r.vessel_type        = ColText(row, 12);
  r.vessel_flag        = ColText(row, 13);
  r.vessel_imo         = ColText(row, 14);
  r.vessel_status      = ColText(row, 15);
  r.update_text        = ColText(row, 16);
  r.processing_notes   = ColText(row, 17);
  r.raw_json           = ColText(row, 18);

  const auto merge_status = model::ParseMergeStatus(ColText(row, 19));
  if (!merge_status) {
    throw util::StoreUnavailable("record " + r.id + " has unknown merge_status");
  }
  r.merge_status          = *merge_status;
  r.merged_into_id        = ColOptionalText(row, 20);
  r.canonical_incident_id = ColOptionalText(row, 21);

  const auto processing_status = model::ParseProcessingStatus(ColText(row, 22));
  if (!processing_status) {
    throw util::StoreUnavailable("record " + r.id + " has unknown processing_status");
  }
  r.processing_status = *processing_status;
  r.merged_at         = ColOptionalTime(row, 23);
  r.merged_sources    = DecodeStringList(ColText(row, 24));
  r.merged_record_ids = DecodeStringList(ColText(row, 25));
  r.vessel_ref_id     = ColOptionalText(row, 26);
  r.last_processed_at = ColOptionalTime(row, 27);
  return r;
}

model::VesselReferenceRecord DecodeVesselReference(const Row& row) {
  model::VesselReferenceRecord r;
  r.id              = ColText(row, 0);
  r.imo             = ColText(row, 1);
  r.normalized_name = ColText(row, 2);
  r.display_name    = ColText(row, 3);
  return r;
}

} // namespace seawatch::db::sql
