#include "merge_planner.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include "internal/geo/geo_time.hpp"
#include "internal/observability/logging.hpp"

namespace seawatch::merge {

namespace {

bool Present(const std::string& value) {
  return value.find_first_not_of(" \t\r\n") != std::string::npos;
}

void AdoptIfEmpty(std::optional<std::string>& target, const std::string& primary, const std::string& secondary) {
  if (!Present(primary) && Present(secondary)) {
    target = secondary;
  }
}

void AddUnique(std::vector<std::string>& values, const std::string& value) {
  if (!value.empty() && std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

std::string SourceLabel(const db::model::RawRecord& r) {
  return r.source.empty() ? std::string("unknown source") : r.source;
}

} // namespace

MergePlan PlanMerge(const db::model::RawRecord& primary, const db::model::RawRecord& secondary, util::TimePoint now) {
  MergePlan plan;

  const auto& folded = primary.merged_record_ids;
  if (std::find(folded.begin(), folded.end(), secondary.id) != folded.end()) {
    plan.already_merged = true;
    return plan;
  }

  auto&       patch  = plan.patch;
  const auto  source = SourceLabel(secondary);

  // description
  if (Present(secondary.description) && secondary.description != primary.description) {
    if (!Present(primary.description)) {
      patch.description = secondary.description;
    } else if (primary.description.find(secondary.description) == std::string::npos) {
      patch.description = primary.description + "\n\n[Additional info from " + source + "]:\n" + secondary.description;
    }
  }

  // update text is cumulative
  if (Present(secondary.update_text)) {
    patch.update_text = Present(primary.update_text)
                            ? primary.update_text + "\n\n[Update from " + source + "]:\n" + secondary.update_text
                            : secondary.update_text;
  }

  AdoptIfEmpty(patch.title, primary.title, secondary.title);
  AdoptIfEmpty(patch.location, primary.location, secondary.location);
  AdoptIfEmpty(patch.region, primary.region, secondary.region);
  AdoptIfEmpty(patch.incident_type_name, primary.incident_type_name, secondary.incident_type_name);
  AdoptIfEmpty(patch.vessel_name, primary.vessel_name, secondary.vessel_name);
  AdoptIfEmpty(patch.vessel_type, primary.vessel_type, secondary.vessel_type);
  AdoptIfEmpty(patch.vessel_flag, primary.vessel_flag, secondary.vessel_flag);
  AdoptIfEmpty(patch.vessel_imo, primary.vessel_imo, secondary.vessel_imo);
  AdoptIfEmpty(patch.vessel_status, primary.vessel_status, secondary.vessel_status);

  if (!geo::IsValidCoordinate(primary.latitude, primary.longitude) && geo::IsValidCoordinate(secondary.latitude, secondary.longitude)) {
    patch.latitude  = secondary.latitude;
    patch.longitude = secondary.longitude;
  }

  if (!primary.vessel_ref_id && secondary.vessel_ref_id) {
    patch.vessel_ref_id = secondary.vessel_ref_id;
  }

  // canonical incident link
  if (secondary.canonical_incident_id) {
    if (!primary.canonical_incident_id) {
      patch.canonical_incident_id = secondary.canonical_incident_id;
    } else if (*primary.canonical_incident_id != *secondary.canonical_incident_id) {
      plan.canonical_conflict = true;
      SEAWATCH_LOG_WARN("canonical incident conflict, keeping primary link",
                        {observability::StringField("primary_id", primary.id), observability::StringField("secondary_id", secondary.id),
                         observability::StringField("primary_incident", *primary.canonical_incident_id),
                         observability::StringField("secondary_incident", *secondary.canonical_incident_id)});
    }
  }

  // merge metadata
  patch.merged_at = now;

  std::vector<std::string> sources = primary.merged_sources;
  AddUnique(sources, primary.source);
  AddUnique(sources, secondary.source);
  for (const auto& s : secondary.merged_sources) AddUnique(sources, s);
  patch.merged_sources = std::move(sources);

  std::vector<std::string> record_ids = primary.merged_record_ids;
  record_ids.push_back(secondary.id);
  patch.merged_record_ids = std::move(record_ids);

  const std::string note = "Merged with " + source + " (" + secondary.id + ") on " + util::FormatTimestamp(now) + ".";
  patch.processing_notes = Present(primary.processing_notes) ? primary.processing_notes + "\n" + note : note;

  return plan;
}

} // namespace seawatch::merge
