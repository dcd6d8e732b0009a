#include "internal/merge/merge_planner.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

using seawatch::db::model::RawRecord;
using seawatch::merge::PlanMerge;

const auto kNow = seawatch::util::ParseTimestamp("2024-03-02T08:00:00Z").value();

RawRecord MakeRecord(const std::string& id, const std::string& source) {
  RawRecord r;
  r.id     = id;
  r.source = source;
  return r;
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void TestPopulatedFieldsAreNeverOverwritten() {
  auto primary        = MakeRecord("p", "RECAAP");
  primary.title       = "Robbery at anchorage";
  primary.vessel_name = "OCEAN STAR";

  auto secondary        = MakeRecord("s", "UKMTO");
  secondary.title       = "Incident";
  secondary.vessel_name = "M/V OCEAN STAR";
  secondary.vessel_flag = "PA";
  secondary.region      = "Singapore Strait";

  auto plan = PlanMerge(primary, secondary, kNow);
  assert(!plan.already_merged);
  assert(!plan.patch.title);
  assert(!plan.patch.vessel_name);
  assert(plan.patch.vessel_flag && *plan.patch.vessel_flag == "PA");
  assert(plan.patch.region && *plan.patch.region == "Singapore Strait");
}

void TestDescriptionsAndUpdatesAreAppended() {
  auto primary        = MakeRecord("p", "RECAAP");
  primary.description = "Four robbers boarded the tanker.";
  primary.update_text = "Crew safe.";

  auto secondary        = MakeRecord("s", "UKMTO");
  secondary.description = "Engine spares stolen.";
  secondary.update_text = "Vessel proceeding.";

  auto plan = PlanMerge(primary, secondary, kNow);
  assert(plan.patch.description ==
         std::string("Four robbers boarded the tanker.\n\n[Additional info from UKMTO]:\nEngine spares stolen."));
  assert(plan.patch.update_text == std::string("Crew safe.\n\n[Update from UKMTO]:\nVessel proceeding."));

  // a description already contained in the primary is not appended twice
  secondary.description = "boarded the tanker.";
  plan                  = PlanMerge(primary, secondary, kNow);
  assert(!plan.patch.description);

  // empty primary description adopts the secondary text as is
  primary.description   = "";
  secondary.description = "Engine spares stolen.";
  plan                  = PlanMerge(primary, secondary, kNow);
  assert(plan.patch.description == std::string("Engine spares stolen."));
}

void TestCoordinatesMoveAsAPair() {
  auto primary      = MakeRecord("p", "RECAAP");
  primary.latitude  = 0.0;
  primary.longitude = 0.0;

  auto secondary      = MakeRecord("s", "UKMTO");
  secondary.latitude  = 1.25;
  secondary.longitude = 103.9;

  auto plan = PlanMerge(primary, secondary, kNow);
  assert(plan.patch.latitude == 1.25);
  assert(plan.patch.longitude == 103.9);

  primary.latitude  = 1.2;
  primary.longitude = 103.8;
  plan              = PlanMerge(primary, secondary, kNow);
  assert(!plan.patch.latitude && !plan.patch.longitude);
}

void TestMergeMetadata() {
  auto primary              = MakeRecord("p", "RECAAP");
  primary.merged_sources    = {"RECAAP", "ICC"};
  primary.merged_record_ids = {"older"};
  primary.processing_notes  = "Imported.";

  auto secondary           = MakeRecord("s", "UKMTO");
  secondary.merged_sources = {"MDAT"};

  auto plan = PlanMerge(primary, secondary, kNow);
  assert(plan.patch.merged_at == kNow);

  const auto& sources = *plan.patch.merged_sources;
  assert(sources.size() == 4);
  assert(Contains(sources, "RECAAP") && Contains(sources, "ICC") && Contains(sources, "UKMTO") && Contains(sources, "MDAT"));

  const auto& ids = *plan.patch.merged_record_ids;
  assert(ids.size() == 2 && ids[0] == "older" && ids[1] == "s");

  assert(plan.patch.processing_notes ==
         std::string("Imported.\nMerged with UKMTO (s) on ") + seawatch::util::FormatTimestamp(kNow) + ".");
}

void TestFirstMergeRecordsPrimarySource() {
  auto plan = PlanMerge(MakeRecord("p", "RECAAP"), MakeRecord("s", "UKMTO"), kNow);

  const auto& sources = *plan.patch.merged_sources;
  assert(sources.size() == 2);
  assert(sources[0] == "RECAAP" && sources[1] == "UKMTO");
}

void TestAlreadyMergedIsIdempotent() {
  auto primary              = MakeRecord("p", "RECAAP");
  primary.merged_record_ids = {"s"};

  auto secondary        = MakeRecord("s", "UKMTO");
  secondary.description = "More text.";

  auto plan = PlanMerge(primary, secondary, kNow);
  assert(plan.already_merged);
  assert(plan.patch.Empty());
}

void TestRetriedMergeChangesNothing() {
  auto primary        = MakeRecord("p", "RECAAP");
  primary.description = "Robbers boarded the tanker at anchor.";
  primary.update_text = "Master reported to port control.";

  auto secondary        = MakeRecord("s", "UKMTO");
  secondary.description = "Three persons sighted on the poop deck.";
  secondary.update_text = "Crew safe, nothing stolen.";
  secondary.vessel_flag = "MT";
  secondary.latitude    = 1.21;
  secondary.longitude   = 103.62;

  auto first = PlanMerge(primary, secondary, kNow);
  assert(!first.already_merged);
  assert(!first.patch.Empty());
  seawatch::db::model::ApplyPatch(primary, first.patch);

  const auto description = primary.description;
  const auto update_text = primary.update_text;
  const auto notes       = primary.processing_notes;
  assert(description.find(secondary.description) != std::string::npos);
  assert(update_text.find(secondary.update_text) != std::string::npos);

  auto retry = PlanMerge(primary, secondary, kNow + std::chrono::minutes(5));
  assert(retry.already_merged);
  assert(retry.patch.Empty());

  seawatch::db::model::ApplyPatch(primary, retry.patch);
  assert(primary.description == description);
  assert(primary.update_text == update_text);
  assert(primary.processing_notes == notes);
  assert(primary.merged_record_ids == std::vector<std::string>({"s"}));
}

void TestCanonicalLinks() {
  auto primary   = MakeRecord("p", "RECAAP");
  auto secondary = MakeRecord("s", "UKMTO");

  secondary.canonical_incident_id = "incident-7";
  auto plan                       = PlanMerge(primary, secondary, kNow);
  assert(plan.patch.canonical_incident_id == std::string("incident-7"));
  assert(!plan.canonical_conflict);

  primary.canonical_incident_id = "incident-3";
  plan                          = PlanMerge(primary, secondary, kNow);
  assert(!plan.patch.canonical_incident_id);
  assert(plan.canonical_conflict);
}

void TestVesselReferenceIsAdopted() {
  auto primary            = MakeRecord("p", "RECAAP");
  auto secondary          = MakeRecord("s", "UKMTO");
  secondary.vessel_ref_id = "vessel-1";

  auto plan = PlanMerge(primary, secondary, kNow);
  assert(plan.patch.vessel_ref_id == std::string("vessel-1"));

  primary.vessel_ref_id = "vessel-2";
  plan                  = PlanMerge(primary, secondary, kNow);
  assert(!plan.patch.vessel_ref_id);
}

} // namespace

int main() {
  TestPopulatedFieldsAreNeverOverwritten();
  TestDescriptionsAndUpdatesAreAppended();
  TestCoordinatesMoveAsAPair();
  TestMergeMetadata();
  TestFirstMergeRecordsPrimarySource();
  TestAlreadyMergedIsIdempotent();
  TestRetriedMergeChangesNothing();
  TestCanonicalLinks();
  TestVesselReferenceIsAdopted();

  std::cout << "seawatch_unit_merge_planner: pass\n";
  return 0;
}
