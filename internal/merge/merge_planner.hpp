#pragma once

#include "internal/db/model/raw_record.hpp"
#include "internal/db/model/raw_record_patch.hpp"
#include "internal/util/time.hpp"

namespace seawatch::merge {

struct MergePlan {
  // Field updates for the primary only.
  db::model::RawRecordPatch patch;

  // secondary is already listed in primary.merged_record_ids; patch is empty
  bool already_merged = false;

  // both records link to different canonical incidents; primary's link kept
  bool canonical_conflict = false;
};

/*
  Computes how primary absorbs secondary.

  Populated primary fields are never overwritten. Descriptions and
  update text are appended under a per-source header, coordinates move
  only as a valid pair, and merge metadata (time, sources, record ids,
  audit note) is stamped on every plan that is not already_merged.
*/
MergePlan PlanMerge(const db::model::RawRecord& primary, const db::model::RawRecord& secondary, util::TimePoint now);

} // namespace seawatch::merge
