#pragma once

#include <string_view>

#include "internal/db/model/raw_record.hpp"

namespace seawatch::ranking {

// Additive field-presence score; more information never scores lower.
int Completeness(const db::model::RawRecord& record);

// Static source reliability table, case-insensitive. Unknown sources
// rank 1, a record without a source 0.
int SourcePriority(std::string_view source);

// 0.7 * completeness + 0.3 * priority
double QualityScore(const db::model::RawRecord& record);

struct PrimarySelection {
  const db::model::RawRecord* primary   = nullptr;
  const db::model::RawRecord* secondary = nullptr;
};

// Higher quality survives as primary; ties keep r1.
PrimarySelection DeterminePrimary(const db::model::RawRecord& r1, const db::model::RawRecord& r2);

} // namespace seawatch::ranking
