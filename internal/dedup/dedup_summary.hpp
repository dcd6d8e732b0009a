#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace seawatch::dedup {

/*
  Outcome of one deduplication pass. Consumers such as dashboards rely
  on this shape.
*/
struct DedupSummary {
  int64_t records_analyzed          = 0;
  int64_t potential_matches_checked = 0;
  int64_t high_confidence_matches   = 0;
  int64_t medium_confidence_matches = 0;
  int64_t merges_attempted          = 0;
  int64_t merges_succeeded          = 0;
  int64_t merge_errors              = 0;
};

// Broken arithmetic invariants, empty when the summary is consistent.
std::vector<std::string> ValidateSummary(const DedupSummary& summary);

} // namespace seawatch::dedup
