#include "dedup_summary.hpp"

namespace seawatch::dedup {

std::vector<std::string> ValidateSummary(const DedupSummary& s) {
  std::vector<std::string> problems;

  if (s.records_analyzed < 0 || s.potential_matches_checked < 0 || s.high_confidence_matches < 0 ||
      s.medium_confidence_matches < 0 || s.merges_attempted < 0 || s.merges_succeeded < 0 || s.merge_errors < 0) {
    problems.emplace_back("negative counter");
  }
  if (s.merges_succeeded > s.merges_attempted) {
    problems.emplace_back("merges_succeeded > merges_attempted");
  }
  if (s.merges_attempted > s.potential_matches_checked) {
    problems.emplace_back("merges_attempted > potential_matches_checked");
  }
  if (s.high_confidence_matches + s.medium_confidence_matches > s.potential_matches_checked) {
    problems.emplace_back("high + medium confidence matches > potential_matches_checked");
  }
  if (s.merges_succeeded + s.merge_errors != s.merges_attempted) {
    problems.emplace_back("merges_succeeded + merge_errors != merges_attempted");
  }
  return problems;
}

} // namespace seawatch::dedup
