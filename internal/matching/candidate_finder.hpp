#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/incident_store.hpp"
#include "internal/scoring/composite_scorer.hpp"
#include "override_rules.hpp"

namespace seawatch::matching {

struct MatcherSettings {
  double                   time_window_hours    = 48.0;
  double                   spatial_window_km    = 50.0;
  double                   similarity_threshold = 0.75;
  scoring::ScoringSettings scoring              = scoring::ScoringSettings::MatcherDefaults();

  static MatcherSettings FromConfig(const seawatch::runtime::config::MatcherConfig& config);
};

// NoCandidate -> Searching -> {Matched, NoMatch}
enum class FinderState {
  kNoCandidate,
  kSearching,
  kMatched,
  kNoMatch,
};

const char* ToString(FinderState state);

struct MatchResult {
  FinderState state   = FinderState::kNoCandidate;
  bool        matched = false;

  std::optional<std::string> canonical_id;
  std::optional<std::string> candidate_id;
  double                     score = 0.0;
  // override rule that forced the match, if any
  std::string rule;
  // why the record could not be searched (missing_date, invalid_coordinates)
  std::optional<std::string> reason;
};

/*
  Ingest-time matcher: finds the canonical incident an incoming record
  belongs to.

  "No match" is a normal result. Only store failures throw
  (util::StoreUnavailable).
*/
class CandidateFinder {
 public:
  CandidateFinder(std::shared_ptr<db::IncidentStore> store, MatcherSettings settings = {});

  MatchResult FindMatch(const db::model::RawRecord& record);

 private:
  MatchSignals Signals(const db::model::RawRecord& record, const db::model::RawRecord& candidate,
                       const scoring::SimilarityScore& score) const;

  std::shared_ptr<db::IncidentStore> store_;
  MatcherSettings                    settings_;
  scoring::CompositeScorer           scorer_;
};

} // namespace seawatch::matching
