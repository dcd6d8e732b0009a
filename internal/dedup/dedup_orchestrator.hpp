#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "dedup_summary.hpp"
#include "internal/db/api/incident_store.hpp"
#include "internal/scoring/composite_scorer.hpp"
#include "internal/util/time.hpp"

namespace seawatch::reference {
class VesselResolver;
}

namespace seawatch::dedup {

struct DedupSettings {
  int                      lookback_days             = 30;
  std::size_t              max_records               = 500;
  double                   confidence_threshold      = 0.7;
  // reporting label only, same code path as medium matches
  double                   high_confidence_threshold = 0.8;
  scoring::ScoringSettings scoring                   = scoring::ScoringSettings::BatchDefaults();

  static DedupSettings FromConfig(const seawatch::runtime::config::DedupConfig& config);
};

/*
  DedupOrchestrator

  One scheduled pass over recent records: scores every cross-source pair,
  and merges matches pairwise. Each record takes part in at most one merge
  per pass. Every merge is a single transaction whose secondary write is
  conditional on the secondary still being unmerged, so concurrent passes
  cannot both merge the same record.

  A failed window query aborts the pass (throws). Per-pair failures are
  counted in merge_errors.
*/
class DedupOrchestrator {
 public:
  DedupOrchestrator(std::shared_ptr<db::IncidentStore> store, DedupSettings settings = {});

  DedupSummary RunDeduplicationPass();
  DedupSummary RunDeduplicationPass(util::TimePoint now);

  // Logs and returns stored records that break the one-level merge rule.
  // Nothing is repaired.
  std::vector<db::MergeIntegrityViolation> CheckMergeIntegrity();

  const DedupSettings& Settings() const {
    return settings_;
  }

 private:
  enum class MergeOutcome {
    kSucceeded,
    kConflict,
    kFailed,
  };

  MergeOutcome Merge(const db::model::RawRecord& primary, const db::model::RawRecord& secondary, util::TimePoint now,
                     reference::VesselResolver& resolver);

  std::shared_ptr<db::IncidentStore> store_;
  DedupSettings                      settings_;
  scoring::CompositeScorer           scorer_;
};

} // namespace seawatch::dedup
