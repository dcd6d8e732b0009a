#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/db/model/raw_record.hpp"

namespace seawatch::scoring {

struct ScoringWeights {
  double time          = 0.4;
  double spatial       = 0.4;
  double vessel        = 0.1;
  double incident_type = 0.1;
};

struct ScoringSettings {
  double         max_time_hours       = 48.0;
  double         max_distance_km      = 50.0;
  ScoringWeights weights;
  // vessel component when neither record names a vessel
  double missing_vessel_score = 0.7;

  // batch pipeline: time .4, spatial .4, vessel .1, type .1
  static ScoringSettings BatchDefaults();
  // ingest-time matcher: time .4, spatial .4, vessel .15, type .05
  static ScoringSettings MatcherDefaults();

  // Zero fields in config keep the values of base.
  static ScoringSettings FromConfig(const seawatch::runtime::config::ScoringConfig& config, const ScoringSettings& base);
};

// Short-circuit reasons
inline constexpr const char* kReasonMissingDate          = "missing_date";
inline constexpr const char* kReasonInvalidCoordinates   = "invalid_coordinates";
inline constexpr const char* kReasonTimeOutOfWindow      = "time_out_of_window";
inline constexpr const char* kReasonDistanceOutOfWindow  = "distance_out_of_window";

/*
  All components of a pair score. When reason is set the pair failed a
  precondition: total is 0 and components after the failing check were
  not computed (left at 0).
*/
struct SimilarityScore {
  double total         = 0.0;
  double time          = 0.0;
  double spatial       = 0.0;
  double vessel        = 0.0;
  double vessel_name   = 0.0;
  double vessel_imo    = 0.0;
  double incident_type = 0.0;

  double distance_km      = 0.0;
  double time_delta_hours = 0.0;

  std::optional<std::string> reason;
};

class CompositeScorer {
 public:
  explicit CompositeScorer(ScoringSettings settings = ScoringSettings::BatchDefaults());

  SimilarityScore Score(const db::model::RawRecord& r1, const db::model::RawRecord& r2) const;

  const ScoringSettings& Settings() const {
    return settings_;
  }

 private:
  ScoringSettings settings_;
};

} // namespace seawatch::scoring
