#include "composite_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "internal/geo/geo_time.hpp"
#include "internal/observability/logging.hpp"
#include "internal/similarity/identity.hpp"

namespace seawatch::scoring {

namespace {

bool LacksVesselName(const db::model::RawRecord& r) {
  return r.vessel_name.find_first_not_of(" \t\r\n") == std::string::npos;
}

SimilarityScore Rejected(SimilarityScore score, const char* reason) {
  score.total  = 0.0;
  score.reason = reason;
  return score;
}

constexpr double kWeightSumTolerance = 1e-6;

double OrDefault(double value, double fallback) {
  return value > 0.0 ? value : fallback;
}

} // namespace

ScoringSettings ScoringSettings::BatchDefaults() {
  return ScoringSettings{};
}

ScoringSettings ScoringSettings::MatcherDefaults() {
  ScoringSettings settings;
  settings.weights.vessel        = 0.15;
  settings.weights.incident_type = 0.05;
  return settings;
}

ScoringSettings ScoringSettings::FromConfig(const seawatch::runtime::config::ScoringConfig& config, const ScoringSettings& base) {
  ScoringSettings settings      = base;
  settings.max_time_hours       = OrDefault(config.max_time_hours(), base.max_time_hours);
  settings.max_distance_km      = OrDefault(config.max_distance_km(), base.max_distance_km);
  settings.missing_vessel_score = OrDefault(config.missing_vessel_score(), base.missing_vessel_score);

  if (config.has_weights()) {
    const auto& w = config.weights();
    // a weights block replaces the whole set and must be a convex combination
    if (w.time() != 0.0 || w.spatial() != 0.0 || w.vessel() != 0.0 || w.incident_type() != 0.0) {
      if (w.time() < 0.0 || w.spatial() < 0.0 || w.vessel() < 0.0 || w.incident_type() < 0.0) {
        throw std::runtime_error("Invalid configuration: scoring weights must not be negative");
      }
      const double sum = w.time() + w.spatial() + w.vessel() + w.incident_type();
      if (std::abs(sum - 1.0) > kWeightSumTolerance) {
        throw std::runtime_error("Invalid configuration: scoring weights must sum to 1, got " + std::to_string(sum));
      }
      settings.weights = {w.time(), w.spatial(), w.vessel(), w.incident_type()};
    }
  }
  return settings;
}

CompositeScorer::CompositeScorer(ScoringSettings settings) : settings_(settings) {
}

SimilarityScore CompositeScorer::Score(const db::model::RawRecord& r1, const db::model::RawRecord& r2) const {
  SimilarityScore score;

  if (!r1.occurred_at || !r2.occurred_at) {
    return Rejected(score, kReasonMissingDate);
  }
  if (!geo::IsValidCoordinate(r1.latitude, r1.longitude) || !geo::IsValidCoordinate(r2.latitude, r2.longitude)) {
    return Rejected(score, kReasonInvalidCoordinates);
  }

  score.time_delta_hours = geo::TimeDeltaHours(r1.occurred_at, r2.occurred_at);
  score.time             = geo::TimeProximity(r1.occurred_at, r2.occurred_at, settings_.max_time_hours);
  if (score.time == 0.0) {
    return Rejected(score, kReasonTimeOutOfWindow);
  }

  score.distance_km = geo::DistanceKm(r1.latitude, r1.longitude, r2.latitude, r2.longitude);
  score.spatial     = geo::SpatialProximity(r1.latitude, r1.longitude, r2.latitude, r2.longitude, settings_.max_distance_km);
  if (score.spatial == 0.0) {
    return Rejected(score, kReasonDistanceOutOfWindow);
  }

  score.vessel_imo  = similarity::ImoSimilarity(r1.vessel_imo, r2.vessel_imo);
  score.vessel_name = similarity::VesselNameSimilarity(r1.vessel_name, r2.vessel_name);
  if (score.vessel_imo == 1.0) {
    score.vessel = 1.0;
  } else if (LacksVesselName(r1) && LacksVesselName(r2)) {
    score.vessel = settings_.missing_vessel_score;
  } else {
    score.vessel = score.vessel_name;
  }

  score.incident_type = similarity::IncidentTypeSimilarity(r1.incident_type_name, r2.incident_type_name);

  const auto& w = settings_.weights;
  score.total   = w.time * score.time + w.spatial * score.spatial + w.vessel * score.vessel + w.incident_type * score.incident_type;
  score.total   = std::clamp(score.total, 0.0, 1.0);

  SEAWATCH_LOG_DEBUG("pair scored", {observability::StringField("record1", r1.id), observability::StringField("record2", r2.id),
                                     observability::DoubleField("total", score.total), observability::DoubleField("time", score.time),
                                     observability::DoubleField("spatial", score.spatial),
                                     observability::DoubleField("vessel", score.vessel),
                                     observability::DoubleField("incident_type", score.incident_type)});
  return score;
}

} // namespace seawatch::scoring
