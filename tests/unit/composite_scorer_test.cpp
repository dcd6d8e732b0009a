#include "internal/scoring/composite_scorer.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using seawatch::db::model::RawRecord;
using seawatch::scoring::CompositeScorer;
using seawatch::scoring::ScoringSettings;

const auto kBase = seawatch::util::ParseTimestamp("2024-03-01T12:00:00Z").value();

bool Near(double a, double b) {
  return std::abs(a - b) < 1e-9;
}

RawRecord MakeRecord(const std::string& id, const std::string& source, double lat, double lon, int hours_offset = 0) {
  RawRecord r;
  r.id          = id;
  r.source      = source;
  r.occurred_at = kBase + std::chrono::hours(hours_offset);
  r.latitude    = lat;
  r.longitude   = lon;
  return r;
}

void TestIdenticalPositionWithoutVessels() {
  CompositeScorer scorer;
  auto            a = MakeRecord("a", "UKMTO", 12.5, 43.3);
  auto            b = MakeRecord("b", "MDAT", 12.5, 43.3);

  auto score = scorer.Score(a, b);
  assert(!score.reason);
  assert(Near(score.time, 1.0));
  assert(Near(score.spatial, 1.0));
  assert(Near(score.vessel, 0.7));
  assert(Near(score.incident_type, 0.0));
  assert(Near(score.total, 0.4 + 0.4 + 0.1 * 0.7));
}

void TestImoMatchOverridesName() {
  CompositeScorer scorer;
  auto            a = MakeRecord("a", "UKMTO", 12.5, 43.3);
  auto            b = MakeRecord("b", "MDAT", 12.5, 43.3);
  a.vessel_name     = "OCEAN STAR";
  b.vessel_name     = "PACIFIC DAWN";
  a.vessel_imo      = "9123456";
  b.vessel_imo      = " 9123456";

  auto score = scorer.Score(a, b);
  assert(Near(score.vessel_imo, 1.0));
  assert(score.vessel_name < 0.5);
  assert(Near(score.vessel, 1.0));
}

void TestOneSidedVesselNameScoresZero() {
  CompositeScorer scorer;
  auto            a = MakeRecord("a", "UKMTO", 12.5, 43.3);
  auto            b = MakeRecord("b", "MDAT", 12.5, 43.3);
  a.vessel_name     = "OCEAN STAR";

  auto score = scorer.Score(a, b);
  assert(Near(score.vessel, 0.0));
  assert(Near(score.total, 0.8));
}

void TestShortCircuits() {
  CompositeScorer scorer;

  auto undated        = MakeRecord("a", "UKMTO", 12.5, 43.3);
  undated.occurred_at = std::nullopt;
  auto score          = scorer.Score(undated, MakeRecord("b", "MDAT", 12.5, 43.3));
  assert(score.reason && *score.reason == seawatch::scoring::kReasonMissingDate);
  assert(Near(score.total, 0.0));

  score = scorer.Score(MakeRecord("a", "UKMTO", 0.0, 0.0), MakeRecord("b", "MDAT", 12.5, 43.3));
  assert(score.reason && *score.reason == seawatch::scoring::kReasonInvalidCoordinates);

  score = scorer.Score(MakeRecord("a", "UKMTO", 12.5, 43.3), MakeRecord("b", "MDAT", 12.5, 43.3, 60));
  assert(score.reason && *score.reason == seawatch::scoring::kReasonTimeOutOfWindow);
  assert(Near(score.total, 0.0));

  // roughly 111 km north
  score = scorer.Score(MakeRecord("a", "UKMTO", 12.5, 43.3), MakeRecord("b", "MDAT", 13.5, 43.3));
  assert(score.reason && *score.reason == seawatch::scoring::kReasonDistanceOutOfWindow);
  assert(score.distance_km > 100.0);
}

void TestScoreIsSymmetricAndBounded() {
  CompositeScorer scorer;
  auto            a    = MakeRecord("a", "UKMTO", 12.50, 43.30);
  auto            b    = MakeRecord("b", "MDAT", 12.55, 43.35, 5);
  a.vessel_name        = "NORDIC ACE";
  b.vessel_name        = "NORDIC ACES";
  a.incident_type_name = "Robbery";
  b.incident_type_name = "Theft";

  auto ab = scorer.Score(a, b);
  auto ba = scorer.Score(b, a);
  assert(Near(ab.total, ba.total));
  assert(ab.total > 0.0 && ab.total <= 1.0);
  assert(Near(ab.incident_type, 0.8));
}

void TestSettingsFromConfig() {
  const auto matcher = ScoringSettings::MatcherDefaults();
  assert(Near(matcher.weights.vessel, 0.15));
  assert(Near(matcher.weights.incident_type, 0.05));

  seawatch::runtime::config::ScoringConfig empty;
  const auto kept = ScoringSettings::FromConfig(empty, matcher);
  assert(Near(kept.max_time_hours, 48.0));
  assert(Near(kept.weights.vessel, 0.15));

  seawatch::runtime::config::ScoringConfig config;
  config.set_max_distance_km(25.0);
  config.mutable_weights()->set_time(0.5);
  config.mutable_weights()->set_spatial(0.5);
  const auto custom = ScoringSettings::FromConfig(config, matcher);
  assert(Near(custom.max_distance_km, 25.0));
  assert(Near(custom.max_time_hours, 48.0));
  // a weights block replaces the whole set
  assert(Near(custom.weights.time, 0.5));
  assert(Near(custom.weights.vessel, 0.0));
}

bool RejectsWeights(double time, double spatial, double vessel, double incident_type) {
  seawatch::runtime::config::ScoringConfig config;
  config.mutable_weights()->set_time(time);
  config.mutable_weights()->set_spatial(spatial);
  config.mutable_weights()->set_vessel(vessel);
  config.mutable_weights()->set_incident_type(incident_type);
  try {
    (void)ScoringSettings::FromConfig(config, ScoringSettings::BatchDefaults());
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find("Invalid configuration") != std::string::npos;
  }
  return false;
}

void TestWeightsMustFormConvexCombination() {
  assert(RejectsWeights(0.5, 0.5, 0.5, 0.0));
  assert(RejectsWeights(0.2, 0.2, 0.1, 0.1));
  assert(RejectsWeights(0.8, 0.4, -0.2, 0.0));
  assert(!RejectsWeights(0.3, 0.3, 0.2, 0.2));
  assert(!RejectsWeights(0.4, 0.4, 0.1, 0.1));
}

} // namespace

int main() {
  TestIdenticalPositionWithoutVessels();
  TestImoMatchOverridesName();
  TestOneSidedVesselNameScoresZero();
  TestShortCircuits();
  TestScoreIsSymmetricAndBounded();
  TestSettingsFromConfig();
  TestWeightsMustFormConvexCombination();

  std::cout << "seawatch_unit_composite_scorer: pass\n";
  return 0;
}
