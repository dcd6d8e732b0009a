#include "candidate_finder.hpp"

#include <chrono>

#include "internal/geo/geo_time.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace seawatch::matching {

using observability::DoubleField;
using observability::StringField;

namespace {

MatchResult NoMatch(std::optional<std::string> reason = std::nullopt) {
  MatchResult result;
  result.state  = FinderState::kNoMatch;
  result.reason = std::move(reason);
  return result;
}

} // namespace

const char* ToString(FinderState state) {
  switch (state) {
    case FinderState::kNoCandidate:
      return "no_candidate";
    case FinderState::kSearching:
      return "searching";
    case FinderState::kMatched:
      return "matched";
    case FinderState::kNoMatch:
      return "no_match";
  }
  return "no_candidate";
}

MatcherSettings MatcherSettings::FromConfig(const seawatch::runtime::config::MatcherConfig& config) {
  MatcherSettings settings;
  if (config.time_window_hours() > 0.0) settings.time_window_hours = config.time_window_hours();
  if (config.spatial_window_km() > 0.0) settings.spatial_window_km = config.spatial_window_km();
  if (config.similarity_threshold() > 0.0) settings.similarity_threshold = config.similarity_threshold();

  // proximity decays over the same windows the store query uses
  auto base            = scoring::ScoringSettings::MatcherDefaults();
  base.max_time_hours  = settings.time_window_hours;
  base.max_distance_km = settings.spatial_window_km;
  settings.scoring     = scoring::ScoringSettings::FromConfig(config.scoring(), base);
  return settings;
}

CandidateFinder::CandidateFinder(std::shared_ptr<db::IncidentStore> store, MatcherSettings settings)
    : store_(std::move(store)), settings_(settings), scorer_(settings.scoring) {
}

MatchSignals CandidateFinder::Signals(const db::model::RawRecord& record, const db::model::RawRecord& candidate,
                                      const scoring::SimilarityScore& score) const {
  MatchSignals signals;
  signals.time               = score.time;
  signals.spatial            = score.spatial;
  signals.vessel_name        = score.vessel_name;
  signals.incident_type      = score.incident_type;
  signals.location_overlap   = LocationsOverlap(record.location, candidate.location);
  signals.shared_stolen_item = ShareStolenItem(record.description, candidate.description);
  return signals;
}

MatchResult CandidateFinder::FindMatch(const db::model::RawRecord& record) {
  observability::SpanScope span("seawatch.matcher.find_match");
  span.SetAttribute("record_id", record.id);

  if (!record.occurred_at) {
    SEAWATCH_LOG_INFO("record not matchable", {StringField("record_id", record.id), StringField("reason", scoring::kReasonMissingDate)});
    observability::Metrics::Instance().RecordMatchOutcome(false);
    return NoMatch(scoring::kReasonMissingDate);
  }
  if (!geo::IsValidCoordinate(record.latitude, record.longitude)) {
    SEAWATCH_LOG_INFO("record not matchable",
                      {StringField("record_id", record.id), StringField("reason", scoring::kReasonInvalidCoordinates)});
    observability::Metrics::Instance().RecordMatchOutcome(false);
    return NoMatch(scoring::kReasonInvalidCoordinates);
  }

  FinderState state = FinderState::kSearching;

  const auto      window_hours = std::chrono::duration_cast<util::Clock::duration>(std::chrono::duration<double, std::ratio<3600>>(settings_.time_window_hours));
  db::TimeWindow  window{*record.occurred_at - window_hours, *record.occurred_at + window_hours};
  db::BoundingBox box = geo::BoundingBoxAround(*record.latitude, *record.longitude, settings_.spatial_window_km);

  std::vector<db::model::RawRecord> candidates;
  {
    auto tx    = store_->Begin();
    candidates = store_->QueryCandidates(*tx, window, box);
    tx->Commit();
  }

  SEAWATCH_LOG_DEBUG("candidate window loaded",
                     {StringField("record_id", record.id), StringField("state", ToString(state)),
                      observability::IntField("candidates", static_cast<int64_t>(candidates.size())),
                      DoubleField("min_lat", box.min_lat), DoubleField("max_lat", box.max_lat), DoubleField("min_lon", box.min_lon),
                      DoubleField("max_lon", box.max_lon)});

  const db::model::RawRecord* best = nullptr;
  double                      best_score = -1.0;
  std::string                 best_rule;

  for (const auto& candidate : candidates) {
    if (candidate.id == record.id || !candidate.canonical_incident_id) continue;

    const auto score = scorer_.Score(record, candidate);
    if (score.reason) {
      SEAWATCH_LOG_DEBUG("candidate skipped", {StringField("candidate_id", candidate.id), StringField("reason", *score.reason)});
      continue;
    }

    const auto decision = EvaluateOverrides(Signals(record, candidate, score));
    if (decision.kind == OverrideDecision::Kind::kForcedNonMatch) {
      SEAWATCH_LOG_INFO("override rule vetoed candidate", {StringField("record_id", record.id), StringField("candidate_id", candidate.id),
                                                           StringField("rule", decision.rule)});
      continue;
    }

    const bool forced = decision.kind == OverrideDecision::Kind::kForcedMatch;
    if (!forced && score.total < settings_.similarity_threshold) continue;

    // candidates arrive ordered by id, so strict > keeps the lowest id on ties
    if (score.total > best_score || (score.total == best_score && best && candidate.id < best->id)) {
      best       = &candidate;
      best_score = score.total;
      best_rule  = forced ? decision.rule : std::string();
    }
  }

  if (!best) {
    state = FinderState::kNoMatch;
    SEAWATCH_LOG_INFO("no matching incident", {StringField("record_id", record.id), StringField("state", ToString(state))});
    observability::Metrics::Instance().RecordMatchOutcome(false);
    return NoMatch();
  }

  state = FinderState::kMatched;
  MatchResult result;
  result.state        = state;
  result.matched      = true;
  result.canonical_id = best->canonical_incident_id;
  result.candidate_id = best->id;
  result.score        = best_score;
  result.rule         = best_rule;

  SEAWATCH_LOG_INFO("matched existing incident", {StringField("record_id", record.id), StringField("candidate_id", best->id),
                                                  StringField("incident_id", *best->canonical_incident_id),
                                                  DoubleField("score", best_score), StringField("rule", best_rule)});
  span.SetAttribute("incident_id", *best->canonical_incident_id);
  observability::Metrics::Instance().RecordMatchOutcome(true);
  return result;
}

} // namespace seawatch::matching
