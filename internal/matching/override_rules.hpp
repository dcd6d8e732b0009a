#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/raw_record.hpp"

namespace seawatch::matching {

/*
  Signals the override rules look at, all in [0,1] except the flags.
*/
struct MatchSignals {
  double time          = 0.0;
  double spatial       = 0.0;
  double vessel_name   = 0.0;
  double incident_type = 0.0;

  // one location name contains the other
  bool location_overlap = false;
  // both descriptions mention the same kind of stolen equipment
  bool shared_stolen_item = false;
};

struct OverrideDecision {
  enum class Kind {
    kNoOverride,
    kForcedMatch,
    kForcedNonMatch,
  };

  Kind        kind = Kind::kNoOverride;
  std::string rule;

  static OverrideDecision NoOverride() {
    return {};
  }
  static OverrideDecision ForcedMatch(std::string rule) {
    return {Kind::kForcedMatch, std::move(rule)};
  }
  static OverrideDecision ForcedNonMatch(std::string rule) {
    return {Kind::kForcedNonMatch, std::move(rule)};
  }
};

struct OverrideRule {
  std::string                              name;
  OverrideDecision::Kind                   effect;
  std::function<bool(const MatchSignals&)> applies;
};

/*
  Rules in evaluation order. Every rule is evaluated and the last rule
  that fires decides, so the safeguard at the end vetoes any forced
  match before it.

    time_space_vessel        time > 0.75, spatial > 0.9, vessel >= 0.7
    strong_vessel            vessel > 0.8, time > 0.5, spatial > 0.7
    near_identical_time_space time > 0.95, spatial > 0.95
    incident_type_category   type >= 0.8, time > 0.6, spatial > 0.7
    near_identical_position  spatial > 0.95, time > 0.6
    location_name            location overlap, time > 0.7, spatial > 0.6
    stolen_items             shared stolen item, time > 0.5, spatial > 0.5
    reused_vessel_name       vessel > 0.8, time < 0.2, spatial < 0.3  (non-match)
*/
const std::vector<OverrideRule>& DefaultOverrideRules();

OverrideDecision EvaluateOverrides(const MatchSignals& signals, const std::vector<OverrideRule>& rules = DefaultOverrideRules());

// Case-insensitive containment either way; empty names never overlap.
bool LocationsOverlap(std::string_view location1, std::string_view location2);

// air compressor, breathing apparatus, padlock(s), engine spares
bool ShareStolenItem(std::string_view description1, std::string_view description2);

} // namespace seawatch::matching
