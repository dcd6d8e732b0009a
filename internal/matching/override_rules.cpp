#include "override_rules.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace seawatch::matching {

namespace {

using Kind = OverrideDecision::Kind;

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Trimmed(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(first, last - first + 1));
}

const std::vector<std::regex>& StolenItemPatterns() {
  static const std::vector<std::regex> kPatterns = {
      std::regex(R"(air\s*compressor)", std::regex::icase),
      std::regex(R"(breathing\s*apparatus)", std::regex::icase),
      std::regex(R"(padlocks?)", std::regex::icase),
      std::regex(R"(engine\s*spares)", std::regex::icase),
  };
  return kPatterns;
}

} // namespace

const std::vector<OverrideRule>& DefaultOverrideRules() {
  static const std::vector<OverrideRule> kRules = {
      {"time_space_vessel", Kind::kForcedMatch,
       [](const MatchSignals& s) { return s.time > 0.75 && s.spatial > 0.9 && s.vessel_name >= 0.7; }},
      {"strong_vessel", Kind::kForcedMatch, [](const MatchSignals& s) { return s.vessel_name > 0.8 && s.time > 0.5 && s.spatial > 0.7; }},
      {"near_identical_time_space", Kind::kForcedMatch, [](const MatchSignals& s) { return s.time > 0.95 && s.spatial > 0.95; }},
      {"incident_type_category", Kind::kForcedMatch,
       [](const MatchSignals& s) { return s.incident_type >= 0.8 && s.time > 0.6 && s.spatial > 0.7; }},
      {"near_identical_position", Kind::kForcedMatch, [](const MatchSignals& s) { return s.spatial > 0.95 && s.time > 0.6; }},
      {"location_name", Kind::kForcedMatch, [](const MatchSignals& s) { return s.location_overlap && s.time > 0.7 && s.spatial > 0.6; }},
      {"stolen_items", Kind::kForcedMatch, [](const MatchSignals& s) { return s.shared_stolen_item && s.time > 0.5 && s.spatial > 0.5; }},
      {"reused_vessel_name", Kind::kForcedNonMatch,
       [](const MatchSignals& s) { return s.vessel_name > 0.8 && s.time < 0.2 && s.spatial < 0.3; }},
  };
  return kRules;
}

OverrideDecision EvaluateOverrides(const MatchSignals& signals, const std::vector<OverrideRule>& rules) {
  OverrideDecision decision;
  for (const auto& rule : rules) {
    if (rule.applies(signals)) {
      decision = {rule.effect, rule.name};
    }
  }
  return decision;
}

bool LocationsOverlap(std::string_view location1, std::string_view location2) {
  const auto l1 = Lower(Trimmed(location1));
  const auto l2 = Lower(Trimmed(location2));
  if (l1.empty() || l2.empty()) return false;
  return l1.find(l2) != std::string::npos || l2.find(l1) != std::string::npos;
}

bool ShareStolenItem(std::string_view description1, std::string_view description2) {
  if (description1.empty() || description2.empty()) return false;

  const std::string d1(description1);
  const std::string d2(description2);
  for (const auto& pattern : StolenItemPatterns()) {
    if (std::regex_search(d1, pattern) && std::regex_search(d2, pattern)) {
      return true;
    }
  }
  return false;
}

} // namespace seawatch::matching
