#include "record_quality.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

#include "internal/geo/geo_time.hpp"

namespace seawatch::ranking {

namespace {

constexpr std::size_t kLongDescriptionChars = 100;

bool Present(const std::string& value) {
  return value.find_first_not_of(" \t\r\n") != std::string::npos;
}

} // namespace

int Completeness(const db::model::RawRecord& r) {
  int score = 0;

  if (Present(r.title)) score += 1;
  if (r.description.size() > kLongDescriptionChars) {
    score += 3;
  } else if (Present(r.description)) {
    score += 1;
  }
  if (geo::IsValidCoordinate(r.latitude, r.longitude)) score += 2;
  if (r.occurred_at) score += 1;
  if (Present(r.region)) score += 1;
  if (Present(r.location)) score += 1;

  if (Present(r.vessel_name)) score += 1;
  if (Present(r.vessel_type)) score += 1;
  if (Present(r.vessel_flag)) score += 1;
  if (Present(r.vessel_imo)) score += 2;
  if (Present(r.vessel_status)) score += 1;

  if (Present(r.incident_type_name)) score += 1;
  if (Present(r.reference_id)) score += 1;
  if (Present(r.update_text)) score += 2;
  if (Present(r.raw_json)) score += 1;

  return score;
}

int SourcePriority(std::string_view source) {
  static const std::unordered_map<std::string, int> kPriorities = {
      {"RECAAP", 5}, // ReCAAP ISC, verified through regional focal points
      {"UKMTO", 4},
      {"MDAT", 3},
      {"ICC", 3},
      {"CWD", 2},
  };

  if (source.empty()) return 0;

  std::string key(source);
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  auto it = kPriorities.find(key);
  return it == kPriorities.end() ? 1 : it->second;
}

double QualityScore(const db::model::RawRecord& record) {
  return 0.7 * Completeness(record) + 0.3 * SourcePriority(record.source);
}

PrimarySelection DeterminePrimary(const db::model::RawRecord& r1, const db::model::RawRecord& r2) {
  if (QualityScore(r2) > QualityScore(r1)) {
    return {&r2, &r1};
  }
  return {&r1, &r2};
}

} // namespace seawatch::ranking
