#include "geo_time.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace seawatch::geo {

namespace {

constexpr double kInfinity  = std::numeric_limits<double>::infinity();
constexpr double kPi        = 3.14159265358979323846;
constexpr double kDegToRad  = kPi / 180.0;
constexpr double kPolarCosEpsilon = 1e-9;

double Proximity(double value, double max_value) {
  if (!(max_value > 0.0) || !std::isfinite(value)) {
    return 0.0;
  }
  return std::max(0.0, 1.0 - value / max_value);
}

} // namespace

bool IsValidCoordinate(double lat, double lon) {
  if (!std::isfinite(lat) || !std::isfinite(lon)) return false;
  if (lat < -90.0 || lat > 90.0) return false;
  if (lon < -180.0 || lon > 180.0) return false;
  return !(lat == 0.0 && lon == 0.0);
}

bool IsValidCoordinate(const std::optional<double>& lat, const std::optional<double>& lon) {
  return lat && lon && IsValidCoordinate(*lat, *lon);
}

double DistanceKm(double lat1, double lon1, double lat2, double lon2) {
  if (!IsValidCoordinate(lat1, lon1) || !IsValidCoordinate(lat2, lon2)) {
    return kInfinity;
  }

  const double dlat = (lat2 - lat1) * kDegToRad;
  const double dlon = (lon2 - lon1) * kDegToRad;
  const double a    = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1 * kDegToRad) * std::cos(lat2 * kDegToRad) * std::sin(dlon / 2) * std::sin(dlon / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusKm * c;
}

double DistanceKm(const std::optional<double>& lat1, const std::optional<double>& lon1, const std::optional<double>& lat2,
                  const std::optional<double>& lon2) {
  if (!lat1 || !lon1 || !lat2 || !lon2) {
    return kInfinity;
  }
  return DistanceKm(*lat1, *lon1, *lat2, *lon2);
}

double TimeDeltaHours(util::TimePoint t1, util::TimePoint t2) {
  const auto delta = t1 > t2 ? t1 - t2 : t2 - t1;
  return std::chrono::duration<double, std::ratio<3600>>(delta).count();
}

double TimeDeltaHours(const std::optional<util::TimePoint>& t1, const std::optional<util::TimePoint>& t2) {
  if (!t1 || !t2) {
    return kInfinity;
  }
  return TimeDeltaHours(*t1, *t2);
}

double TimeDeltaHours(std::string_view t1, std::string_view t2) {
  return TimeDeltaHours(util::ParseTimestamp(t1), util::ParseTimestamp(t2));
}

double TimeProximity(const std::optional<util::TimePoint>& t1, const std::optional<util::TimePoint>& t2, double max_hours) {
  return Proximity(TimeDeltaHours(t1, t2), max_hours);
}

double SpatialProximity(const std::optional<double>& lat1, const std::optional<double>& lon1, const std::optional<double>& lat2,
                        const std::optional<double>& lon2, double max_km) {
  return Proximity(DistanceKm(lat1, lon1, lat2, lon2), max_km);
}

db::BoundingBox BoundingBoxAround(double lat, double lon, double km) {
  const double dlat = km / kKmPerDegree;
  const double cos_lat = std::cos(lat * kDegToRad);

  db::BoundingBox box;
  box.min_lat = std::max(-90.0, lat - dlat);
  box.max_lat = std::min(90.0, lat + dlat);

  if (std::abs(cos_lat) < kPolarCosEpsilon) {
    box.min_lon = -180.0;
    box.max_lon = 180.0;
    return box;
  }

  const double dlon = km / (kKmPerDegree * std::abs(cos_lat));
  box.min_lon       = std::max(-180.0, lon - dlon);
  box.max_lon       = std::min(180.0, lon + dlon);
  return box;
}

} // namespace seawatch::geo
