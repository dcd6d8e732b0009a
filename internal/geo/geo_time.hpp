#pragma once

#include <optional>
#include <string_view>

#include "internal/db/api/incident_store.hpp"
#include "internal/util/time.hpp"

namespace seawatch::geo {

/*
  GeoTime metrics.

  Total functions: invalid input yields +infinity (distances, deltas) or
  0 (proximities), never an exception.
*/

inline constexpr double kEarthRadiusKm = 6371.0;
inline constexpr double kKmPerDegree   = 111.32;

// Finite, in range, and not the (0,0) "unknown position" sentinel.
bool IsValidCoordinate(double lat, double lon);
bool IsValidCoordinate(const std::optional<double>& lat, const std::optional<double>& lon);

// Haversine great-circle distance.
double DistanceKm(double lat1, double lon1, double lat2, double lon2);
double DistanceKm(const std::optional<double>& lat1, const std::optional<double>& lon1, const std::optional<double>& lat2,
                  const std::optional<double>& lon2);

double TimeDeltaHours(util::TimePoint t1, util::TimePoint t2);
double TimeDeltaHours(const std::optional<util::TimePoint>& t1, const std::optional<util::TimePoint>& t2);
// RFC 3339 text; unparsable input is +infinity
double TimeDeltaHours(std::string_view t1, std::string_view t2);

double TimeProximity(const std::optional<util::TimePoint>& t1, const std::optional<util::TimePoint>& t2, double max_hours);

double SpatialProximity(const std::optional<double>& lat1, const std::optional<double>& lon1, const std::optional<double>& lat2,
                        const std::optional<double>& lon2, double max_km);

/*
  Box of +-km around a point, longitude span widened by 1/cos(lat).
  Latitude is clamped to [-90,90]. Longitudes are not wrapped across
  the antimeridian; near the poles the box covers every longitude.
*/
db::BoundingBox BoundingBoxAround(double lat, double lon, double km);

} // namespace seawatch::geo
