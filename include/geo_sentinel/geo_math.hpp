// === Geodesy Helpers =========================================================
//
// Spherical-earth helpers shared by the containment tracker, the demo
// simulator and the tests. Distances use the haversine formula on a sphere
// of mean Earth radius, which is accurate to well under a metre at geofence
// scales.

#pragma once

#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

/** @brief Mean Earth radius used for every great-circle computation. */
inline constexpr double k_earth_radius_m{6'371'000.0};

/**
 * @brief Determine the great-circle distance separating two coordinates.
 */
[[nodiscard]] double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Compute the coordinate reached by travelling @p distance_m along
 *        @p bearing_deg from @p origin.
 */
[[nodiscard]] GeodeticCoordinate offset_coordinate(const GeodeticCoordinate& origin, double bearing_deg, double distance_m);

/**
 * @brief True when both components are finite and inside [-90, 90] / [-180, 180].
 */
[[nodiscard]] bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept;

}  // namespace geo_sentinel
