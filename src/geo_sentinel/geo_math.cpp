#include "geo_sentinel/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace geo_sentinel {

namespace {

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

}  // namespace

double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    // Rounding can push a a hair past 1 for antipodal points.
    const double clamped_a = std::clamp(a, 0.0, 1.0);
    const double c = 2.0 * std::atan2(std::sqrt(clamped_a), std::sqrt(1.0 - clamped_a));
    return k_earth_radius_m * c;
}

GeodeticCoordinate offset_coordinate(const GeodeticCoordinate& origin, double bearing_deg, double distance_m) {
    const double angular_distance = distance_m / k_earth_radius_m;
    const double bearing_rad = degrees_to_radians(bearing_deg);
    const double lat_rad = degrees_to_radians(origin.latitude_deg);
    const double lon_rad = degrees_to_radians(origin.longitude_deg);

    const double new_lat = std::asin(
        std::sin(lat_rad) * std::cos(angular_distance) + std::cos(lat_rad) * std::sin(angular_distance) * std::cos(bearing_rad)
    );

    const double new_lon = lon_rad
        + std::atan2(
            std::sin(bearing_rad) * std::sin(angular_distance) * std::cos(lat_rad),
            std::cos(angular_distance) - std::sin(lat_rad) * std::sin(new_lat)
        );

    const double wrapped_lon_deg = std::remainder(radians_to_degrees(new_lon), 360.0);
    return GeodeticCoordinate{radians_to_degrees(new_lat), wrapped_lon_deg};
}

bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept {
    if (!std::isfinite(coordinate.latitude_deg) || !std::isfinite(coordinate.longitude_deg)) {
        return false;
    }
    return coordinate.latitude_deg >= -90.0 && coordinate.latitude_deg <= 90.0
        && coordinate.longitude_deg >= -180.0 && coordinate.longitude_deg <= 180.0;
}

}  // namespace geo_sentinel
