// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the engine (time primitives, geodetic coordinates, geofence/alert tags and
// the device/alert records exchanged with collaborators).

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace geo_sentinel {

/**
 * @brief Wall clock used for ping timestamps, receipt times and alert creation.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = WallClock::time_point;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Last reported position of a device together with its fix quality.
 */
struct PositionFix final {
    GeodeticCoordinate coordinate{}; /**< Reported location. */
    double accuracy_m{};             /**< Horizontal accuracy radius in metres. */
    TimePoint timestamp{};           /**< Device-side timestamp of the fix. */
};

/**
 * @brief Enumerates the categories a geofence may be tagged with.
 */
enum class GeofenceKind {
    Garage,      /**< Parking or storage location. */
    HotZone,     /**< Area of elevated interest. */
    SafeZone,    /**< Area the device is expected to remain inside. */
    Restricted,  /**< Area the device must not enter. */
    Custom       /**< Any operator-defined tag outside the known set. */
};

/**
 * @brief Enumerates the alert categories raised by the engine.
 */
enum class AlertKind {
    GeofenceEnter,
    GeofenceExit,
    DeviceOffline,
    LowBattery
};

/** @brief Canonical lowercase tag for a geofence kind. */
[[nodiscard]] std::string_view to_string(GeofenceKind kind) noexcept;
/** @brief Canonical lowercase tag for an alert kind. */
[[nodiscard]] std::string_view to_string(AlertKind kind) noexcept;

/**
 * @brief Parse a free-form geofence tag. Matching ignores case and treats
 *        spaces and dashes as underscores; unknown tags map to Custom.
 */
[[nodiscard]] GeofenceKind parse_geofence_kind(std::string_view raw_kind);

/** @brief Parse an alert tag; returns nullopt for unknown tags. */
[[nodiscard]] std::optional<AlertKind> parse_alert_kind(std::string_view raw_kind);

/**
 * @brief A named circular region used as a containment boundary.
 */
struct Geofence final {
    std::string id{};                       /**< Stable identifier. */
    std::string name{};                     /**< Human-readable label. */
    GeofenceKind kind{GeofenceKind::Custom};
    GeodeticCoordinate center{};
    double radius_m{};                      /**< Boundary radius in metres (> 0). */
    bool active{true};                      /**< Inactive geofences are skipped during evaluation. */
};

using GeofenceList = std::vector<Geofence>;

/** @brief Set of device identifiers, e.g. the devices an account owns. */
using DeviceIdSet = std::unordered_set<std::string>;

/**
 * @brief Authoritative live record for a tracked device.
 */
struct Device final {
    std::string device_id{};
    std::optional<std::string> owner_id{};   /**< Owning account, resolved by the identity layer. */
    std::string device_type{};
    std::optional<PositionFix> last_position{};
    double battery_percent{100.0};
    bool is_online{false};
    TimePoint last_seen{};                   /**< Engine receipt time of the latest accepted ping. */
};

/**
 * @brief Raw location report submitted by a device.
 */
struct LocationPing final {
    std::string device_id{};
    double latitude_deg{};
    double longitude_deg{};
    double accuracy_m{};
    double battery_percent{};
    TimePoint timestamp{};
};

/**
 * @brief Alert record created by the dispatcher and handed to persistence.
 */
struct Alert final {
    std::string id{};
    std::string device_id{};
    std::optional<std::string> geofence_id{};
    AlertKind kind{AlertKind::GeofenceEnter};
    std::string message{};
    TimePoint created_at{};
    TimePoint source_timestamp{};  /**< Timestamp of the ping or sweep that produced the alert. */
    bool is_read{false};
};

}  // namespace geo_sentinel
