#include "geo_sentinel/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace geo_sentinel {

namespace {

constexpr std::array<std::pair<std::string_view, GeofenceKind>, 5> k_geofence_kind_tags{{
    {"garage", GeofenceKind::Garage},
    {"hot_zone", GeofenceKind::HotZone},
    {"safe_zone", GeofenceKind::SafeZone},
    {"restricted", GeofenceKind::Restricted},
    {"custom", GeofenceKind::Custom},
}};

constexpr std::array<std::pair<std::string_view, AlertKind>, 4> k_alert_kind_tags{{
    {"geofence_enter", AlertKind::GeofenceEnter},
    {"geofence_exit", AlertKind::GeofenceExit},
    {"device_offline", AlertKind::DeviceOffline},
    {"low_battery", AlertKind::LowBattery},
}};

/**
 * @brief Lowercase the tag and fold separators so "Hot Zone" matches "hot_zone".
 */
std::string normalize_tag(std::string_view raw_tag) {
    std::string normalized{};
    normalized.reserve(raw_tag.size());
    for (const char character : raw_tag) {
        if (character == ' ' || character == '-') {
            normalized.push_back('_');
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(character))));
    }
    return normalized;
}

}  // namespace

std::string_view to_string(GeofenceKind kind) noexcept {
    for (const auto& [tag, value] : k_geofence_kind_tags) {
        if (value == kind) {
            return tag;
        }
    }
    return "custom";
}

std::string_view to_string(AlertKind kind) noexcept {
    for (const auto& [tag, value] : k_alert_kind_tags) {
        if (value == kind) {
            return tag;
        }
    }
    return "unknown";
}

GeofenceKind parse_geofence_kind(std::string_view raw_kind) {
    const std::string normalized = normalize_tag(raw_kind);
    const auto iterator_tag = std::find_if(k_geofence_kind_tags.begin(), k_geofence_kind_tags.end(), [&normalized](const auto& entry) {
        return entry.first == normalized;
    });
    if (iterator_tag == k_geofence_kind_tags.end()) {
        return GeofenceKind::Custom;
    }
    return iterator_tag->second;
}

std::optional<AlertKind> parse_alert_kind(std::string_view raw_kind) {
    const std::string normalized = normalize_tag(raw_kind);
    for (const auto& [tag, value] : k_alert_kind_tags) {
        if (tag == normalized) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace geo_sentinel
