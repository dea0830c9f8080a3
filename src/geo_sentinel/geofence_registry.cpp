#include "geo_sentinel/geofence_registry.hpp"

#include <cmath>
#include <stdexcept>

#include "geo_sentinel/geo_math.hpp"

namespace geo_sentinel {

namespace {

void validate_geofence(const Geofence& geofence) {
    if (geofence.id.empty()) {
        throw std::invalid_argument("Geofence id cannot be empty");
    }
    if (!std::isfinite(geofence.radius_m) || geofence.radius_m <= 0.0) {
        throw std::invalid_argument("Geofence " + geofence.id + " radius must be positive");
    }
    if (!is_valid_coordinate(geofence.center)) {
        throw std::invalid_argument("Geofence " + geofence.id + " center is out of range");
    }
}

}  // namespace

GeofenceRegistry::GeofenceRegistry()
    : snapshot_(std::make_shared<const GeofenceSnapshot>()),
      logger_(get_logger()) {}

GeofenceChange GeofenceRegistry::upsert(Geofence geofence) {
    validate_geofence(geofence);

    std::scoped_lock lock(mutex_);
    const auto iterator_existing = map_geofences_.find(geofence.id);
    GeofenceChange change = GeofenceChange::Added;
    if (iterator_existing != map_geofences_.end()) {
        change = (iterator_existing->second.active && !geofence.active) ? GeofenceChange::Deactivated : GeofenceChange::Updated;
    } else if (!geofence.active) {
        change = GeofenceChange::Deactivated;
    }

    logger_->info(
        R"({{"component":"geofence_registry","action":"upsert","geofence":"{}","kind":"{}","radius_m":{},"active":{}}})",
        geofence.id,
        to_string(geofence.kind),
        geofence.radius_m,
        geofence.active
    );
    map_geofences_[geofence.id] = std::move(geofence);
    publish_snapshot_locked();
    return change;
}

bool GeofenceRegistry::remove(const std::string& geofence_id) {
    std::scoped_lock lock(mutex_);
    if (map_geofences_.erase(geofence_id) == 0) {
        return false;
    }
    logger_->info(R"({{"component":"geofence_registry","action":"remove","geofence":"{}"}})", geofence_id);
    publish_snapshot_locked();
    return true;
}

std::optional<Geofence> GeofenceRegistry::find(const std::string& geofence_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_geofence = map_geofences_.find(geofence_id);
    if (iterator_geofence == map_geofences_.end()) {
        return std::nullopt;
    }
    return iterator_geofence->second;
}

GeofenceSnapshotPtr GeofenceRegistry::snapshot() const {
    std::scoped_lock lock(mutex_);
    return snapshot_;
}

std::size_t GeofenceRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return map_geofences_.size();
}

void GeofenceRegistry::publish_snapshot_locked() {
    auto next_snapshot = std::make_shared<GeofenceSnapshot>();
    next_snapshot->version = ++version_;
    for (const auto& [geofence_id, geofence] : map_geofences_) {
        if (geofence.active) {
            next_snapshot->geofences.push_back(geofence);
        }
    }
    snapshot_ = std::move(next_snapshot);
}

}  // namespace geo_sentinel
