// === Geofence Registry =======================================================
//
// Holds every known geofence and publishes an immutable snapshot of the
// active ones. Writers rebuild the snapshot under the registry lock and swap
// it in; readers take a shared_ptr copy, so an evaluation pass never sees a
// geofence mid-update.

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

/** @brief Immutable view of the active geofences at one registry version. */
struct GeofenceSnapshot final {
    std::uint64_t version{};
    GeofenceList geofences{};
};

using GeofenceSnapshotPtr = std::shared_ptr<const GeofenceSnapshot>;

/** @brief Result of an upsert, used by the engine to decide on containment purges. */
enum class GeofenceChange {
    Added,
    Updated,
    Deactivated
};

class GeofenceRegistry final {
  public:
    GeofenceRegistry();

    /**
     * @brief Add or replace a geofence.
     *
     * @throws std::invalid_argument when the id is empty, the radius is not a
     *         positive finite number or the center is not a valid coordinate.
     */
    GeofenceChange upsert(Geofence geofence);
    /** @brief Remove a geofence; returns false when it was unknown. */
    bool remove(const std::string& geofence_id);

    [[nodiscard]] std::optional<Geofence> find(const std::string& geofence_id) const;
    /** @brief Active geofences as of the latest committed write. */
    [[nodiscard]] GeofenceSnapshotPtr snapshot() const;
    /** @brief Number of known geofences, active or not. */
    [[nodiscard]] std::size_t size() const;

  private:
    /** @brief Rebuild and publish the active snapshot. Caller holds mutex_. */
    void publish_snapshot_locked();

    mutable std::mutex mutex_;
    std::map<std::string, Geofence> map_geofences_;
    std::uint64_t version_{0};
    GeofenceSnapshotPtr snapshot_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_sentinel
