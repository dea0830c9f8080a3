// === In-Memory Persistence ===================================================
//
// Process-local PersistenceGateway used by the demo binary and the tests.
// Supports injecting a number of transient failures per operation so retry
// behaviour can be exercised without a real database.

#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "geo_sentinel/persistence.hpp"

namespace geo_sentinel {

/** @brief Operations that accept injected failures. */
enum class StoreOperation {
    SaveAlert,
    LoadGeofences,
    LoadDevice,
    UpsertDevice,
    MarkRead
};

class MemoryPersistence final : public PersistenceGateway {
  public:
    StoreResult save_alert(const Alert& alert) override;
    StoreResult load_active_geofences(GeofenceList& out_geofences) override;
    StoreResult load_device(const std::string& device_id, Device& out_device) override;
    StoreResult upsert_device_state(const Device& device) override;
    StoreResult mark_alert_read(const std::string& alert_id) override;
    StoreResult mark_all_alerts_read(const std::optional<DeviceIdSet>& device_ids) override;

    /** @brief Seed a geofence returned by load_active_geofences (inactive ones are filtered). */
    void seed_geofence(const Geofence& geofence);
    /** @brief Seed a device record returned by load_device. */
    void seed_device(const Device& device);
    /** @brief Make the next @p count calls of @p operation report Unavailable. */
    void fail_next(StoreOperation operation, std::size_t count);

    /** @brief Alerts stored so far, in insertion order. */
    [[nodiscard]] std::vector<Alert> alerts() const;
    /** @brief Last upserted record for @p device_id. */
    [[nodiscard]] std::optional<Device> device(const std::string& device_id) const;
    /** @brief Number of attempted calls (successful or not) to @p operation. */
    [[nodiscard]] std::size_t call_count(StoreOperation operation) const;

  private:
    /** @brief Count the call and consume one injected failure if any is pending. */
    bool consume_failure(StoreOperation operation);

    mutable std::mutex mutex_;
    std::vector<Alert> list_alerts_;
    std::unordered_map<std::string, Device> map_devices_;
    std::unordered_map<std::string, Geofence> map_geofences_;
    std::unordered_map<StoreOperation, std::size_t> map_pending_failures_;
    std::unordered_map<StoreOperation, std::size_t> map_call_counts_;
};

}  // namespace geo_sentinel
