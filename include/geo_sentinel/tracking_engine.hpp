// === Tracking Engine =========================================================
//
// Wires the registry, device store, containment tracker, alert dispatcher,
// fanout hub, persistence writer and staleness sweep together and exposes
// the transport-agnostic surface used by the integration layer.

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "geo_sentinel/alert_dispatcher.hpp"
#include "geo_sentinel/clock.hpp"
#include "geo_sentinel/configuration.hpp"
#include "geo_sentinel/containment_tracker.hpp"
#include "geo_sentinel/device_state_store.hpp"
#include "geo_sentinel/fanout_hub.hpp"
#include "geo_sentinel/geofence_registry.hpp"
#include "geo_sentinel/location_ingest.hpp"
#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/persistence.hpp"
#include "geo_sentinel/persistence_writer.hpp"
#include "geo_sentinel/staleness_sweep.hpp"

namespace geo_sentinel {

class TrackingEngine final {
  public:
    TrackingEngine(EngineConfig config, PersistenceGatewayPtr gateway, ClockPtr clock = std::make_shared<SystemClock>());
    ~TrackingEngine();

    TrackingEngine(const TrackingEngine&) = delete;
    TrackingEngine& operator=(const TrackingEngine&) = delete;

    /** @brief Load persisted geofences and start the persistence writer and sweep thread. */
    void start();
    /** @brief Stop background work, drain pending writes and close every subscriber. */
    void shutdown();

    IngestResult ingest_ping(const LocationPing& ping);

    [[nodiscard]] SubscriberChannelPtr subscribe(SubscriberFilter filter);
    bool unsubscribe(SubscriptionId id);

    /** @brief Add or replace a geofence; deactivation purges its containment states. */
    void upsert_geofence(Geofence geofence);
    /** @brief Remove a geofence and its containment states; false when unknown. */
    bool remove_geofence(const std::string& geofence_id);

    /** @brief Register a device ahead of its first ping; false when it already existed. */
    bool register_device(const Device& device);
    [[nodiscard]] std::optional<Device> device(const std::string& device_id) const;

    StoreResult mark_alert_read(const std::string& alert_id);
    StoreResult mark_all_alerts_read(const std::optional<DeviceIdSet>& device_ids = std::nullopt);

    /** @brief Run one staleness pass now; returns the number of devices flipped offline. */
    std::size_t run_staleness_sweep();
    /** @brief Block until queued persistence writes are settled. */
    void flush_persistence();

    [[nodiscard]] const EngineConfig& config() const noexcept;
    [[nodiscard]] GeofenceRegistry& registry() noexcept;
    [[nodiscard]] ContainmentTracker& tracker() noexcept;
    [[nodiscard]] FanoutHub& hub() noexcept;
    [[nodiscard]] AlertDispatcher& dispatcher() noexcept;
    [[nodiscard]] PersistenceWriter& writer() noexcept;

  private:
    void load_geofences();

    EngineConfig config_;
    PersistenceGatewayPtr gateway_;
    ClockPtr clock_;
    std::shared_ptr<spdlog::logger> logger_;
    PersistenceWriter writer_;
    DeviceStateStore store_;
    GeofenceRegistry registry_;
    ContainmentTracker tracker_;
    FanoutHub hub_;
    AlertDispatcher dispatcher_;
    LocationIngestPipeline pipeline_;
    StalenessSweep sweep_;
    std::atomic<bool> flag_running_{false};
};

}  // namespace geo_sentinel
