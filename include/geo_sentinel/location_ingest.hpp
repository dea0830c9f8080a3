// === Location Ingest Pipeline ================================================
//
// Entry point for device pings. A ping is validated, ordered against the
// device's recorded position, applied to the live record and evaluated
// against the active geofences, all while the device's record is locked so
// two pings for one device never interleave. Rejected pings change nothing
// and trigger no evaluation.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "geo_sentinel/alert_dispatcher.hpp"
#include "geo_sentinel/clock.hpp"
#include "geo_sentinel/containment_tracker.hpp"
#include "geo_sentinel/device_state_store.hpp"
#include "geo_sentinel/fanout_hub.hpp"
#include "geo_sentinel/geofence_registry.hpp"
#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/persistence_writer.hpp"
#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

enum class IngestStatus {
    Accepted,
    InvalidPing,
    StaleOrDuplicate
};

[[nodiscard]] std::string_view to_string(IngestStatus status) noexcept;

struct IngestResult final {
    IngestStatus status{IngestStatus::Accepted};
    std::string reason{};

    [[nodiscard]] bool accepted() const noexcept {
        return status == IngestStatus::Accepted;
    }
};

/** @brief Reason the ping is malformed, or nullopt when it is well formed. */
[[nodiscard]] std::optional<std::string> validate_ping(const LocationPing& ping);

class LocationIngestPipeline final {
  public:
    LocationIngestPipeline(
        ClockPtr clock,
        DeviceStateStore& store,
        GeofenceRegistry& registry,
        ContainmentTracker& tracker,
        AlertDispatcher& dispatcher,
        FanoutHub& hub,
        PersistenceWriter& writer,
        PersistenceGatewayPtr gateway
    );

    IngestResult ingest(const LocationPing& ping);

    [[nodiscard]] std::size_t accepted_count() const noexcept;
    [[nodiscard]] std::size_t rejected_count() const noexcept;

  private:
    /** @brief Fill a freshly created record from storage, or with defaults when unknown. */
    void hydrate_new_device(Device& device);
    void raise_containment_alerts(const Device& device, const EvaluationReport& report, TimePoint source_timestamp);
    IngestResult reject(IngestStatus status, const LocationPing& ping, std::string reason);

    ClockPtr clock_;
    DeviceStateStore& store_;
    GeofenceRegistry& registry_;
    ContainmentTracker& tracker_;
    AlertDispatcher& dispatcher_;
    FanoutHub& hub_;
    PersistenceWriter& writer_;
    PersistenceGatewayPtr gateway_;
    std::atomic<std::size_t> accepted_count_{0};
    std::atomic<std::size_t> rejected_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_sentinel
