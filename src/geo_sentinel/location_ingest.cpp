#include "geo_sentinel/location_ingest.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>

#include "geo_sentinel/errors.hpp"
#include "geo_sentinel/geo_math.hpp"

namespace geo_sentinel {

namespace {

constexpr char k_default_device_type[] = "GPS Tracker"; /**< Type assigned to devices first seen through a ping. */

std::int64_t to_epoch_ms(TimePoint instant) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(instant.time_since_epoch()).count();
}

}  // namespace

std::string_view to_string(IngestStatus status) noexcept {
    switch (status) {
        case IngestStatus::Accepted:
            return "accepted";
        case IngestStatus::InvalidPing:
            return to_string(ErrorKind::InvalidPing);
        case IngestStatus::StaleOrDuplicate:
            return to_string(ErrorKind::StaleOrDuplicate);
    }
    return "unknown";
}

std::optional<std::string> validate_ping(const LocationPing& ping) {
    if (ping.device_id.empty()) {
        return std::string{"device id is empty"};
    }
    if (!is_valid_coordinate(GeodeticCoordinate{ping.latitude_deg, ping.longitude_deg})) {
        return fmt::format("coordinate ({}, {}) is out of range", ping.latitude_deg, ping.longitude_deg);
    }
    if (!std::isfinite(ping.accuracy_m) || ping.accuracy_m <= 0.0) {
        return fmt::format("accuracy {} must be positive", ping.accuracy_m);
    }
    if (!std::isfinite(ping.battery_percent) || ping.battery_percent < 0.0 || ping.battery_percent > 100.0) {
        return fmt::format("battery {} is outside 0-100", ping.battery_percent);
    }
    return std::nullopt;
}

LocationIngestPipeline::LocationIngestPipeline(
    ClockPtr clock,
    DeviceStateStore& store,
    GeofenceRegistry& registry,
    ContainmentTracker& tracker,
    AlertDispatcher& dispatcher,
    FanoutHub& hub,
    PersistenceWriter& writer,
    PersistenceGatewayPtr gateway
)
    : clock_(std::move(clock)),
      store_(store),
      registry_(registry),
      tracker_(tracker),
      dispatcher_(dispatcher),
      hub_(hub),
      writer_(writer),
      gateway_(std::move(gateway)),
      logger_(get_logger()) {
    if (clock_ == nullptr || gateway_ == nullptr) {
        throw std::invalid_argument("LocationIngestPipeline requires a clock and a persistence gateway");
    }
}

IngestResult LocationIngestPipeline::ingest(const LocationPing& ping) {
    if (auto invalid_reason = validate_ping(ping); invalid_reason.has_value()) {
        return reject(IngestStatus::InvalidPing, ping, std::move(invalid_reason.value()));
    }

    LockedDevice locked = store_.acquire(ping.device_id);
    Device& device = locked.device();
    if (locked.created()) {
        hydrate_new_device(device);
    }

    if (device.last_position.has_value() && ping.timestamp <= device.last_position->timestamp) {
        return reject(
            IngestStatus::StaleOrDuplicate,
            ping,
            fmt::format("timestamp {} ms is not newer than recorded {} ms", to_epoch_ms(ping.timestamp), to_epoch_ms(device.last_position->timestamp))
        );
    }

    const bool had_position = device.last_position.has_value();
    const bool was_online = device.is_online;
    const double previous_battery = device.battery_percent;

    const PositionFix fix{GeodeticCoordinate{ping.latitude_deg, ping.longitude_deg}, ping.accuracy_m, ping.timestamp};
    device.last_position = fix;
    device.battery_percent = ping.battery_percent;
    device.last_seen = clock_->now();
    device.is_online = true;

    if (!was_online) {
        dispatcher_.clear_cooldown(device.device_id, AlertKind::DeviceOffline);
        logger_->info(R"({{"component":"ingest","device":"{}","event":"online"}})", device.device_id);
    }

    const GeofenceSnapshotPtr snapshot = registry_.snapshot();
    const EvaluationReport report = tracker_.evaluate(device.device_id, fix, *snapshot);
    raise_containment_alerts(device, report, ping.timestamp);

    const double threshold = dispatcher_.config().low_battery_threshold_percent;
    if (device.battery_percent <= threshold && (!had_position || previous_battery > threshold)) {
        dispatcher_.dispatch(AlertRequest{
            device.device_id,
            std::nullopt,
            AlertKind::LowBattery,
            fmt::format("Device {} battery low: {:.0f}%", device.device_id, device.battery_percent),
            ping.timestamp
        });
    }

    hub_.publish(DeviceStateDelta{device, report.inside_geofence_ids, ping.timestamp});
    writer_.enqueue_device_state(device);
    ++accepted_count_;
    return IngestResult{IngestStatus::Accepted, {}};
}

void LocationIngestPipeline::hydrate_new_device(Device& device) {
    Device stored{};
    // The device lock is held here, so a backoff would stall this device's ping.
    const StoreResult result = PersistenceWriter::run_once([this, &device, &stored]() { return gateway_->load_device(device.device_id, stored); });
    if (result) {
        stored.device_id = device.device_id;
        device = stored;
        logger_->debug("Hydrated device {} from storage", device.device_id);
        return;
    }
    if (result.code != StoreStatus::NotFound) {
        logger_->warn(
            R"({{"component":"ingest","device":"{}","error":"{}","detail":"{}"}})",
            device.device_id,
            to_string(ErrorKind::PersistenceFailure),
            result.message
        );
    }
    device.device_type = k_default_device_type;
}

void LocationIngestPipeline::raise_containment_alerts(const Device& device, const EvaluationReport& report, TimePoint source_timestamp) {
    for (const ContainmentTransition& transition : report.transitions) {
        logger_->info(
            R"({{"component":"containment","device":"{}","geofence":"{}","transition":"{}","distance_m":{:.1f},"margin_m":{:.1f}}})",
            device.device_id,
            transition.geofence_id,
            transition.entered ? "enter" : "exit",
            transition.distance_m,
            transition.margin_m
        );
        const std::string label = transition.geofence_name.empty() ? transition.geofence_id : transition.geofence_name;
        dispatcher_.dispatch(AlertRequest{
            device.device_id,
            transition.geofence_id,
            transition.entered ? AlertKind::GeofenceEnter : AlertKind::GeofenceExit,
            fmt::format(
                "Device {} {} geofence {} ({}), {:.0f} m from center",
                device.device_id,
                transition.entered ? "entered" : "exited",
                label,
                to_string(transition.geofence_kind),
                transition.distance_m
            ),
            source_timestamp
        });
    }
}

IngestResult LocationIngestPipeline::reject(IngestStatus status, const LocationPing& ping, std::string reason) {
    ++rejected_count_;
    logger_->debug(
        R"({{"component":"ingest","device":"{}","rejected":"{}","reason":"{}"}})",
        ping.device_id,
        to_string(status),
        reason
    );
    return IngestResult{status, std::move(reason)};
}

std::size_t LocationIngestPipeline::accepted_count() const noexcept {
    return accepted_count_.load();
}

std::size_t LocationIngestPipeline::rejected_count() const noexcept {
    return rejected_count_.load();
}

}  // namespace geo_sentinel
