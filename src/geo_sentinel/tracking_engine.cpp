#include "geo_sentinel/tracking_engine.hpp"

#include <stdexcept>

#include "geo_sentinel/errors.hpp"

namespace geo_sentinel {

TrackingEngine::TrackingEngine(EngineConfig config, PersistenceGatewayPtr gateway, ClockPtr clock)
    : config_(std::move(config)),
      gateway_(std::move(gateway)),
      clock_(std::move(clock)),
      logger_(get_logger()),
      writer_(gateway_, config_.persistence),
      store_(config_.device_shards),
      registry_(),
      tracker_(config_.containment, config_.device_shards),
      hub_(config_.fanout),
      dispatcher_(config_.alerts, clock_, hub_, writer_),
      pipeline_(clock_, store_, registry_, tracker_, dispatcher_, hub_, writer_, gateway_),
      sweep_(config_.staleness, clock_, store_, tracker_, dispatcher_, hub_, writer_) {}

TrackingEngine::~TrackingEngine() {
    shutdown();
}

void TrackingEngine::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting tracking engine");
    writer_.start();
    load_geofences();
    sweep_.start();
}

void TrackingEngine::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down tracking engine");
    sweep_.stop();
    writer_.stop();
    hub_.close_all();
    if (writer_.lost_count() > 0) {
        logger_->warn("{} records were lost from durable storage during this run", writer_.lost_count());
    }
    flush_logger();
}

void TrackingEngine::load_geofences() {
    GeofenceList geofences;
    const StoreResult result = writer_.run_with_retry(
        [this, &geofences]() { return gateway_->load_active_geofences(geofences); },
        "load_active_geofences"
    );
    if (!result) {
        logger_->error(
            R"({{"component":"engine","error":"{}","detail":"starting with an empty geofence registry: {}"}})",
            to_string(ErrorKind::PersistenceFailure),
            result.message
        );
        return;
    }

    std::size_t loaded_count = 0;
    for (Geofence& geofence : geofences) {
        const std::string geofence_id = geofence.id;
        try {
            registry_.upsert(std::move(geofence));
            ++loaded_count;
        } catch (const std::invalid_argument& exc) {
            logger_->warn("Skipping persisted geofence {}: {}", geofence_id, exc.what());
        }
    }
    logger_->info("Loaded {} of {} persisted geofences", loaded_count, geofences.size());
}

IngestResult TrackingEngine::ingest_ping(const LocationPing& ping) {
    return pipeline_.ingest(ping);
}

SubscriberChannelPtr TrackingEngine::subscribe(SubscriberFilter filter) {
    return hub_.subscribe(std::move(filter));
}

bool TrackingEngine::unsubscribe(SubscriptionId id) {
    return hub_.unsubscribe(id);
}

void TrackingEngine::upsert_geofence(Geofence geofence) {
    const std::string geofence_id = geofence.id;
    const GeofenceChange change = registry_.upsert(std::move(geofence));
    if (change == GeofenceChange::Deactivated) {
        const std::size_t purged = tracker_.purge_geofence(geofence_id);
        logger_->info("Geofence {} deactivated; purged {} containment states", geofence_id, purged);
    }
}

bool TrackingEngine::remove_geofence(const std::string& geofence_id) {
    if (!registry_.remove(geofence_id)) {
        return false;
    }
    const std::size_t purged = tracker_.purge_geofence(geofence_id);
    logger_->info("Geofence {} removed; purged {} containment states", geofence_id, purged);
    return true;
}

bool TrackingEngine::register_device(const Device& device) {
    return store_.register_device(device);
}

std::optional<Device> TrackingEngine::device(const std::string& device_id) const {
    return store_.get(device_id);
}

StoreResult TrackingEngine::mark_alert_read(const std::string& alert_id) {
    return writer_.run_with_retry([this, &alert_id]() { return gateway_->mark_alert_read(alert_id); }, "mark_alert_read");
}

StoreResult TrackingEngine::mark_all_alerts_read(const std::optional<DeviceIdSet>& device_ids) {
    return writer_.run_with_retry([this, &device_ids]() { return gateway_->mark_all_alerts_read(device_ids); }, "mark_all_alerts_read");
}

std::size_t TrackingEngine::run_staleness_sweep() {
    return sweep_.sweep_once();
}

void TrackingEngine::flush_persistence() {
    writer_.flush();
}

const EngineConfig& TrackingEngine::config() const noexcept {
    return config_;
}

GeofenceRegistry& TrackingEngine::registry() noexcept {
    return registry_;
}

ContainmentTracker& TrackingEngine::tracker() noexcept {
    return tracker_;
}

FanoutHub& TrackingEngine::hub() noexcept {
    return hub_;
}

AlertDispatcher& TrackingEngine::dispatcher() noexcept {
    return dispatcher_;
}

PersistenceWriter& TrackingEngine::writer() noexcept {
    return writer_;
}

}  // namespace geo_sentinel
