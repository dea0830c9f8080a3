#include "geo_sentinel/memory_persistence.hpp"

#include <algorithm>

namespace geo_sentinel {

bool MemoryPersistence::consume_failure(StoreOperation operation) {
    ++map_call_counts_[operation];
    auto iterator_failures = map_pending_failures_.find(operation);
    if (iterator_failures == map_pending_failures_.end() || iterator_failures->second == 0) {
        return false;
    }
    --iterator_failures->second;
    return true;
}

StoreResult MemoryPersistence::save_alert(const Alert& alert) {
    std::scoped_lock lock(mutex_);
    if (consume_failure(StoreOperation::SaveAlert)) {
        return StoreResult::error(StoreStatus::Unavailable, "injected save_alert failure");
    }
    const bool duplicate = std::any_of(list_alerts_.begin(), list_alerts_.end(), [&alert](const Alert& stored) {
        return stored.id == alert.id;
    });
    if (duplicate) {
        return StoreResult::error(StoreStatus::Conflict, "alert " + alert.id + " already stored");
    }
    list_alerts_.push_back(alert);
    return StoreResult::ok();
}

StoreResult MemoryPersistence::load_active_geofences(GeofenceList& out_geofences) {
    std::scoped_lock lock(mutex_);
    if (consume_failure(StoreOperation::LoadGeofences)) {
        return StoreResult::error(StoreStatus::Unavailable, "injected load_active_geofences failure");
    }
    out_geofences.clear();
    for (const auto& [geofence_id, geofence] : map_geofences_) {
        if (geofence.active) {
            out_geofences.push_back(geofence);
        }
    }
    return StoreResult::ok();
}

StoreResult MemoryPersistence::load_device(const std::string& device_id, Device& out_device) {
    std::scoped_lock lock(mutex_);
    if (consume_failure(StoreOperation::LoadDevice)) {
        return StoreResult::error(StoreStatus::Unavailable, "injected load_device failure");
    }
    const auto iterator_device = map_devices_.find(device_id);
    if (iterator_device == map_devices_.end()) {
        return StoreResult::error(StoreStatus::NotFound, "device " + device_id + " not found");
    }
    out_device = iterator_device->second;
    return StoreResult::ok();
}

StoreResult MemoryPersistence::upsert_device_state(const Device& device) {
    std::scoped_lock lock(mutex_);
    if (consume_failure(StoreOperation::UpsertDevice)) {
        return StoreResult::error(StoreStatus::Unavailable, "injected upsert_device_state failure");
    }
    map_devices_[device.device_id] = device;
    return StoreResult::ok();
}

StoreResult MemoryPersistence::mark_alert_read(const std::string& alert_id) {
    std::scoped_lock lock(mutex_);
    if (consume_failure(StoreOperation::MarkRead)) {
        return StoreResult::error(StoreStatus::Unavailable, "injected mark_alert_read failure");
    }
    auto iterator_alert = std::find_if(list_alerts_.begin(), list_alerts_.end(), [&alert_id](const Alert& stored) {
        return stored.id == alert_id;
    });
    if (iterator_alert == list_alerts_.end()) {
        return StoreResult::error(StoreStatus::NotFound, "alert " + alert_id + " not found");
    }
    iterator_alert->is_read = true;
    return StoreResult::ok();
}

StoreResult MemoryPersistence::mark_all_alerts_read(const std::optional<DeviceIdSet>& device_ids) {
    std::scoped_lock lock(mutex_);
    if (consume_failure(StoreOperation::MarkRead)) {
        return StoreResult::error(StoreStatus::Unavailable, "injected mark_all_alerts_read failure");
    }
    for (Alert& stored : list_alerts_) {
        if (device_ids.has_value() && device_ids->count(stored.device_id) == 0) {
            continue;
        }
        stored.is_read = true;
    }
    return StoreResult::ok();
}

void MemoryPersistence::seed_geofence(const Geofence& geofence) {
    std::scoped_lock lock(mutex_);
    map_geofences_[geofence.id] = geofence;
}

void MemoryPersistence::seed_device(const Device& device) {
    std::scoped_lock lock(mutex_);
    map_devices_[device.device_id] = device;
}

void MemoryPersistence::fail_next(StoreOperation operation, std::size_t count) {
    std::scoped_lock lock(mutex_);
    map_pending_failures_[operation] = count;
}

std::vector<Alert> MemoryPersistence::alerts() const {
    std::scoped_lock lock(mutex_);
    return list_alerts_;
}

std::optional<Device> MemoryPersistence::device(const std::string& device_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_device = map_devices_.find(device_id);
    if (iterator_device == map_devices_.end()) {
        return std::nullopt;
    }
    return iterator_device->second;
}

std::size_t MemoryPersistence::call_count(StoreOperation operation) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_count = map_call_counts_.find(operation);
    return iterator_count == map_call_counts_.end() ? 0 : iterator_count->second;
}

}  // namespace geo_sentinel
