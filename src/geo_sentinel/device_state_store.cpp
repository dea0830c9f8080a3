#include "geo_sentinel/device_state_store.hpp"

#include <functional>
#include <stdexcept>

namespace geo_sentinel {

LockedDevice::LockedDevice(std::shared_ptr<DeviceEntry> entry, bool created)
    : entry_(std::move(entry)),
      lock_(entry_->mutex),
      flag_created_(created) {}

Device& LockedDevice::device() noexcept {
    return entry_->device;
}

const Device& LockedDevice::device() const noexcept {
    return entry_->device;
}

bool LockedDevice::created() const noexcept {
    return flag_created_;
}

DeviceStateStore::DeviceStateStore(std::size_t shard_count) {
    if (shard_count == 0) {
        throw std::invalid_argument("DeviceStateStore requires at least one shard");
    }
    list_shards_.reserve(shard_count);
    for (std::size_t index = 0; index < shard_count; ++index) {
        list_shards_.push_back(std::make_unique<Shard>());
    }
}

DeviceStateStore::Shard& DeviceStateStore::shard_for(const std::string& device_id) const {
    const std::size_t index = std::hash<std::string>{}(device_id) % list_shards_.size();
    return *list_shards_[index];
}

LockedDevice DeviceStateStore::acquire(const std::string& device_id) {
    Shard& shard = shard_for(device_id);
    std::shared_ptr<DeviceEntry> entry;
    bool created = false;
    {
        std::scoped_lock lock(shard.mutex);
        auto& slot = shard.map_entries[device_id];
        if (slot == nullptr) {
            slot = std::make_shared<DeviceEntry>();
            slot->device.device_id = device_id;
            created = true;
        }
        entry = slot;
    }
    // The shard lock is released before blocking on the device mutex.
    return LockedDevice{std::move(entry), created};
}

std::optional<LockedDevice> DeviceStateStore::acquire_existing(const std::string& device_id) {
    Shard& shard = shard_for(device_id);
    std::shared_ptr<DeviceEntry> entry;
    {
        std::scoped_lock lock(shard.mutex);
        const auto iterator_entry = shard.map_entries.find(device_id);
        if (iterator_entry == shard.map_entries.end()) {
            return std::nullopt;
        }
        entry = iterator_entry->second;
    }
    return std::optional<LockedDevice>{std::in_place, std::move(entry), false};
}

bool DeviceStateStore::register_device(const Device& device) {
    if (device.device_id.empty()) {
        throw std::invalid_argument("Device id cannot be empty");
    }
    LockedDevice locked = acquire(device.device_id);
    if (locked.created()) {
        locked.device() = device;
        return true;
    }
    locked.device().owner_id = device.owner_id;
    locked.device().device_type = device.device_type;
    return false;
}

std::optional<Device> DeviceStateStore::get(const std::string& device_id) const {
    Shard& shard = shard_for(device_id);
    std::shared_ptr<DeviceEntry> entry;
    {
        std::scoped_lock lock(shard.mutex);
        const auto iterator_entry = shard.map_entries.find(device_id);
        if (iterator_entry == shard.map_entries.end()) {
            return std::nullopt;
        }
        entry = iterator_entry->second;
    }
    std::scoped_lock lock(entry->mutex);
    return entry->device;
}

std::vector<std::shared_ptr<DeviceEntry>> DeviceStateStore::all_entries() const {
    std::vector<std::shared_ptr<DeviceEntry>> entries;
    for (const auto& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        for (const auto& [device_id, entry] : shard->map_entries) {
            entries.push_back(entry);
        }
    }
    return entries;
}

std::vector<std::string> DeviceStateStore::device_ids() const {
    std::vector<std::string> identifiers;
    for (const auto& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        for (const auto& [device_id, entry] : shard->map_entries) {
            identifiers.push_back(device_id);
        }
    }
    return identifiers;
}

std::vector<Device> DeviceStateStore::snapshot() const {
    std::vector<Device> devices;
    for (const auto& entry : all_entries()) {
        std::scoped_lock lock(entry->mutex);
        devices.push_back(entry->device);
    }
    return devices;
}

std::size_t DeviceStateStore::size() const {
    std::size_t total = 0;
    for (const auto& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        total += shard->map_entries.size();
    }
    return total;
}

}  // namespace geo_sentinel
