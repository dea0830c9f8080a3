// === Device State Store ======================================================
//
// Authoritative in-memory live record per device. Devices are spread over
// hash-selected shards so lookups for different devices do not contend, and
// every record carries its own mutex: holding a LockedDevice serialises the
// whole ingest pass (state update, containment evaluation, alert emission)
// for that one device while other devices proceed in parallel.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

/** @brief A device record and the mutex that serialises its mutations. */
struct DeviceEntry final {
    std::mutex mutex;
    Device device{};
};

/** @brief Exclusive handle on one device record; the lock is released on destruction. */
class LockedDevice final {
  public:
    LockedDevice(std::shared_ptr<DeviceEntry> entry, bool created);

    [[nodiscard]] Device& device() noexcept;
    [[nodiscard]] const Device& device() const noexcept;
    /** @brief True when this acquisition created the record. */
    [[nodiscard]] bool created() const noexcept;

  private:
    std::shared_ptr<DeviceEntry> entry_;
    std::unique_lock<std::mutex> lock_;
    bool flag_created_{false};
};

class DeviceStateStore final {
  public:
    explicit DeviceStateStore(std::size_t shard_count = 16);

    /** @brief Lock the record for @p device_id, creating an offline record if needed. */
    [[nodiscard]] LockedDevice acquire(const std::string& device_id);
    /** @brief Lock the record for @p device_id only if it exists. */
    [[nodiscard]] std::optional<LockedDevice> acquire_existing(const std::string& device_id);

    /**
     * @brief Register a device ahead of its first ping.
     *
     * Returns false when the device already existed; in that case only the
     * owner and device type are refreshed.
     */
    bool register_device(const Device& device);

    /** @brief Atomic copy of one record. */
    [[nodiscard]] std::optional<Device> get(const std::string& device_id) const;
    /** @brief Identifiers of all known devices. */
    [[nodiscard]] std::vector<std::string> device_ids() const;
    /** @brief Per-device atomic copies of every record (no cross-device consistency). */
    [[nodiscard]] std::vector<Device> snapshot() const;
    [[nodiscard]] std::size_t size() const;

  private:
    struct Shard final {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<DeviceEntry>> map_entries;
    };

    [[nodiscard]] Shard& shard_for(const std::string& device_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<DeviceEntry>> all_entries() const;

    std::vector<std::unique_ptr<Shard>> list_shards_;
};

}  // namespace geo_sentinel
