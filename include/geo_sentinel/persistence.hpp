// === Persistence Gateway =====================================================
//
// Contract the engine requires from the external storage collaborator. Every
// call is fallible and retryable; backends translate their native errors into
// StoreResult codes so upper layers never depend on a storage library.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

enum class StoreStatus {
    Ok = 0,
    NotFound,
    Conflict,
    Unavailable,
    InternalError
};

struct StoreResult final {
    StoreStatus code{StoreStatus::Ok};
    std::string message{};

    static StoreResult ok() {
        return {};
    }

    static StoreResult error(StoreStatus status, std::string text = {}) {
        return {status, std::move(text)};
    }

    explicit operator bool() const noexcept {
        return code == StoreStatus::Ok;
    }

    /** @brief NotFound and Conflict are definitive answers; retrying will not help. */
    [[nodiscard]] bool retryable() const noexcept {
        return code == StoreStatus::Unavailable || code == StoreStatus::InternalError;
    }
};

class PersistenceGateway {
  public:
    virtual ~PersistenceGateway() = default;

    virtual StoreResult save_alert(const Alert& alert) = 0;
    virtual StoreResult load_active_geofences(GeofenceList& out_geofences) = 0;
    virtual StoreResult load_device(const std::string& device_id, Device& out_device) = 0;
    virtual StoreResult upsert_device_state(const Device& device) = 0;
    virtual StoreResult mark_alert_read(const std::string& alert_id) = 0;
    /** @brief Mark every unread alert read, optionally restricted to @p device_ids. */
    virtual StoreResult mark_all_alerts_read(const std::optional<DeviceIdSet>& device_ids) = 0;
};

using PersistenceGatewayPtr = std::shared_ptr<PersistenceGateway>;

}  // namespace geo_sentinel
