// === Alert Dispatcher ========================================================
//
// Turns alert requests into Alert records. A request is suppressed when an
// alert with the same (device, geofence, kind) was created within the
// cool-down window; otherwise the alert is queued for persistence and
// published to the fanout hub. The two hand-offs are independent: a slow or
// failing store never delays live subscribers.

#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include "geo_sentinel/clock.hpp"
#include "geo_sentinel/fanout_hub.hpp"
#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/persistence_writer.hpp"
#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

struct AlertConfig final {
    Duration cooldown{60.0};                     /**< Minimum spacing of identical alerts. */
    double low_battery_threshold_percent{20.0};  /**< Battery level at or below which low_battery fires. */
};

/** @brief Request to raise an alert, produced by the tracker, ingest path or sweep. */
struct AlertRequest final {
    std::string device_id{};
    std::optional<std::string> geofence_id{};
    AlertKind kind{AlertKind::GeofenceEnter};
    std::string message{};
    TimePoint source_timestamp{};
};

/** @brief Random RFC 4122 version 4 identifier in canonical text form. */
[[nodiscard]] std::string generate_alert_id();

class AlertDispatcher final {
  public:
    AlertDispatcher(AlertConfig config, ClockPtr clock, FanoutHub& hub, PersistenceWriter& writer);

    /**
     * @brief Create, persist and publish an alert unless it is in cool-down.
     *
     * @return The created alert, or nullopt when the request was suppressed.
     */
    std::optional<Alert> dispatch(const AlertRequest& request);

    /** @brief Forget the cool-down entry so the next identical request alerts immediately. */
    void clear_cooldown(const std::string& device_id, AlertKind kind, const std::optional<std::string>& geofence_id = std::nullopt);

    /** @brief Drop cool-down entries that can no longer suppress anything. */
    std::size_t prune_expired();

    [[nodiscard]] const AlertConfig& config() const noexcept;
    [[nodiscard]] std::size_t dispatched_count() const noexcept;
    [[nodiscard]] std::size_t suppressed_count() const noexcept;

  private:
    using CooldownKey = std::tuple<std::string, std::string, AlertKind>;

    [[nodiscard]] static CooldownKey make_key(const std::string& device_id, const std::optional<std::string>& geofence_id, AlertKind kind);

    AlertConfig config_;
    ClockPtr clock_;
    FanoutHub& hub_;
    PersistenceWriter& writer_;
    std::mutex mutex_;
    std::map<CooldownKey, TimePoint> map_last_created_;
    std::atomic<std::size_t> dispatched_count_{0};
    std::atomic<std::size_t> suppressed_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_sentinel
