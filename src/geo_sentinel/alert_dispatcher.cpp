#include "geo_sentinel/alert_dispatcher.hpp"

#include <array>
#include <cstdint>
#include <random>
#include <stdexcept>

#include <fmt/format.h>

namespace geo_sentinel {

std::string generate_alert_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<std::uint8_t, 16> bytes{};
    for (auto& byte : bytes) {
        byte = static_cast<std::uint8_t>(rng());
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string text;
    text.reserve(36);
    for (std::size_t index = 0; index < bytes.size(); ++index) {
        if (index == 4 || index == 6 || index == 8 || index == 10) {
            text.push_back('-');
        }
        text += fmt::format("{:02x}", bytes[index]);
    }
    return text;
}

AlertDispatcher::AlertDispatcher(AlertConfig config, ClockPtr clock, FanoutHub& hub, PersistenceWriter& writer)
    : config_(config),
      clock_(std::move(clock)),
      hub_(hub),
      writer_(writer),
      logger_(get_logger()) {
    if (clock_ == nullptr) {
        throw std::invalid_argument("AlertDispatcher requires a clock");
    }
    if (config_.cooldown.count() < 0.0) {
        throw std::invalid_argument("AlertDispatcher cool-down cannot be negative");
    }
}

AlertDispatcher::CooldownKey AlertDispatcher::make_key(const std::string& device_id, const std::optional<std::string>& geofence_id, AlertKind kind) {
    return CooldownKey{device_id, geofence_id.value_or(std::string{}), kind};
}

std::optional<Alert> AlertDispatcher::dispatch(const AlertRequest& request) {
    const TimePoint now = clock_->now();
    {
        std::scoped_lock lock(mutex_);
        const CooldownKey key = make_key(request.device_id, request.geofence_id, request.kind);
        const auto iterator_last = map_last_created_.find(key);
        if (iterator_last != map_last_created_.end() && Duration{now - iterator_last->second} < config_.cooldown) {
            ++suppressed_count_;
            logger_->debug(
                R"({{"component":"alerts","action":"suppressed","device":"{}","geofence":"{}","kind":"{}"}})",
                request.device_id,
                request.geofence_id.value_or(""),
                to_string(request.kind)
            );
            return std::nullopt;
        }
        map_last_created_[key] = now;
    }

    Alert alert{};
    alert.id = generate_alert_id();
    alert.device_id = request.device_id;
    alert.geofence_id = request.geofence_id;
    alert.kind = request.kind;
    alert.message = request.message;
    alert.created_at = now;
    alert.source_timestamp = request.source_timestamp;
    alert.is_read = false;

    writer_.enqueue_alert(alert);
    hub_.publish(alert);
    ++dispatched_count_;

    logger_->info(
        R"({{"component":"alerts","action":"created","alert":"{}","device":"{}","geofence":"{}","kind":"{}"}})",
        alert.id,
        alert.device_id,
        alert.geofence_id.value_or(""),
        to_string(alert.kind)
    );
    return alert;
}

void AlertDispatcher::clear_cooldown(const std::string& device_id, AlertKind kind, const std::optional<std::string>& geofence_id) {
    std::scoped_lock lock(mutex_);
    map_last_created_.erase(make_key(device_id, geofence_id, kind));
}

std::size_t AlertDispatcher::prune_expired() {
    const TimePoint now = clock_->now();
    std::scoped_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto iterator_entry = map_last_created_.begin(); iterator_entry != map_last_created_.end();) {
        if (Duration{now - iterator_entry->second} >= config_.cooldown) {
            iterator_entry = map_last_created_.erase(iterator_entry);
            ++removed;
            continue;
        }
        ++iterator_entry;
    }
    return removed;
}

const AlertConfig& AlertDispatcher::config() const noexcept {
    return config_;
}

std::size_t AlertDispatcher::dispatched_count() const noexcept {
    return dispatched_count_.load();
}

std::size_t AlertDispatcher::suppressed_count() const noexcept {
    return suppressed_count_.load();
}

}  // namespace geo_sentinel
