#include "geo_sentinel/staleness_sweep.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace geo_sentinel {

StalenessSweep::StalenessSweep(
    StalenessConfig config,
    ClockPtr clock,
    DeviceStateStore& store,
    ContainmentTracker& tracker,
    AlertDispatcher& dispatcher,
    FanoutHub& hub,
    PersistenceWriter& writer
)
    : config_(config),
      clock_(std::move(clock)),
      store_(store),
      tracker_(tracker),
      dispatcher_(dispatcher),
      hub_(hub),
      writer_(writer),
      logger_(get_logger()) {
    if (clock_ == nullptr) {
        throw std::invalid_argument("StalenessSweep requires a clock");
    }
    if (config_.offline_threshold.count() <= 0.0 || config_.sweep_interval.count() <= 0.0) {
        throw std::invalid_argument("StalenessSweep threshold and interval must be positive");
    }
}

StalenessSweep::~StalenessSweep() {
    stop();
}

std::size_t StalenessSweep::sweep_once() {
    const TimePoint now = clock_->now();
    std::size_t flipped_count = 0;

    for (const std::string& device_id : store_.device_ids()) {
        std::optional<LockedDevice> locked = store_.acquire_existing(device_id);
        if (!locked.has_value()) {
            continue;
        }
        Device& device = locked->device();
        const Duration silence{now - device.last_seen};
        if (!device.is_online || silence <= config_.offline_threshold) {
            continue;
        }

        device.is_online = false;
        ++flipped_count;
        // Stamp with the last ping time so per-device event order stays non-decreasing.
        const TimePoint source_timestamp = device.last_position.has_value() ? device.last_position->timestamp : now;
        logger_->info(
            R"({{"component":"staleness","device":"{}","event":"offline","silence_s":{:.0f}}})",
            device.device_id,
            silence.count()
        );

        dispatcher_.dispatch(AlertRequest{
            device.device_id,
            std::nullopt,
            AlertKind::DeviceOffline,
            fmt::format("Device {} offline: no location for {:.0f} s", device.device_id, silence.count()),
            source_timestamp
        });
        hub_.publish(DeviceStateDelta{device, tracker_.inside_geofences(device.device_id), source_timestamp});
        writer_.enqueue_device_state(device);
    }

    const std::size_t pruned_count = dispatcher_.prune_expired();
    logger_->debug("Staleness sweep flipped {} devices offline, pruned {} cool-down entries", flipped_count, pruned_count);
    return flipped_count;
}

void StalenessSweep::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        flag_stop_requested_ = false;
    }
    sweep_thread_ = std::thread(&StalenessSweep::sweep_loop, this);
}

void StalenessSweep::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        flag_stop_requested_ = true;
    }
    condition_stop_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

void StalenessSweep::sweep_loop() {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.sweep_interval);
    while (true) {
        {
            std::unique_lock lock(mutex_);
            if (condition_stop_.wait_for(lock, interval, [this]() { return flag_stop_requested_; })) {
                break;
            }
        }
        try {
            sweep_once();
        } catch (const std::exception& exc) {
            logger_->error("Staleness sweep error: {}", exc.what());
        }
    }
}

}  // namespace geo_sentinel
