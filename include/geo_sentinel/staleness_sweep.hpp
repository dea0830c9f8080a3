// === Staleness Sweep =========================================================
//
// Periodically walks the device store and flips devices that have been
// silent longer than the offline threshold to offline, raising one
// device_offline alert per flip. This is the only place a device goes from
// online to offline; the ingest pipeline is the only place it comes back.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "geo_sentinel/alert_dispatcher.hpp"
#include "geo_sentinel/clock.hpp"
#include "geo_sentinel/containment_tracker.hpp"
#include "geo_sentinel/device_state_store.hpp"
#include "geo_sentinel/fanout_hub.hpp"
#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/persistence_writer.hpp"

namespace geo_sentinel {

struct StalenessConfig final {
    Duration offline_threshold{120.0}; /**< Silence after which a device is considered offline. */
    Duration sweep_interval{30.0};     /**< Real-time spacing of background sweeps. */
};

class StalenessSweep final {
  public:
    StalenessSweep(
        StalenessConfig config,
        ClockPtr clock,
        DeviceStateStore& store,
        ContainmentTracker& tracker,
        AlertDispatcher& dispatcher,
        FanoutHub& hub,
        PersistenceWriter& writer
    );
    ~StalenessSweep();

    StalenessSweep(const StalenessSweep&) = delete;
    StalenessSweep& operator=(const StalenessSweep&) = delete;

    /** @brief Run one pass immediately; returns the number of devices flipped offline. */
    std::size_t sweep_once();

    /** @brief Start the background thread that sweeps every sweep_interval. */
    void start();
    void stop();

  private:
    void sweep_loop();

    StalenessConfig config_;
    ClockPtr clock_;
    DeviceStateStore& store_;
    ContainmentTracker& tracker_;
    AlertDispatcher& dispatcher_;
    FanoutHub& hub_;
    PersistenceWriter& writer_;
    std::mutex mutex_;
    std::condition_variable condition_stop_;
    bool flag_stop_requested_{false};
    std::atomic<bool> flag_running_{false};
    std::thread sweep_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_sentinel
