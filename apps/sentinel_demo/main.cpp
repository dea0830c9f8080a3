#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <variant>

#include <spdlog/spdlog.h>

#include "geo_sentinel/configuration.hpp"
#include "geo_sentinel/geo_math.hpp"
#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/memory_persistence.hpp"
#include "geo_sentinel/tracking_engine.hpp"
#include "geo_sentinel/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

constexpr geo_sentinel::GeodeticCoordinate k_depot_center{32.7473, -117.1661}; /**< Center of the demo geofence. */
constexpr double k_depot_radius_m{250.0};                                     /**< Radius of the demo geofence. */
constexpr double k_walk_span_m{600.0};                                        /**< Length of the back-and-forth walk. */
constexpr double k_step_m{40.0};                                              /**< Distance covered per tick. */
constexpr std::chrono::milliseconds k_tick_interval{1'000};                   /**< Spacing of simulated pings. */
constexpr std::size_t k_silent_after_ticks{20};                               /**< Tick after which the last device stops reporting. */

struct SimulatedDevice final {
    std::string identifier;
    double bearing_deg;
    double battery_drain_per_tick;
};

constexpr std::array<double, 3> k_bearings_deg{0.0, 120.0, 240.0};

/**
 * @brief Distance from the depot center for a device walking out and back.
 */
double walk_distance_m(std::size_t tick) {
    const double travelled = static_cast<double>(tick) * k_step_m;
    const double phase = std::fmod(travelled, 2.0 * k_walk_span_m);
    return phase <= k_walk_span_m ? phase : 2.0 * k_walk_span_m - phase;
}

void consume_events(const geo_sentinel::SubscriberChannelPtr& channel) {
    auto logger = geo_sentinel::get_logger();
    while (!should_terminate.load() && channel->state() != geo_sentinel::SubscriberState::Closed) {
        const auto event = channel->next(std::chrono::milliseconds{250});
        if (!event.has_value()) {
            continue;
        }
        if (const auto* alert = std::get_if<geo_sentinel::Alert>(&event.value())) {
            logger->info("[observer] alert {} {}: {}", geo_sentinel::to_string(alert->kind), alert->device_id, alert->message);
            continue;
        }
        const auto& delta = std::get<geo_sentinel::DeviceStateDelta>(event.value());
        logger->debug("[observer] {} online={} battery={:.0f}% inside={}",
                      delta.device.device_id,
                      delta.device.is_online,
                      delta.device.battery_percent,
                      delta.inside_geofence_ids.size());
    }
}

/**
 * @brief Owns the observer thread; stops and joins it on every exit path.
 */
class ObserverThread final {
  public:
    explicit ObserverThread(const geo_sentinel::SubscriberChannelPtr& channel)
        : thread_(consume_events, channel) {}

    ~ObserverThread() {
        should_terminate.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    ObserverThread(const ObserverThread&) = delete;
    ObserverThread& operator=(const ObserverThread&) = delete;

  private:
    std::thread thread_;
};
}  // namespace

int main() {
    using namespace geo_sentinel;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        EngineConfig configuration = ConfigurationLoader::load();
        auto logger = get_logger();
        logger->info("geo_sentinel demo {}", k_version);

        auto persistence = std::make_shared<MemoryPersistence>();
        persistence->seed_geofence(Geofence{"depot", "Main Depot", GeofenceKind::Garage, k_depot_center, k_depot_radius_m, true});

        TrackingEngine engine{configuration, persistence};
        engine.start();

        const SubscriberChannelPtr observer = engine.subscribe(SubscriberFilter::all_devices());
        ObserverThread observer_thread{observer};

        std::array<SimulatedDevice, 3> devices{{
            {"tracker-1", k_bearings_deg[0], 0.5},
            {"tracker-2", k_bearings_deg[1], 1.5},
            {"tracker-3", k_bearings_deg[2], 0.2},
        }};
        for (const SimulatedDevice& simulated : devices) {
            Device record{};
            record.device_id = simulated.identifier;
            record.owner_id = "demo-account";
            record.device_type = "GPS Tracker";
            engine.register_device(record);
        }

        std::size_t tick = 0;
        while (!should_terminate.load()) {
            for (std::size_t index = 0; index < devices.size(); ++index) {
                const SimulatedDevice& simulated = devices[index];
                if (index + 1 == devices.size() && tick > k_silent_after_ticks) {
                    continue;
                }
                const GeodeticCoordinate position = offset_coordinate(k_depot_center, simulated.bearing_deg, walk_distance_m(tick + index * 5));
                LocationPing ping{};
                ping.device_id = simulated.identifier;
                ping.latitude_deg = position.latitude_deg;
                ping.longitude_deg = position.longitude_deg;
                ping.accuracy_m = 8.0;
                ping.battery_percent = std::max(0.0, 100.0 - simulated.battery_drain_per_tick * static_cast<double>(tick));
                ping.timestamp = WallClock::now();

                const IngestResult result = engine.ingest_ping(ping);
                if (!result.accepted()) {
                    logger->warn("Ping from {} rejected ({}): {}", ping.device_id, to_string(result.status), result.reason);
                }
            }
            ++tick;
            std::this_thread::sleep_for(k_tick_interval);
        }

        engine.shutdown();
        logger->info("Persisted {} alerts", persistence->alerts().size());
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
