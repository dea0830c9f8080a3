// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the engine
// components. `ConfigurationLoader` translates environment variables into
// these structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <cstddef>
#include <string>

#include "geo_sentinel/alert_dispatcher.hpp"
#include "geo_sentinel/containment_tracker.hpp"
#include "geo_sentinel/fanout_hub.hpp"
#include "geo_sentinel/persistence_writer.hpp"
#include "geo_sentinel/staleness_sweep.hpp"

namespace geo_sentinel {

/**
 * @brief Immutable bundle of runtime knobs for the tracking engine.
 *
 * Every field is populated by ConfigurationLoader or left at its default;
 * consumers should treat the values as authoritative and avoid consulting
 * environment variables directly.
 */
struct EngineConfig final {
    std::string log_directory{"logs"};     /**< Destination directory for structured logs. */
    std::string log_level{"info"};         /**< spdlog level name applied after logger start-up. */
    ContainmentConfig containment{};       /**< Hysteresis margin limits. */
    AlertConfig alerts{};                  /**< Cool-down and low-battery threshold. */
    StalenessConfig staleness{};           /**< Offline threshold and sweep cadence. */
    FanoutConfig fanout{};                 /**< Per-subscriber queue bound. */
    PersistenceConfig persistence{};       /**< Retry policy for storage writes. */
    std::size_t device_shards{16};         /**< Lock shards for device and containment maps. */
};

/**
 * @brief Utility responsible for hydrating EngineConfig from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, start the logger and return the configuration. */
    static EngineConfig load();
};

}  // namespace geo_sentinel
