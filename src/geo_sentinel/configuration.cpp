// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the tracking engine. `ConfigurationLoader` transforms raw environment
// variables into the strongly-typed `EngineConfig` structure.
//
// Responsibilities
// - Enforce defaults and sane bounds for hysteresis, cool-down, offline
//   threshold, queue capacity and retry knobs.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups.
//
// Note: this file never reads from disk; callers populate the process
// environment ahead of time (service unit, container manifest or a sourced .env).

#include "geo_sentinel/configuration.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "geo_sentinel/logging.hpp"

namespace geo_sentinel {

namespace {
constexpr double k_default_max_margin_m{50.0};
constexpr double k_default_cooldown_s{60.0};
constexpr double k_default_low_battery_percent{20.0};
constexpr double k_default_offline_threshold_s{120.0};
constexpr double k_default_sweep_interval_s{30.0};
constexpr int k_default_queue_capacity{256};
constexpr int k_default_persist_max_attempts{5};
constexpr int k_default_persist_backoff_ms{100};
constexpr int k_default_persist_queue_limit{10'000};
constexpr int k_default_device_shards{16};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};

/**
 * @brief Keep strictly positive values; anything else falls back with a warning.
 */
template <typename Number>
Number clamp_positive(const char* variable_name, Number value, Number fallback) {
    if (value > Number{0}) {
        return value;
    }
    get_logger()->warn("{}={} must be positive; using fallback {}", variable_name, value, fallback);
    return fallback;
}

double parse_double(const char* variable_name, double fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        return clamp_positive(variable_name, std::stod(raw_value), fallback);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}='{}' as a number; using fallback {}", variable_name, raw_value, fallback);
        return fallback;
    }
}

int parse_int(const char* variable_name, int fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        return clamp_positive(variable_name, std::stoi(raw_value), fallback);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}='{}' as an integer; using fallback {}", variable_name, raw_value, fallback);
        return fallback;
    }
}

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

EngineConfig ConfigurationLoader::load() {
    EngineConfig config{};
    config.log_directory = parse_string("GEO_SENTINEL_LOG_DIR", k_default_log_directory);
    config.log_level = parse_string("GEO_SENTINEL_LOG_LEVEL", k_default_log_level);

    auto logger = initialize_logger(config.log_directory);
    set_log_level(config.log_level);
    logger->info("Loading configuration from environment");

    config.containment.max_margin_m = parse_double("GEO_SENTINEL_MAX_MARGIN_M", k_default_max_margin_m);
    config.alerts.cooldown = Duration{parse_double("GEO_SENTINEL_ALERT_COOLDOWN_S", k_default_cooldown_s)};
    config.alerts.low_battery_threshold_percent = parse_double("GEO_SENTINEL_LOW_BATTERY_PERCENT", k_default_low_battery_percent);
    if (config.alerts.low_battery_threshold_percent > 100.0) {
        logger->warn("Low battery threshold {} exceeds 100; using {}", config.alerts.low_battery_threshold_percent, k_default_low_battery_percent);
        config.alerts.low_battery_threshold_percent = k_default_low_battery_percent;
    }
    config.staleness.offline_threshold = Duration{parse_double("GEO_SENTINEL_OFFLINE_THRESHOLD_S", k_default_offline_threshold_s)};
    config.staleness.sweep_interval = Duration{parse_double("GEO_SENTINEL_SWEEP_INTERVAL_S", k_default_sweep_interval_s)};
    config.fanout.queue_capacity = static_cast<std::size_t>(parse_int("GEO_SENTINEL_QUEUE_CAPACITY", k_default_queue_capacity));
    config.persistence.max_attempts = parse_int("GEO_SENTINEL_PERSIST_MAX_ATTEMPTS", k_default_persist_max_attempts);
    config.persistence.initial_backoff = std::chrono::milliseconds{parse_int("GEO_SENTINEL_PERSIST_BACKOFF_MS", k_default_persist_backoff_ms)};
    config.persistence.max_queue_size = static_cast<std::size_t>(parse_int("GEO_SENTINEL_PERSIST_QUEUE_LIMIT", k_default_persist_queue_limit));
    config.device_shards = static_cast<std::size_t>(parse_int("GEO_SENTINEL_DEVICE_SHARDS", k_default_device_shards));

    logger->info("Configuration loaded: max_margin_m={} cooldown_s={} offline_threshold_s={} sweep_interval_s={} queue_capacity={}",
                 config.containment.max_margin_m,
                 config.alerts.cooldown.count(),
                 config.staleness.offline_threshold.count(),
                 config.staleness.sweep_interval.count(),
                 config.fanout.queue_capacity);

    return config;
}

}  // namespace geo_sentinel
