#include <chrono>
#include <cstdlib>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "geo_sentinel/configuration.hpp"

using namespace geo_sentinel;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    geo_sentinel::test::ensure_logger_initialized();
    return true;
}();

const char* const k_variables[] = {
    "GEO_SENTINEL_MAX_MARGIN_M",
    "GEO_SENTINEL_ALERT_COOLDOWN_S",
    "GEO_SENTINEL_LOW_BATTERY_PERCENT",
    "GEO_SENTINEL_OFFLINE_THRESHOLD_S",
    "GEO_SENTINEL_SWEEP_INTERVAL_S",
    "GEO_SENTINEL_QUEUE_CAPACITY",
    "GEO_SENTINEL_PERSIST_MAX_ATTEMPTS",
    "GEO_SENTINEL_PERSIST_BACKOFF_MS",
    "GEO_SENTINEL_PERSIST_QUEUE_LIMIT",
    "GEO_SENTINEL_DEVICE_SHARDS",
};

/** @brief Clears the engine variables on entry and exit so cases stay independent. */
struct ScopedEnvironment final {
    ScopedEnvironment() {
        clear();
    }
    ~ScopedEnvironment() {
        clear();
    }
    static void clear() {
        for (const char* variable : k_variables) {
            ::unsetenv(variable);
        }
    }
    static void set(const char* variable, const std::string& value) {
        ::setenv(variable, value.c_str(), 1);
    }
};
}  // namespace

TEST_CASE("ConfigurationLoader falls back to defaults") {
    ScopedEnvironment environment{};
    const EngineConfig config = ConfigurationLoader::load();

    REQUIRE(config.containment.max_margin_m == Approx(50.0));
    REQUIRE(config.alerts.cooldown.count() == Approx(60.0));
    REQUIRE(config.alerts.low_battery_threshold_percent == Approx(20.0));
    REQUIRE(config.staleness.offline_threshold.count() == Approx(120.0));
    REQUIRE(config.staleness.sweep_interval.count() == Approx(30.0));
    REQUIRE(config.fanout.queue_capacity == 256);
    REQUIRE(config.persistence.max_attempts == 5);
    REQUIRE(config.persistence.initial_backoff == std::chrono::milliseconds{100});
    REQUIRE(config.persistence.max_backoff == std::chrono::milliseconds{5'000});
    REQUIRE(config.persistence.max_queue_size == 10'000);
    REQUIRE(config.device_shards == 16);
}

TEST_CASE("ConfigurationLoader reads overrides from the environment") {
    ScopedEnvironment environment{};
    ScopedEnvironment::set("GEO_SENTINEL_MAX_MARGIN_M", "25.5");
    ScopedEnvironment::set("GEO_SENTINEL_ALERT_COOLDOWN_S", "15");
    ScopedEnvironment::set("GEO_SENTINEL_OFFLINE_THRESHOLD_S", "300");
    ScopedEnvironment::set("GEO_SENTINEL_QUEUE_CAPACITY", "32");
    ScopedEnvironment::set("GEO_SENTINEL_PERSIST_BACKOFF_MS", "250");
    ScopedEnvironment::set("GEO_SENTINEL_PERSIST_QUEUE_LIMIT", "64");

    const EngineConfig config = ConfigurationLoader::load();
    REQUIRE(config.containment.max_margin_m == Approx(25.5));
    REQUIRE(config.alerts.cooldown.count() == Approx(15.0));
    REQUIRE(config.staleness.offline_threshold.count() == Approx(300.0));
    REQUIRE(config.fanout.queue_capacity == 32);
    REQUIRE(config.persistence.initial_backoff == std::chrono::milliseconds{250});
    REQUIRE(config.persistence.max_queue_size == 64);
}

TEST_CASE("ConfigurationLoader rejects unusable values") {
    ScopedEnvironment environment{};
    ScopedEnvironment::set("GEO_SENTINEL_MAX_MARGIN_M", "not-a-number");
    ScopedEnvironment::set("GEO_SENTINEL_ALERT_COOLDOWN_S", "-4");
    ScopedEnvironment::set("GEO_SENTINEL_LOW_BATTERY_PERCENT", "140");
    ScopedEnvironment::set("GEO_SENTINEL_QUEUE_CAPACITY", "0");
    ScopedEnvironment::set("GEO_SENTINEL_DEVICE_SHARDS", "many");

    const EngineConfig config = ConfigurationLoader::load();
    REQUIRE(config.containment.max_margin_m == Approx(50.0));
    REQUIRE(config.alerts.cooldown.count() == Approx(60.0));
    REQUIRE(config.alerts.low_battery_threshold_percent == Approx(20.0));
    REQUIRE(config.fanout.queue_capacity == 256);
    REQUIRE(config.device_shards == 16);
}

TEST_CASE("set_log_level falls back to info for unknown names") {
    auto logger = get_logger();
    REQUIRE(set_log_level("debug"));
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE_FALSE(set_log_level("chatty"));
    REQUIRE(logger->level() == spdlog::level::info);
    REQUIRE(set_log_level("info"));
}

TEST_CASE("Console sink uses the plain level prefix") {
    REQUIRE(std::string{k_console_pattern} == "[%l] %v");
    auto logger = get_logger();
    REQUIRE(logger->sinks().size() == 2);
}
