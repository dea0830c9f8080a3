#include <chrono>
#include <memory>
#include <regex>
#include <set>
#include <variant>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "geo_sentinel/alert_dispatcher.hpp"
#include "geo_sentinel/memory_persistence.hpp"

using namespace geo_sentinel;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    geo_sentinel::test::ensure_logger_initialized();
    return true;
}();

const TimePoint k_start{std::chrono::seconds{1'700'000'000}};

AlertRequest enter_request(const std::string& device_id, const std::string& geofence_id) {
    return AlertRequest{device_id, geofence_id, AlertKind::GeofenceEnter, "entered " + geofence_id, k_start};
}

struct DispatcherHarness final {
    std::shared_ptr<ManualClock> clock{std::make_shared<ManualClock>(k_start)};
    std::shared_ptr<MemoryPersistence> persistence{std::make_shared<MemoryPersistence>()};
    FanoutHub hub{FanoutConfig{16}};
    PersistenceWriter writer{persistence, PersistenceConfig{3, std::chrono::milliseconds{1}, std::chrono::milliseconds{2}}};
    AlertDispatcher dispatcher{AlertConfig{Duration{60.0}, 20.0}, clock, hub, writer};

    DispatcherHarness() {
        writer.start();
    }
};
}  // namespace

TEST_CASE("generate_alert_id produces distinct v4 UUIDs") {
    const std::regex uuid_pattern{"^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$"};
    std::set<std::string> seen;
    for (int index = 0; index < 200; ++index) {
        const std::string id = generate_alert_id();
        REQUIRE(std::regex_match(id, uuid_pattern));
        seen.insert(id);
    }
    REQUIRE(seen.size() == 200);
}

TEST_CASE("AlertDispatcher persists and publishes created alerts") {
    DispatcherHarness harness{};
    const SubscriberChannelPtr channel = harness.hub.subscribe(SubscriberFilter::all_devices());

    const std::optional<Alert> alert = harness.dispatcher.dispatch(enter_request("d1", "g1"));
    REQUIRE(alert.has_value());
    REQUIRE(alert->created_at == k_start);
    REQUIRE(alert->geofence_id == std::optional<std::string>{"g1"});
    REQUIRE_FALSE(alert->is_read);

    const std::optional<HubEvent> event = channel->try_next();
    REQUIRE(event.has_value());
    REQUIRE(std::get<Alert>(event.value()).id == alert->id);

    harness.writer.flush();
    const std::vector<Alert> stored = harness.persistence->alerts();
    REQUIRE(stored.size() == 1);
    REQUIRE(stored.front().id == alert->id);
}

TEST_CASE("AlertDispatcher fans out alerts that storage cannot keep") {
    DispatcherHarness harness{};
    const SubscriberChannelPtr channel = harness.hub.subscribe(SubscriberFilter::all_devices());
    harness.persistence->fail_next(StoreOperation::SaveAlert, 10);

    const std::optional<Alert> alert = harness.dispatcher.dispatch(enter_request("d1", "g1"));
    REQUIRE(alert.has_value());

    const std::optional<HubEvent> event = channel->try_next();
    REQUIRE(event.has_value());
    REQUIRE(std::get<Alert>(event.value()).id == alert->id);

    harness.writer.flush();
    REQUIRE(harness.persistence->alerts().empty());
    REQUIRE(harness.persistence->call_count(StoreOperation::SaveAlert) == 3);
    REQUIRE(harness.writer.lost_count() == 1);
    REQUIRE(channel->state() == SubscriberState::Connected);
}

TEST_CASE("AlertDispatcher enforces the cool-down per device, geofence and kind") {
    DispatcherHarness harness{};
    REQUIRE(harness.dispatcher.dispatch(enter_request("d1", "g1")).has_value());

    SECTION("identical requests inside the window are suppressed") {
        harness.clock->advance(std::chrono::seconds{59});
        REQUIRE_FALSE(harness.dispatcher.dispatch(enter_request("d1", "g1")).has_value());
        REQUIRE(harness.dispatcher.suppressed_count() == 1);
    }

    SECTION("the window is measured from creation time") {
        harness.clock->advance(std::chrono::seconds{60});
        REQUIRE(harness.dispatcher.dispatch(enter_request("d1", "g1")).has_value());
        REQUIRE(harness.dispatcher.dispatched_count() == 2);
    }

    SECTION("other keys are not affected") {
        REQUIRE(harness.dispatcher.dispatch(enter_request("d2", "g1")).has_value());
        REQUIRE(harness.dispatcher.dispatch(enter_request("d1", "g2")).has_value());
        AlertRequest exit_request = enter_request("d1", "g1");
        exit_request.kind = AlertKind::GeofenceExit;
        REQUIRE(harness.dispatcher.dispatch(exit_request).has_value());
    }

    SECTION("clearing the entry allows an immediate repeat") {
        harness.dispatcher.clear_cooldown("d1", AlertKind::GeofenceEnter, std::string{"g1"});
        REQUIRE(harness.dispatcher.dispatch(enter_request("d1", "g1")).has_value());
    }

    harness.writer.flush();
    REQUIRE(harness.persistence->alerts().size() == harness.dispatcher.dispatched_count());
}

TEST_CASE("AlertDispatcher prunes expired cool-down entries") {
    DispatcherHarness harness{};
    harness.dispatcher.dispatch(enter_request("d1", "g1"));
    harness.clock->advance(std::chrono::seconds{30});
    harness.dispatcher.dispatch(enter_request("d2", "g1"));

    harness.clock->advance(std::chrono::seconds{31});
    REQUIRE(harness.dispatcher.prune_expired() == 1);
    REQUIRE_FALSE(harness.dispatcher.dispatch(enter_request("d2", "g1")).has_value());
    REQUIRE(harness.dispatcher.dispatch(enter_request("d1", "g1")).has_value());
}
