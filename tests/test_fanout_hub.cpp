#include <chrono>
#include <stdexcept>
#include <thread>
#include <variant>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "geo_sentinel/fanout_hub.hpp"

using namespace geo_sentinel;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    geo_sentinel::test::ensure_logger_initialized();
    return true;
}();

DeviceStateDelta make_delta(const std::string& device_id, double battery_percent) {
    DeviceStateDelta delta{};
    delta.device.device_id = device_id;
    delta.device.battery_percent = battery_percent;
    delta.device.is_online = true;
    return delta;
}

Alert make_alert(const std::string& device_id, const std::string& id) {
    Alert alert{};
    alert.id = id;
    alert.device_id = device_id;
    alert.kind = AlertKind::LowBattery;
    return alert;
}

double delta_battery(const std::optional<HubEvent>& event) {
    return std::get<DeviceStateDelta>(event.value()).device.battery_percent;
}
}  // namespace

TEST_CASE("FanoutHub honours subscriber device filters") {
    FanoutHub hub{FanoutConfig{8}};
    const SubscriberChannelPtr everything = hub.subscribe(SubscriberFilter::all_devices());
    const SubscriberChannelPtr scoped = hub.subscribe(SubscriberFilter::only(DeviceIdSet{"d1"}));

    hub.publish(make_delta("d1", 90.0));
    hub.publish(make_delta("d2", 80.0));
    hub.publish(make_alert("d2", "a1"));

    REQUIRE(everything->pending() == 3);
    REQUIRE(scoped->pending() == 1);
    const std::optional<HubEvent> only_event = scoped->try_next();
    REQUIRE(event_device_id(only_event.value()) == "d1");
    REQUIRE_FALSE(scoped->try_next().has_value());
}

TEST_CASE("SubscriberChannel delivers events in publish order") {
    SubscriberChannel channel{1, SubscriberFilter::all_devices(), 4};
    REQUIRE(channel.offer(make_alert("d1", "a1")) == OfferOutcome::Queued);
    REQUIRE(channel.offer(make_delta("d1", 50.0)) == OfferOutcome::Queued);

    REQUIRE(std::holds_alternative<Alert>(channel.try_next().value()));
    REQUIRE(delta_battery(channel.try_next()) == Approx(50.0));
    REQUIRE_FALSE(channel.next(std::chrono::milliseconds{5}).has_value());
}

TEST_CASE("SubscriberChannel coalesces deltas when full") {
    SubscriberChannel channel{1, SubscriberFilter::all_devices(), 3};
    REQUIRE(channel.offer(make_delta("d1", 90.0)) == OfferOutcome::Queued);
    REQUIRE(channel.offer(make_delta("d2", 80.0)) == OfferOutcome::Queued);
    REQUIRE(channel.offer(make_delta("d3", 70.0)) == OfferOutcome::Queued);

    REQUIRE(channel.offer(make_delta("d1", 85.0)) == OfferOutcome::Coalesced);
    REQUIRE(channel.pending() == 3);
    REQUIRE(channel.coalesced_count() == 1);
    REQUIRE(channel.state() == SubscriberState::Connected);

    REQUIRE(event_device_id(channel.try_next().value()) == "d2");
    REQUIRE(event_device_id(channel.try_next().value()) == "d3");
    REQUIRE(delta_battery(channel.try_next()) == Approx(85.0));
}

TEST_CASE("SubscriberChannel drains then closes after an overflow") {
    SubscriberChannel channel{1, SubscriberFilter::all_devices(), 2};
    REQUIRE(channel.offer(make_delta("d1", 90.0)) == OfferOutcome::Queued);
    REQUIRE(channel.offer(make_delta("d2", 80.0)) == OfferOutcome::Queued);

    SECTION("an alert never replaces queued events") {
        REQUIRE(channel.offer(make_alert("d1", "a1")) == OfferOutcome::Overloaded);
    }
    SECTION("a delta without a pending same-device delta overflows") {
        REQUIRE(channel.offer(make_delta("d3", 70.0)) == OfferOutcome::Overloaded);
    }

    REQUIRE(channel.state() == SubscriberState::Draining);
    REQUIRE(channel.close_reason() == CloseReason::Overloaded);
    REQUIRE(channel.offer(make_delta("d1", 10.0)) == OfferOutcome::NotConnected);

    REQUIRE(event_device_id(channel.try_next().value()) == "d1");
    REQUIRE(channel.state() == SubscriberState::Draining);
    REQUIRE(event_device_id(channel.try_next().value()) == "d2");
    REQUIRE(channel.state() == SubscriberState::Closed);
    REQUIRE_FALSE(channel.try_next().has_value());
}

TEST_CASE("FanoutHub disconnects an overloaded subscriber without stalling others") {
    FanoutHub hub{FanoutConfig{2}};
    const SubscriberChannelPtr slow = hub.subscribe(SubscriberFilter::all_devices());
    const SubscriberChannelPtr fast = hub.subscribe(SubscriberFilter::all_devices());

    for (int index = 0; index < 3; ++index) {
        hub.publish(make_alert("d1", "a" + std::to_string(index)));
        REQUIRE(fast->try_next().has_value());
    }

    REQUIRE(slow->state() == SubscriberState::Draining);
    REQUIRE(hub.overloaded_count() == 1);
    REQUIRE(hub.subscriber_count() == 1);
    REQUIRE(fast->state() == SubscriberState::Connected);

    hub.publish(make_alert("d1", "a3"));
    REQUIRE(slow->pending() == 2);
    REQUIRE(hub.overloaded_count() == 1);
}

TEST_CASE("FanoutHub unsubscribe and close_all end the streams") {
    FanoutHub hub{FanoutConfig{4}};
    const SubscriberChannelPtr first = hub.subscribe(SubscriberFilter::all_devices());
    const SubscriberChannelPtr second = hub.subscribe(SubscriberFilter::all_devices());
    REQUIRE(first->id() != second->id());

    hub.publish(make_delta("d1", 90.0));
    REQUIRE(hub.unsubscribe(first->id()));
    REQUIRE_FALSE(hub.unsubscribe(first->id()));
    REQUIRE(first->state() == SubscriberState::Closed);
    REQUIRE(first->close_reason() == CloseReason::Unsubscribed);
    REQUIRE(first->pending() == 0);

    std::thread waiter([&second]() {
        while (second->state() != SubscriberState::Closed) {
            (void)second->next(std::chrono::milliseconds{20});
        }
    });
    hub.close_all();
    waiter.join();

    REQUIRE(second->close_reason() == CloseReason::Shutdown);
    REQUIRE(hub.subscriber_count() == 0);
}

TEST_CASE("FanoutHub rejects a zero queue capacity") {
    REQUIRE_THROWS_AS(FanoutHub(FanoutConfig{0}), std::invalid_argument);
}
