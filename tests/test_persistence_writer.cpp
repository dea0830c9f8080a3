#include <chrono>
#include <memory>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "geo_sentinel/memory_persistence.hpp"
#include "geo_sentinel/persistence_writer.hpp"

using namespace geo_sentinel;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    geo_sentinel::test::ensure_logger_initialized();
    return true;
}();

const PersistenceConfig k_fast_retries{4, std::chrono::milliseconds{1}, std::chrono::milliseconds{4}};

Device make_device(const std::string& device_id, double battery_percent) {
    Device device{};
    device.device_id = device_id;
    device.battery_percent = battery_percent;
    return device;
}

Alert make_alert(const std::string& id) {
    Alert alert{};
    alert.id = id;
    alert.device_id = "d1";
    alert.kind = AlertKind::DeviceOffline;
    alert.message = "offline";
    return alert;
}
}  // namespace

TEST_CASE("compute_backoff doubles up to the cap") {
    const PersistenceConfig config{5, std::chrono::milliseconds{100}, std::chrono::milliseconds{5'000}};
    REQUIRE(compute_backoff(config, 0) == std::chrono::milliseconds{100});
    REQUIRE(compute_backoff(config, 1) == std::chrono::milliseconds{200});
    REQUIRE(compute_backoff(config, 4) == std::chrono::milliseconds{1'600});
    REQUIRE(compute_backoff(config, 6) == std::chrono::milliseconds{5'000});
    REQUIRE(compute_backoff(config, 1'000) == std::chrono::milliseconds{5'000});
}

TEST_CASE("PersistenceWriter retries transient failures until the record lands") {
    auto persistence = std::make_shared<MemoryPersistence>();
    PersistenceWriter writer{persistence, k_fast_retries};
    writer.start();

    persistence->fail_next(StoreOperation::SaveAlert, 2);
    writer.enqueue_alert(make_alert("a1"));
    writer.flush();

    REQUIRE(persistence->alerts().size() == 1);
    REQUIRE(persistence->call_count(StoreOperation::SaveAlert) == 3);
    REQUIRE(writer.written_count() == 1);
    REQUIRE(writer.lost_count() == 0);
}

TEST_CASE("PersistenceWriter gives up after the attempt budget") {
    auto persistence = std::make_shared<MemoryPersistence>();
    PersistenceWriter writer{persistence, k_fast_retries};
    writer.start();

    persistence->fail_next(StoreOperation::UpsertDevice, 10);
    Device device{};
    device.device_id = "d1";
    writer.enqueue_device_state(device);
    writer.enqueue_alert(make_alert("a1"));
    writer.flush();

    REQUIRE(persistence->call_count(StoreOperation::UpsertDevice) == 4);
    REQUIRE_FALSE(persistence->device("d1").has_value());
    REQUIRE(writer.lost_count() == 1);
    REQUIRE(writer.written_count() == 1);
    REQUIRE(persistence->alerts().size() == 1);
}

TEST_CASE("PersistenceWriter does not retry definitive answers") {
    auto persistence = std::make_shared<MemoryPersistence>();
    PersistenceWriter writer{persistence, k_fast_retries};

    const StoreResult missing = writer.run_with_retry(
        [&persistence]() { return persistence->mark_alert_read("unknown"); },
        "mark_alert_read"
    );
    REQUIRE(missing.code == StoreStatus::NotFound);
    REQUIRE(persistence->call_count(StoreOperation::MarkRead) == 1);

    int thrown_count = 0;
    const StoreResult crashed = writer.run_with_retry(
        [&thrown_count]() -> StoreResult {
            ++thrown_count;
            throw std::runtime_error("backend crashed");
        },
        "crashing_operation"
    );
    REQUIRE(crashed.code == StoreStatus::InternalError);
    REQUIRE(crashed.message == "backend crashed");
    REQUIRE(thrown_count == k_fast_retries.max_attempts);
}

TEST_CASE("PersistenceWriter drains queued records on stop") {
    auto persistence = std::make_shared<MemoryPersistence>();
    {
        PersistenceWriter writer{persistence, k_fast_retries};
        writer.start();
        for (int index = 0; index < 25; ++index) {
            writer.enqueue_alert(make_alert("a" + std::to_string(index)));
        }
        writer.stop();
        REQUIRE(writer.written_count() == 25);
    }
    REQUIRE(persistence->alerts().size() == 25);
}

TEST_CASE("PersistenceWriter coalesces pending device states per device") {
    auto persistence = std::make_shared<MemoryPersistence>();
    PersistenceWriter writer{persistence, k_fast_retries};

    writer.enqueue_device_state(make_device("d1", 90.0));
    writer.enqueue_device_state(make_device("d2", 80.0));
    writer.enqueue_device_state(make_device("d1", 70.0));
    writer.enqueue_device_state(make_device("d1", 60.0));
    REQUIRE(writer.pending_count() == 2);

    writer.start();
    writer.flush();

    REQUIRE(persistence->call_count(StoreOperation::UpsertDevice) == 2);
    REQUIRE(persistence->device("d1")->battery_percent == Approx(60.0));
    REQUIRE(persistence->device("d2")->battery_percent == Approx(80.0));
    REQUIRE(writer.written_count() == 2);
    REQUIRE(writer.lost_count() == 0);
}

TEST_CASE("PersistenceWriter bounds its queue and sheds device states before alerts") {
    auto persistence = std::make_shared<MemoryPersistence>();
    PersistenceConfig config = k_fast_retries;
    config.max_queue_size = 3;
    PersistenceWriter writer{persistence, config};

    writer.enqueue_device_state(make_device("d1", 90.0));
    writer.enqueue_device_state(make_device("d2", 90.0));
    writer.enqueue_alert(make_alert("a1"));
    REQUIRE(writer.pending_count() == 3);

    writer.enqueue_device_state(make_device("d3", 90.0));
    REQUIRE(writer.lost_count() == 1);

    writer.enqueue_alert(make_alert("a2"));
    REQUIRE(writer.pending_count() == 3);
    REQUIRE(writer.lost_count() == 2);

    writer.enqueue_device_state(make_device("d2", 40.0));
    REQUIRE(writer.pending_count() == 3);

    writer.enqueue_alert(make_alert("a3"));
    writer.enqueue_alert(make_alert("a4"));
    REQUIRE(writer.pending_count() == 3);
    REQUIRE(writer.lost_count() == 4);

    writer.start();
    writer.flush();

    REQUIRE(persistence->alerts().size() == 3);
    REQUIRE_FALSE(persistence->device("d1").has_value());
    REQUIRE_FALSE(persistence->device("d2").has_value());
    REQUIRE_FALSE(persistence->device("d3").has_value());
    REQUIRE(writer.written_count() == 3);
}

TEST_CASE("PersistenceWriter refuses records once stopped") {
    auto persistence = std::make_shared<MemoryPersistence>();
    PersistenceWriter writer{persistence, k_fast_retries};
    writer.start();
    writer.stop();

    writer.enqueue_alert(make_alert("late"));
    writer.enqueue_device_state(make_device("d1", 50.0));

    REQUIRE(writer.lost_count() == 2);
    REQUIRE(writer.pending_count() == 0);
    REQUIRE(persistence->alerts().empty());
    REQUIRE(persistence->call_count(StoreOperation::UpsertDevice) == 0);
}

TEST_CASE("PersistenceWriter counts records abandoned by a writer that never ran") {
    auto persistence = std::make_shared<MemoryPersistence>();
    PersistenceWriter writer{persistence, k_fast_retries};
    writer.enqueue_alert(make_alert("a1"));
    writer.enqueue_device_state(make_device("d1", 50.0));

    writer.stop();

    REQUIRE(writer.lost_count() == 2);
    REQUIRE(persistence->alerts().empty());
}

TEST_CASE("PersistenceWriter::run_once makes a single attempt") {
    auto persistence = std::make_shared<MemoryPersistence>();
    persistence->fail_next(StoreOperation::LoadDevice, 3);

    Device loaded{};
    const StoreResult result = PersistenceWriter::run_once([&persistence, &loaded]() { return persistence->load_device("d1", loaded); });
    REQUIRE_FALSE(result);
    REQUIRE(result.retryable());
    REQUIRE(persistence->call_count(StoreOperation::LoadDevice) == 1);
}

TEST_CASE("PersistenceWriter rejects invalid construction") {
    REQUIRE_THROWS_AS(PersistenceWriter(nullptr, k_fast_retries), std::invalid_argument);
    PersistenceConfig no_attempts = k_fast_retries;
    no_attempts.max_attempts = 0;
    REQUIRE_THROWS_AS(PersistenceWriter(std::make_shared<MemoryPersistence>(), no_attempts), std::invalid_argument);
    PersistenceConfig no_queue = k_fast_retries;
    no_queue.max_queue_size = 0;
    REQUIRE_THROWS_AS(PersistenceWriter(std::make_shared<MemoryPersistence>(), no_queue), std::invalid_argument);
}
