// === Persistence Writer ======================================================
//
// Background worker that moves alert and device-state writes off the ingest
// path. Each record is retried with bounded exponential backoff; a record
// that exhausts its attempts is logged as lost from durable storage and
// counted, never re-thrown to the producer.
//
// The queue is bounded. Device states still waiting for the worker are
// coalesced per device so only the newest copy is written. When the queue is
// full the oldest pending device state is dropped to make room for an alert,
// and an incoming device state is dropped outright. Records offered after
// stop() are refused. Every dropped or refused record counts as lost.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>

#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/persistence.hpp"

namespace geo_sentinel {

/** @brief Retry policy applied to every persistence call. */
struct PersistenceConfig final {
    int max_attempts{5};
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{5'000};
    std::size_t max_queue_size{10'000}; /**< Records waiting for the worker, alerts and device states together. */
};

/** @brief Delay before retry number @p attempt (0-based): initial * 2^attempt, capped. */
[[nodiscard]] std::chrono::milliseconds compute_backoff(const PersistenceConfig& config, int attempt);

class PersistenceWriter final {
  public:
    PersistenceWriter(PersistenceGatewayPtr gateway, PersistenceConfig config);
    ~PersistenceWriter();

    PersistenceWriter(const PersistenceWriter&) = delete;
    PersistenceWriter& operator=(const PersistenceWriter&) = delete;

    /** @brief Launch the worker thread. Records enqueued before start() wait for it. */
    void start();
    /**
     * @brief Drain outstanding records, then join the worker.
     *
     * Records still queued because the worker never ran are counted as lost.
     */
    void stop();

    void enqueue_alert(Alert alert);
    void enqueue_device_state(Device device);

    /** @brief Block until every record enqueued so far was written or given up. */
    void flush();

    /**
     * @brief Run @p operation synchronously under the retry policy.
     *
     * Returns the last result; definitive (non-retryable) results return
     * immediately.
     */
    StoreResult run_with_retry(const std::function<StoreResult()>& operation, const std::string& operation_name);

    /** @brief Single attempt for callers that cannot wait out a backoff; exceptions become InternalError. */
    static StoreResult run_once(const std::function<StoreResult()>& operation);

    [[nodiscard]] std::size_t written_count() const noexcept;
    [[nodiscard]] std::size_t lost_count() const noexcept;
    /** @brief Records currently waiting for the worker. */
    [[nodiscard]] std::size_t pending_count();

  private:
    /** @brief Queue slot of a device state; the payload lives in map_pending_devices_. */
    struct PendingDeviceState final {
        std::string device_id;
    };
    using PendingRecord = std::variant<Alert, PendingDeviceState>;
    using WriteRecord = std::variant<Alert, Device>;

    void worker_loop();
    void write_record(const WriteRecord& record);
    /** @brief Sleep for @p delay unless stop() is requested first. */
    void wait_backoff(std::chrono::milliseconds delay);
    /** @brief Drop the oldest queued device state. Caller holds mutex_. */
    bool evict_oldest_device_state();
    /** @brief Count and log a record that will never be written. */
    void discard(const std::string& description, const char* reason);

    PersistenceGatewayPtr gateway_;
    PersistenceConfig config_;
    std::mutex mutex_;
    std::condition_variable condition_work_;
    std::condition_variable condition_idle_;
    std::deque<PendingRecord> queue_records_;
    std::unordered_map<std::string, Device> map_pending_devices_;
    std::size_t in_flight_{0};
    bool flag_stopping_{false};
    std::atomic<bool> flag_running_{false};
    std::atomic<std::size_t> written_count_{0};
    std::atomic<std::size_t> lost_count_{0};
    std::thread worker_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_sentinel
