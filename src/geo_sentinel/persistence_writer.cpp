#include "geo_sentinel/persistence_writer.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>

namespace geo_sentinel {

namespace {

std::string describe(const Alert& alert) {
    return "alert " + alert.id + " (" + std::string{to_string(alert.kind)} + ", device " + alert.device_id + ")";
}

std::string describe(const Device& device) {
    return "device state " + device.device_id;
}

}  // namespace

std::chrono::milliseconds compute_backoff(const PersistenceConfig& config, int attempt) {
    const int bounded_attempt = std::clamp(attempt, 0, 30);
    const std::chrono::milliseconds scaled{config.initial_backoff.count() * (std::int64_t{1} << bounded_attempt)};
    return std::min(scaled, config.max_backoff);
}

PersistenceWriter::PersistenceWriter(PersistenceGatewayPtr gateway, PersistenceConfig config)
    : gateway_(std::move(gateway)),
      config_(config),
      logger_(get_logger()) {
    if (gateway_ == nullptr) {
        throw std::invalid_argument("PersistenceWriter requires a gateway");
    }
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument("PersistenceWriter max_attempts must be positive");
    }
    if (config_.max_queue_size == 0) {
        throw std::invalid_argument("PersistenceWriter max_queue_size must be positive");
    }
}

PersistenceWriter::~PersistenceWriter() {
    stop();
}

void PersistenceWriter::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        flag_stopping_ = false;
    }
    worker_thread_ = std::thread(&PersistenceWriter::worker_loop, this);
}

void PersistenceWriter::stop() {
    {
        std::scoped_lock lock(mutex_);
        flag_stopping_ = true;
    }
    condition_work_.notify_all();
    if (flag_running_.exchange(false) && worker_thread_.joinable()) {
        worker_thread_.join();
    }

    std::size_t abandoned_count = 0;
    {
        std::scoped_lock lock(mutex_);
        abandoned_count = queue_records_.size();
        queue_records_.clear();
        map_pending_devices_.clear();
    }
    condition_idle_.notify_all();
    if (abandoned_count > 0) {
        lost_count_ += abandoned_count;
        logger_->error(
            R"({{"component":"persistence","event":"record_lost","count":{},"error":"writer stopped before the records were written"}})",
            abandoned_count
        );
    }
}

void PersistenceWriter::enqueue_alert(Alert alert) {
    {
        std::scoped_lock lock(mutex_);
        if (flag_stopping_) {
            discard(describe(alert), "writer is stopped");
            return;
        }
        if (queue_records_.size() >= config_.max_queue_size && !evict_oldest_device_state()) {
            discard(describe(alert), "queue is full");
            return;
        }
        queue_records_.emplace_back(std::move(alert));
    }
    condition_work_.notify_one();
}

void PersistenceWriter::enqueue_device_state(Device device) {
    {
        std::scoped_lock lock(mutex_);
        if (flag_stopping_) {
            discard(describe(device), "writer is stopped");
            return;
        }
        const auto iterator_pending = map_pending_devices_.find(device.device_id);
        if (iterator_pending != map_pending_devices_.end()) {
            iterator_pending->second = std::move(device);
            return;
        }
        if (queue_records_.size() >= config_.max_queue_size) {
            discard(describe(device), "queue is full");
            return;
        }
        std::string device_id = device.device_id;
        map_pending_devices_.emplace(device_id, std::move(device));
        queue_records_.emplace_back(PendingDeviceState{std::move(device_id)});
    }
    condition_work_.notify_one();
}

bool PersistenceWriter::evict_oldest_device_state() {
    const auto iterator_oldest = std::find_if(queue_records_.begin(), queue_records_.end(), [](const PendingRecord& record) {
        return std::holds_alternative<PendingDeviceState>(record);
    });
    if (iterator_oldest == queue_records_.end()) {
        return false;
    }
    const std::string device_id = std::get<PendingDeviceState>(*iterator_oldest).device_id;
    queue_records_.erase(iterator_oldest);
    map_pending_devices_.erase(device_id);
    discard("device state " + device_id, "evicted for an alert while the queue is full");
    return true;
}

void PersistenceWriter::discard(const std::string& description, const char* reason) {
    ++lost_count_;
    logger_->error(
        R"({{"component":"persistence","event":"record_lost","record":"{}","error":"{}"}})",
        description,
        reason
    );
}

void PersistenceWriter::flush() {
    std::unique_lock lock(mutex_);
    condition_idle_.wait(lock, [this]() {
        return (queue_records_.empty() && in_flight_ == 0) || !flag_running_.load();
    });
}

std::size_t PersistenceWriter::written_count() const noexcept {
    return written_count_.load();
}

std::size_t PersistenceWriter::lost_count() const noexcept {
    return lost_count_.load();
}

std::size_t PersistenceWriter::pending_count() {
    std::scoped_lock lock(mutex_);
    return queue_records_.size();
}

StoreResult PersistenceWriter::run_once(const std::function<StoreResult()>& operation) {
    try {
        return operation();
    } catch (const std::exception& exc) {
        return StoreResult::error(StoreStatus::InternalError, exc.what());
    }
}

StoreResult PersistenceWriter::run_with_retry(const std::function<StoreResult()>& operation, const std::string& operation_name) {
    StoreResult result = StoreResult::error(StoreStatus::InternalError, "operation not attempted");
    for (int attempt = 0; attempt < config_.max_attempts; ++attempt) {
        result = run_once(operation);
        if (result || !result.retryable()) {
            return result;
        }
        logger_->warn(
            R"({{"component":"persistence","operation":"{}","attempt":{},"error":"{}"}})",
            operation_name,
            attempt + 1,
            result.message
        );
        if (attempt + 1 < config_.max_attempts) {
            wait_backoff(compute_backoff(config_, attempt));
        }
    }
    return result;
}

void PersistenceWriter::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock lock(mutex_);
    condition_work_.wait_for(lock, delay, [this]() { return flag_stopping_; });
}

void PersistenceWriter::worker_loop() {
    while (true) {
        WriteRecord record;
        {
            std::unique_lock lock(mutex_);
            condition_work_.wait(lock, [this]() { return flag_stopping_ || !queue_records_.empty(); });
            if (queue_records_.empty()) {
                break;
            }
            if (Alert* alert = std::get_if<Alert>(&queue_records_.front())) {
                record = std::move(*alert);
            } else {
                const auto iterator_device = map_pending_devices_.find(std::get<PendingDeviceState>(queue_records_.front()).device_id);
                record = std::move(iterator_device->second);
                map_pending_devices_.erase(iterator_device);
            }
            queue_records_.pop_front();
            ++in_flight_;
        }

        write_record(record);

        {
            std::scoped_lock lock(mutex_);
            --in_flight_;
        }
        condition_idle_.notify_all();
    }
    condition_idle_.notify_all();
}

void PersistenceWriter::write_record(const WriteRecord& record) {
    const std::string description = std::visit([](const auto& value) { return describe(value); }, record);
    const StoreResult result = run_with_retry(
        [this, &record]() {
            if (const Alert* alert = std::get_if<Alert>(&record)) {
                return gateway_->save_alert(*alert);
            }
            return gateway_->upsert_device_state(std::get<Device>(record));
        },
        std::holds_alternative<Alert>(record) ? "save_alert" : "upsert_device_state"
    );

    if (result) {
        ++written_count_;
        return;
    }
    ++lost_count_;
    logger_->error(
        R"({{"component":"persistence","event":"record_lost","record":"{}","error":"{}"}})",
        description,
        result.message
    );
}

}  // namespace geo_sentinel
