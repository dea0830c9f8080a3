#include "geo_sentinel/fanout_hub.hpp"

#include <algorithm>
#include <stdexcept>

#include "geo_sentinel/errors.hpp"

namespace geo_sentinel {

const std::string& event_device_id(const HubEvent& event) noexcept {
    if (const Alert* alert = std::get_if<Alert>(&event)) {
        return alert->device_id;
    }
    return std::get<DeviceStateDelta>(event).device.device_id;
}

SubscriberFilter SubscriberFilter::all_devices() {
    return SubscriberFilter{};
}

SubscriberFilter SubscriberFilter::only(DeviceIdSet device_ids) {
    SubscriberFilter filter{};
    filter.device_ids = std::move(device_ids);
    return filter;
}

bool SubscriberFilter::matches(const std::string& device_id) const {
    if (!device_ids.has_value()) {
        return true;
    }
    return device_ids->count(device_id) > 0;
}

std::string_view to_string(SubscriberState state) noexcept {
    switch (state) {
        case SubscriberState::Connected:
            return "connected";
        case SubscriberState::Draining:
            return "draining";
        case SubscriberState::Closed:
            return "closed";
    }
    return "unknown";
}

SubscriberChannel::SubscriberChannel(SubscriptionId id, SubscriberFilter filter, std::size_t capacity)
    : id_(id),
      filter_(std::move(filter)),
      capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("SubscriberChannel capacity must be positive");
    }
}

SubscriptionId SubscriberChannel::id() const noexcept {
    return id_;
}

const SubscriberFilter& SubscriberChannel::filter() const noexcept {
    return filter_;
}

OfferOutcome SubscriberChannel::offer(const HubEvent& event) {
    OfferOutcome outcome = OfferOutcome::Queued;
    {
        std::scoped_lock lock(mutex_);
        if (state_ != SubscriberState::Connected) {
            return OfferOutcome::NotConnected;
        }

        if (queue_events_.size() >= capacity_) {
            auto iterator_pending = queue_events_.end();
            if (std::holds_alternative<DeviceStateDelta>(event)) {
                const std::string& device_id = event_device_id(event);
                iterator_pending = std::find_if(queue_events_.begin(), queue_events_.end(), [&device_id](const HubEvent& pending) {
                    return std::holds_alternative<DeviceStateDelta>(pending) && event_device_id(pending) == device_id;
                });
            }
            if (iterator_pending == queue_events_.end()) {
                state_ = SubscriberState::Draining;
                close_reason_ = CloseReason::Overloaded;
                outcome = OfferOutcome::Overloaded;
            } else {
                queue_events_.erase(iterator_pending);
                ++coalesced_count_;
                outcome = OfferOutcome::Coalesced;
            }
        }
        if (outcome != OfferOutcome::Overloaded) {
            queue_events_.push_back(event);
        }
    }
    condition_available_.notify_all();
    return outcome;
}

HubEvent SubscriberChannel::pop_locked() {
    HubEvent event = std::move(queue_events_.front());
    queue_events_.pop_front();
    if (state_ == SubscriberState::Draining && queue_events_.empty()) {
        state_ = SubscriberState::Closed;
    }
    return event;
}

std::optional<HubEvent> SubscriberChannel::try_next() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    return pop_locked();
}

std::optional<HubEvent> SubscriberChannel::next(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    const bool ready = condition_available_.wait_for(lock, timeout, [this]() {
        return !queue_events_.empty() || state_ != SubscriberState::Connected;
    });
    if (!ready || queue_events_.empty()) {
        return std::nullopt;
    }
    return pop_locked();
}

void SubscriberChannel::close(CloseReason reason) {
    {
        std::scoped_lock lock(mutex_);
        if (state_ == SubscriberState::Closed) {
            return;
        }
        state_ = SubscriberState::Closed;
        if (close_reason_ == CloseReason::None) {
            close_reason_ = reason;
        }
        queue_events_.clear();
    }
    condition_available_.notify_all();
}

SubscriberState SubscriberChannel::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

CloseReason SubscriberChannel::close_reason() const {
    std::scoped_lock lock(mutex_);
    return close_reason_;
}

std::size_t SubscriberChannel::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

std::size_t SubscriberChannel::coalesced_count() const {
    std::scoped_lock lock(mutex_);
    return coalesced_count_;
}

FanoutHub::FanoutHub(FanoutConfig config)
    : config_(config),
      logger_(get_logger()) {
    if (config_.queue_capacity == 0) {
        throw std::invalid_argument("FanoutHub queue capacity must be positive");
    }
}

SubscriberChannelPtr FanoutHub::subscribe(SubscriberFilter filter) {
    const SubscriptionId id = next_id_.fetch_add(1);
    auto channel = std::make_shared<SubscriberChannel>(id, std::move(filter), config_.queue_capacity);
    {
        std::unique_lock lock(mutex_);
        map_subscribers_.emplace(id, channel);
    }
    logger_->info(
        R"({{"component":"fanout","action":"subscribe","subscription":{},"scope":"{}"}})",
        id,
        channel->filter().device_ids.has_value() ? "device_set" : "all_devices"
    );
    return channel;
}

bool FanoutHub::unsubscribe(SubscriptionId id) {
    SubscriberChannelPtr channel;
    {
        std::unique_lock lock(mutex_);
        const auto iterator_channel = map_subscribers_.find(id);
        if (iterator_channel == map_subscribers_.end()) {
            return false;
        }
        channel = std::move(iterator_channel->second);
        map_subscribers_.erase(iterator_channel);
    }
    channel->close(CloseReason::Unsubscribed);
    logger_->info(R"({{"component":"fanout","action":"unsubscribe","subscription":{}}})", id);
    return true;
}

void FanoutHub::publish(const HubEvent& event) {
    std::vector<SubscriberChannelPtr> list_targets;
    {
        std::shared_lock lock(mutex_);
        list_targets.reserve(map_subscribers_.size());
        for (const auto& [id, channel] : map_subscribers_) {
            list_targets.push_back(channel);
        }
    }

    const std::string& device_id = event_device_id(event);
    std::vector<SubscriptionId> list_disconnected;
    for (const SubscriberChannelPtr& channel : list_targets) {
        if (!channel->filter().matches(device_id)) {
            continue;
        }
        switch (channel->offer(event)) {
            case OfferOutcome::Queued:
            case OfferOutcome::Coalesced:
                break;
            case OfferOutcome::Overloaded:
                ++overloaded_count_;
                logger_->warn(
                    R"({{"component":"fanout","error":"{}","subscription":{},"device":"{}","pending":{}}})",
                    to_string(ErrorKind::SubscriberOverloaded),
                    channel->id(),
                    device_id,
                    channel->pending()
                );
                list_disconnected.push_back(channel->id());
                break;
            case OfferOutcome::NotConnected:
                list_disconnected.push_back(channel->id());
                break;
        }
    }

    if (!list_disconnected.empty()) {
        forget(list_disconnected);
    }
}

void FanoutHub::forget(const std::vector<SubscriptionId>& ids) {
    std::unique_lock lock(mutex_);
    for (const SubscriptionId id : ids) {
        if (map_subscribers_.erase(id) > 0) {
            logger_->info(R"({{"component":"fanout","action":"disconnect","subscription":{}}})", id);
        }
    }
}

void FanoutHub::close_all() {
    std::unordered_map<SubscriptionId, SubscriberChannelPtr> map_closing;
    {
        std::unique_lock lock(mutex_);
        map_closing.swap(map_subscribers_);
    }
    for (const auto& [id, channel] : map_closing) {
        channel->close(CloseReason::Shutdown);
    }
}

std::size_t FanoutHub::subscriber_count() const {
    std::shared_lock lock(mutex_);
    return map_subscribers_.size();
}

std::size_t FanoutHub::overloaded_count() const noexcept {
    return overloaded_count_.load();
}

}  // namespace geo_sentinel
