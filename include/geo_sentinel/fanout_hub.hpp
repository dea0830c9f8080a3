// === Subscription Fanout Hub =================================================
//
// Owns the registry of live subscribers and hands every state delta and
// alert to the ones whose filter matches. Each subscriber is an explicit
// bounded channel: publishing never blocks, the consumer pulls at its own
// pace, and overflow is handled per subscriber:
//
// - a new state delta replaces the pending delta of the same device (the old
//   one is removed and the new one appended so per-device order holds);
// - an alert, or a delta with nothing to coalesce, that does not fit moves
//   the subscriber to Draining. It accepts nothing further, its consumer may
//   read what is already queued, and it is Closed once empty. The client is
//   expected to resynchronise on reconnect.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "geo_sentinel/logging.hpp"
#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

/** @brief Live device record pushed after every accepted ping or offline flip. */
struct DeviceStateDelta final {
    Device device{};
    std::vector<std::string> inside_geofence_ids{}; /**< Current containment decisions. */
    TimePoint source_timestamp{};                   /**< Ping timestamp; offline flips reuse the last ping timestamp. */
};

using HubEvent = std::variant<DeviceStateDelta, Alert>;

/** @brief Device the event concerns. */
[[nodiscard]] const std::string& event_device_id(const HubEvent& event) noexcept;

/** @brief Device predicate supplied by the identity layer. */
struct SubscriberFilter final {
    std::optional<DeviceIdSet> device_ids{}; /**< nullopt matches every device. */

    [[nodiscard]] static SubscriberFilter all_devices();
    [[nodiscard]] static SubscriberFilter only(DeviceIdSet device_ids);
    [[nodiscard]] bool matches(const std::string& device_id) const;
};

enum class SubscriberState {
    Connected,
    Draining,
    Closed
};

enum class CloseReason {
    None,
    Unsubscribed,
    Overloaded,
    Shutdown
};

/** @brief What happened to one offered event. */
enum class OfferOutcome {
    Queued,
    Coalesced,    /**< Queued after replacing a pending delta of the same device. */
    Overloaded,   /**< Did not fit; the channel just moved to Draining. */
    NotConnected  /**< Channel is Draining or Closed and accepts nothing. */
};

[[nodiscard]] std::string_view to_string(SubscriberState state) noexcept;

using SubscriptionId = std::uint64_t;

/** @brief Bounded outbound queue for one subscriber. */
class SubscriberChannel final {
  public:
    SubscriberChannel(SubscriptionId id, SubscriberFilter filter, std::size_t capacity);

    [[nodiscard]] SubscriptionId id() const noexcept;
    [[nodiscard]] const SubscriberFilter& filter() const noexcept;

    /** @brief Non-blocking hand-off from the publisher. */
    OfferOutcome offer(const HubEvent& event);

    /** @brief Pop the next event without waiting. */
    [[nodiscard]] std::optional<HubEvent> try_next();
    /** @brief Pop the next event, waiting up to @p timeout. */
    [[nodiscard]] std::optional<HubEvent> next(std::chrono::milliseconds timeout);

    /** @brief Close immediately and discard queued events. */
    void close(CloseReason reason);

    [[nodiscard]] SubscriberState state() const;
    [[nodiscard]] CloseReason close_reason() const;
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t coalesced_count() const;

  private:
    /** @brief Pop the front event. Caller holds mutex_ and the queue is not empty. */
    HubEvent pop_locked();

    const SubscriptionId id_;
    const SubscriberFilter filter_;
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condition_available_;
    std::deque<HubEvent> queue_events_;
    SubscriberState state_{SubscriberState::Connected};
    CloseReason close_reason_{CloseReason::None};
    std::size_t coalesced_count_{0};
};

using SubscriberChannelPtr = std::shared_ptr<SubscriberChannel>;

struct FanoutConfig final {
    std::size_t queue_capacity{256};
};

class FanoutHub final {
  public:
    explicit FanoutHub(FanoutConfig config);

    /** @brief Register a subscriber; the returned channel is its event stream. */
    [[nodiscard]] SubscriberChannelPtr subscribe(SubscriberFilter filter);
    /** @brief Close and forget a subscriber; returns false when unknown. */
    bool unsubscribe(SubscriptionId id);

    /** @brief Offer @p event to every matching subscriber without blocking. */
    void publish(const HubEvent& event);

    /** @brief Close every subscriber, e.g. on engine shutdown. */
    void close_all();

    [[nodiscard]] std::size_t subscriber_count() const;
    [[nodiscard]] std::size_t overloaded_count() const noexcept;

  private:
    /** @brief Forget the given channels (already Draining or Closed). */
    void forget(const std::vector<SubscriptionId>& ids);

    FanoutConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<SubscriptionId, SubscriberChannelPtr> map_subscribers_;
    std::atomic<SubscriptionId> next_id_{1};
    std::atomic<std::size_t> overloaded_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_sentinel
