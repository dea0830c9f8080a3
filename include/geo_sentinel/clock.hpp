// === Clock ===================================================================
//
// Abstracts the wall clock so the staleness sweep, alert cool-down and
// receipt timestamps can be driven deterministically in tests and replays.

#pragma once

#include <memory>
#include <mutex>

#include "geo_sentinel/types.hpp"

namespace geo_sentinel {

/** @brief Source of "now" for every time-dependent decision in the engine. */
class Clock {
  public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

/** @brief Production clock backed by std::chrono::system_clock. */
class SystemClock final : public Clock {
  public:
    [[nodiscard]] TimePoint now() const override;
};

/** @brief Manually advanced clock for tests and deterministic replays. */
class ManualClock final : public Clock {
  public:
    explicit ManualClock(TimePoint start = TimePoint{});

    [[nodiscard]] TimePoint now() const override;

    /** @brief Move the clock forward by @p delta. */
    void advance(WallClock::duration delta);
    /** @brief Jump to an absolute instant. */
    void set(TimePoint instant);

  private:
    mutable std::mutex mutex_;
    TimePoint current_;
};

using ClockPtr = std::shared_ptr<Clock>;

}  // namespace geo_sentinel
