#include "geo_sentinel/clock.hpp"

namespace geo_sentinel {

TimePoint SystemClock::now() const {
    return WallClock::now();
}

ManualClock::ManualClock(TimePoint start)
    : current_(start) {}

TimePoint ManualClock::now() const {
    std::scoped_lock lock(mutex_);
    return current_;
}

void ManualClock::advance(WallClock::duration delta) {
    std::scoped_lock lock(mutex_);
    current_ += delta;
}

void ManualClock::set(TimePoint instant) {
    std::scoped_lock lock(mutex_);
    current_ = instant;
}

}  // namespace geo_sentinel
