#include "round_clock.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace raffle {

Timestamp SystemClock::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
}

void ManualClock::warp(Timestamp to) {
    if (to < now_) {
        throw std::invalid_argument("ManualClock cannot move backwards");
    }
    now_ = to;
}

void ManualClock::advance(std::uint64_t seconds) {
    if (seconds > std::numeric_limits<Timestamp>::max() - now_) {
        throw std::overflow_error("ManualClock advance overflows timestamp");
    }
    now_ += seconds;
}

RoundClock::RoundClock(Timestamp startedAt, std::uint64_t intervalSeconds)
    : startedAt_(startedAt)
    , intervalSeconds_(intervalSeconds) {
    if (intervalSeconds_ == 0) {
        throw std::invalid_argument("Round interval must be positive");
    }
}

// A clock reading behind the round start counts as no time elapsed.
bool RoundClock::intervalElapsed(Timestamp now) const {
    if (now < startedAt_) {
        return false;
    }
    return now - startedAt_ >= intervalSeconds_;
}

std::uint64_t RoundClock::secondsRemaining(Timestamp now) const {
    if (intervalElapsed(now)) {
        return 0;
    }
    if (now < startedAt_) {
        return intervalSeconds_;
    }
    return intervalSeconds_ - (now - startedAt_);
}

} // namespace raffle
