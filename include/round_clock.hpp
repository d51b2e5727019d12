#pragma once

#include "raffle_types.hpp"

#include <memory>

namespace raffle {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

// Test and simulation clock; time only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 1) : now_(start) {}

    Timestamp now() const override { return now_; }
    void warp(Timestamp to);
    void advance(std::uint64_t seconds);

private:
    Timestamp now_;
};

using ClockPtr = std::shared_ptr<const Clock>;

class RoundClock {
public:
    RoundClock(Timestamp startedAt, std::uint64_t intervalSeconds);

    bool intervalElapsed(Timestamp now) const;
    std::uint64_t secondsRemaining(Timestamp now) const;
    void reset(Timestamp now) { startedAt_ = now; }

    Timestamp getStartedAt() const { return startedAt_; }
    std::uint64_t getInterval() const { return intervalSeconds_; }

private:
    Timestamp startedAt_;
    std::uint64_t intervalSeconds_;
};

} // namespace raffle
