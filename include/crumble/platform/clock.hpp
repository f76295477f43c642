// Crumble Platform Layer
// clock.hpp - Game clock sources

#pragma once

#include <crumble/core/core.hpp>

#include <chrono>

namespace crumble::platform {

// Monotonic time source in seconds. Deadlines (hit acknowledgment) are
// stored as absolute values on this clock and polled against now().
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual core::Seconds now() const = 0;
};

// Wall clock time since construction/reset, steady_clock based
class SteadyClock final : public Clock {
public:
    using ClockType = std::chrono::steady_clock;
    using TimePoint = ClockType::time_point;

    SteadyClock();

    void reset();

    [[nodiscard]] core::Seconds now() const override;

private:
    TimePoint start_time_;
};

// Clock advanced explicitly by the caller (tick-driven replays, tests)
class ManualClock final : public Clock {
public:
    explicit ManualClock(core::Seconds start_seconds = 0.0) : now_(start_seconds) {}

    void advance(core::Seconds seconds);
    void set(core::Seconds seconds) { now_ = seconds; }

    [[nodiscard]] core::Seconds now() const override { return now_; }

private:
    core::Seconds now_;
};

}  // namespace crumble::platform
