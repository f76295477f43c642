// Crumble Platform Layer
// clock.cpp - Game clock sources implementation

#include <crumble/platform/clock.hpp>

namespace crumble::platform {

SteadyClock::SteadyClock() : start_time_(ClockType::now()) {}

void SteadyClock::reset() {
    start_time_ = ClockType::now();
}

core::Seconds SteadyClock::now() const {
    return std::chrono::duration<core::Seconds>(ClockType::now() - start_time_).count();
}

void ManualClock::advance(core::Seconds seconds) {
    // Time never runs backwards
    if (seconds > 0.0) {
        now_ += seconds;
    }
}

}  // namespace crumble::platform
