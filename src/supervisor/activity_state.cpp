/*
 * activity_state.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Activity state implementation

**************************************************/

#include "activity_state.hpp"

namespace wayfarer::supervisor {

namespace {

auto toMillis(Clock::rep ticks) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::duration(ticks));
}

}  // namespace

ActivityState::ActivityState(std::shared_ptr<Clock> clock,
                             std::chrono::milliseconds quietThreshold)
    : clock_(clock ? std::move(clock) : defaultClock()),
      quietThreshold_(quietThreshold),
      lastOutput_(clock_->now().time_since_epoch().count()) {}

void ActivityState::touch() {
    auto now = clock_->now().time_since_epoch().count();
    auto previous = lastOutput_.load();
    while (now > previous &&
           !lastOutput_.compare_exchange_weak(previous, now)) {
    }

    if (now > previous) {
        auto gap = now - previous;
        if (gap > longestGap_.load()) {
            longestGap_ = gap;
        }
        if (Clock::duration(gap) > quietThreshold_) {
            cumulativeIdle_ += gap;
        }
    }
    ++lineCount_;
}

auto ActivityState::lastOutput() const -> Clock::time_point {
    return Clock::time_point(Clock::duration(lastOutput_.load()));
}

auto ActivityState::idleFor() const -> std::chrono::milliseconds {
    auto idle = clock_->now() - lastOutput();
    if (idle < Clock::duration::zero()) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(idle);
}

auto ActivityState::cumulativeIdle() const -> std::chrono::milliseconds {
    return toMillis(cumulativeIdle_.load());
}

auto ActivityState::longestGap() const -> std::chrono::milliseconds {
    return toMillis(longestGap_.load());
}

auto ActivityState::lineCount() const -> std::uint64_t {
    return lineCount_.load();
}

}  // namespace wayfarer::supervisor
