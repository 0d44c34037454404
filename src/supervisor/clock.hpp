/*
 * clock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Injectable monotonic clock used for freeze detection

**************************************************/

#ifndef WAYFARER_SUPERVISOR_CLOCK_HPP
#define WAYFARER_SUPERVISOR_CLOCK_HPP

#include <chrono>
#include <memory>

namespace wayfarer::supervisor {

/**
 * @brief Monotonic time source
 *
 * Timeouts, freeze detection and phase timing all read time through this
 * interface so that tests can simulate long silences without waiting.
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;
    using rep = duration::rep;

    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> time_point = 0;
};

class SteadyClock : public Clock {
public:
    [[nodiscard]] auto now() const -> time_point override {
        return std::chrono::steady_clock::now();
    }
};

[[nodiscard]] inline auto defaultClock() -> std::shared_ptr<Clock> {
    static auto clock = std::make_shared<SteadyClock>();
    return clock;
}

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_CLOCK_HPP
