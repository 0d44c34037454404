/*
 * activity_state.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Output activity bookkeeping used by freeze detection

**************************************************/

#ifndef WAYFARER_SUPERVISOR_ACTIVITY_STATE_HPP
#define WAYFARER_SUPERVISOR_ACTIVITY_STATE_HPP

#include "clock.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace wayfarer::supervisor {

/**
 * @brief Tracks when the engine last produced output
 *
 * Written by the output monitor thread only; every getter is safe to call
 * concurrently. The last-output timestamp never moves backwards.
 */
class ActivityState {
public:
    /**
     * @param clock Time source
     * @param quietThreshold Gaps longer than this count towards cumulative
     *        idle time
     */
    explicit ActivityState(
        std::shared_ptr<Clock> clock,
        std::chrono::milliseconds quietThreshold = std::chrono::seconds(1));

    /**
     * @brief Record one line of output at the current time
     */
    void touch();

    [[nodiscard]] auto lastOutput() const -> Clock::time_point;

    /**
     * @brief Time since the last output (or since construction)
     */
    [[nodiscard]] auto idleFor() const -> std::chrono::milliseconds;

    [[nodiscard]] auto cumulativeIdle() const -> std::chrono::milliseconds;

    [[nodiscard]] auto longestGap() const -> std::chrono::milliseconds;

    [[nodiscard]] auto lineCount() const -> std::uint64_t;

    [[nodiscard]] auto clock() const -> const std::shared_ptr<Clock>& {
        return clock_;
    }

private:
    std::shared_ptr<Clock> clock_;
    Clock::duration quietThreshold_;

    std::atomic<Clock::rep> lastOutput_;
    std::atomic<Clock::rep> cumulativeIdle_{0};
    std::atomic<Clock::rep> longestGap_{0};
    std::atomic<std::uint64_t> lineCount_{0};
};

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_ACTIVITY_STATE_HPP
