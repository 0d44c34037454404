/*
 * process_reaper.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Process-wide cleanup hook for engine process groups

**************************************************/

#ifndef WAYFARER_SUPERVISOR_PROCESS_REAPER_HPP
#define WAYFARER_SUPERVISOR_PROCESS_REAPER_HPP

#include <array>
#include <atomic>
#include <cstddef>

#include <sys/types.h>

namespace wayfarer::supervisor {

/**
 * @brief Kills registered engine process groups when the host exits
 *
 * Every spawned engine registers its process group here and unregisters it
 * once reaped. An atexit hook kills whatever is still registered.
 *
 * Slots are plain atomics so tracking never takes a lock.
 */
class ProcessReaper {
public:
    static constexpr std::size_t MAX_TRACKED = 64;

    static auto instance() -> ProcessReaper&;

    ProcessReaper(const ProcessReaper&) = delete;
    ProcessReaper& operator=(const ProcessReaper&) = delete;

    /**
     * @brief Track a process group
     * @return false if every slot is taken
     */
    bool track(pid_t pgid) noexcept;

    void untrack(pid_t pgid) noexcept;

    [[nodiscard]] auto isTracked(pid_t pgid) const noexcept -> bool;

    [[nodiscard]] auto trackedCount() const noexcept -> std::size_t;

    /**
     * @brief Register the atexit hook (idempotent)
     */
    void installExitHook();

    /**
     * @brief Terminate every tracked group, escalating to SIGKILL
     */
    void reapAll() noexcept;

private:
    ProcessReaper() = default;

    void killAll(int signal) noexcept;

    static void onExit();

    std::array<std::atomic<pid_t>, MAX_TRACKED> slots_{};
    std::atomic<bool> exitHookInstalled_{false};
};

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_PROCESS_REAPER_HPP
