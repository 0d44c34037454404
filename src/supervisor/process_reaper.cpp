/*
 * process_reaper.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Process reaper implementation

**************************************************/

#include "process_reaper.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <thread>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wayfarer::supervisor {

namespace {

constexpr auto EXIT_GRACE = std::chrono::milliseconds(1000);

}  // namespace

auto ProcessReaper::instance() -> ProcessReaper& {
    static ProcessReaper reaper;
    return reaper;
}

bool ProcessReaper::track(pid_t pgid) noexcept {
    if (pgid <= 0) {
        return false;
    }
    for (auto& slot : slots_) {
        pid_t expected = 0;
        if (slot.compare_exchange_strong(expected, pgid)) {
            return true;
        }
    }
    return false;
}

void ProcessReaper::untrack(pid_t pgid) noexcept {
    for (auto& slot : slots_) {
        pid_t expected = pgid;
        if (slot.compare_exchange_strong(expected, 0)) {
            return;
        }
    }
}

auto ProcessReaper::isTracked(pid_t pgid) const noexcept -> bool {
    for (const auto& slot : slots_) {
        if (slot.load() == pgid) {
            return true;
        }
    }
    return false;
}

auto ProcessReaper::trackedCount() const noexcept -> std::size_t {
    std::size_t count = 0;
    for (const auto& slot : slots_) {
        if (slot.load() > 0) {
            ++count;
        }
    }
    return count;
}

void ProcessReaper::installExitHook() {
    bool expected = false;
    if (!exitHookInstalled_.compare_exchange_strong(expected, true)) {
        return;
    }
    if (std::atexit(&ProcessReaper::onExit) != 0) {
        spdlog::warn("Failed to register engine cleanup exit hook");
        exitHookInstalled_ = false;
    }
}

void ProcessReaper::killAll(int signal) noexcept {
    for (auto& slot : slots_) {
        pid_t pgid = slot.load();
        if (pgid > 0) {
            ::kill(-pgid, signal);
        }
    }
}

void ProcessReaper::reapAll() noexcept {
    if (trackedCount() == 0) {
        return;
    }

    killAll(SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + EXIT_GRACE;
    while (std::chrono::steady_clock::now() < deadline) {
        bool anyAlive = false;
        for (auto& slot : slots_) {
            pid_t pgid = slot.load();
            if (pgid <= 0) {
                continue;
            }
            pid_t result = ::waitpid(pgid, nullptr, WNOHANG);
            if (result == pgid || (result < 0 && errno == ECHILD)) {
                ::kill(-pgid, SIGKILL);  // stragglers left in the group
                untrack(pgid);
            } else {
                anyAlive = true;
            }
        }
        if (!anyAlive) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    for (auto& slot : slots_) {
        pid_t pgid = slot.exchange(0);
        if (pgid > 0) {
            ::kill(-pgid, SIGKILL);
            ::waitpid(pgid, nullptr, 0);
        }
    }
}

void ProcessReaper::onExit() { instance().reapAll(); }

}  // namespace wayfarer::supervisor
