/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Supervisor state machine table and type helpers

**************************************************/

#include "types.hpp"

#include "exceptions.hpp"

#include <fmt/format.h>

namespace wayfarer::supervisor {

auto toString(Phase phase) noexcept -> std::string_view {
    switch (phase) {
        case Phase::Build:
            return "build";
        case Phase::Serve:
            return "serve";
    }
    return "unknown";
}

auto toString(SupervisorState state) noexcept -> std::string_view {
    switch (state) {
        case SupervisorState::Idle:
            return "Idle";
        case SupervisorState::Preparing:
            return "Preparing";
        case SupervisorState::Building:
            return "Building";
        case SupervisorState::BuildFailed:
            return "BuildFailed";
        case SupervisorState::GraphReady:
            return "GraphReady";
        case SupervisorState::Starting:
            return "Starting";
        case SupervisorState::Running:
            return "Running";
        case SupervisorState::Frozen:
            return "Frozen";
        case SupervisorState::Stopped:
            return "Stopped";
        case SupervisorState::Failed:
            return "Failed";
    }
    return "Unknown";
}

auto toString(FailureReason reason) noexcept -> std::string_view {
    switch (reason) {
        case FailureReason::None:
            return "None";
        case FailureReason::FetchError:
            return "FetchError";
        case FailureReason::LaunchError:
            return "LaunchError";
        case FailureReason::PortUnavailable:
            return "PortUnavailable";
        case FailureReason::EngineError:
            return "EngineError";
        case FailureReason::FreezeTimeout:
            return "FreezeTimeout";
        case FailureReason::DeadlineExceeded:
            return "DeadlineExceeded";
        case FailureReason::UnexpectedExit:
            return "UnexpectedExit";
    }
    return "Unknown";
}

auto toString(ServeLivenessPolicy policy) noexcept -> std::string_view {
    switch (policy) {
        case ServeLivenessPolicy::ProcessAlive:
            return "process_alive";
        case ServeLivenessPolicy::OutputActivity:
            return "output_activity";
        case ServeLivenessPolicy::TcpProbe:
            return "tcp_probe";
    }
    return "process_alive";
}

auto livenessPolicyFromString(std::string_view name)
    -> std::optional<ServeLivenessPolicy> {
    if (name == "process_alive") return ServeLivenessPolicy::ProcessAlive;
    if (name == "output_activity") return ServeLivenessPolicy::OutputActivity;
    if (name == "tcp_probe") return ServeLivenessPolicy::TcpProbe;
    return std::nullopt;
}

auto canTransition(SupervisorState from, SupervisorState to) noexcept
    -> bool {
    using S = SupervisorState;

    // Unrecoverable launcher/allocator errors may fail any live state
    if (to == S::Failed) {
        return from != S::Failed && from != S::BuildFailed &&
               from != S::Stopped && from != S::Idle;
    }
    // stop() cancels anything that is not already terminal
    if (to == S::Stopped) {
        return isStartingUp(from) || from == S::Running || from == S::Frozen;
    }

    switch (from) {
        case S::Idle:
            return to == S::Preparing;
        case S::Stopped:
            return to == S::Preparing || to == S::Idle;
        case S::Preparing:
            return to == S::Building || to == S::GraphReady;
        case S::Building:
            return to == S::GraphReady || to == S::BuildFailed;
        case S::GraphReady:
            return to == S::Starting;
        case S::Starting:
            // Relaunch on a fresh port after a bind failure
            return to == S::Running || to == S::Starting;
        case S::Running:
            return to == S::Frozen;
        case S::Frozen:
            return to == S::Running;
        case S::BuildFailed:
        case S::Failed:
            return to == S::Idle;
    }
    return false;
}

void FailureInfo::raise() const {
    switch (reason) {
        case FailureReason::None:
            return;
        case FailureReason::FetchError:
            throw FetchError(detail);
        case FailureReason::LaunchError:
            throw LaunchError(detail);
        case FailureReason::PortUnavailable:
            throw PortUnavailable(0, detail);
        case FailureReason::FreezeTimeout:
        case FailureReason::DeadlineExceeded:
            throw FreezeTimeout(elapsed, detail);
        case FailureReason::EngineError:
        case FailureReason::UnexpectedExit:
            throw EngineError(detail);
    }
}

auto FailureInfo::summary() const -> std::string {
    std::string text = fmt::format(
        "{} during {} phase after {}ms: {}", toString(reason),
        phase ? toString(*phase) : std::string_view{"prepare"},
        elapsed.count(), detail);
    if (exitCode) {
        text += fmt::format(" (exit code {})", *exitCode);
    }
    return text;
}

}  // namespace wayfarer::supervisor
