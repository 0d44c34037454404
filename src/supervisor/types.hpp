/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Engine supervisor states, phases and status types

**************************************************/

#ifndef WAYFARER_SUPERVISOR_TYPES_HPP
#define WAYFARER_SUPERVISOR_TYPES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace wayfarer::supervisor {

/**
 * @brief Engine invocation phase
 */
enum class Phase {
    Build,  ///< Offline graph build, expected to exit
    Serve   ///< Long-lived server, exit is anomalous
};

/**
 * @brief Lifecycle state of a supervised engine
 */
enum class SupervisorState {
    Idle,         ///< Constructed or reset, nothing running
    Preparing,    ///< Workspace and input data are being checked/fetched
    Building,     ///< Graph build process is running
    BuildFailed,  ///< Graph build failed (terminal until reset)
    GraphReady,   ///< Graph built, serve process not yet launched
    Starting,     ///< Serve process launched, waiting for ready marker
    Running,      ///< Engine reported it is serving
    Frozen,       ///< Engine alive but not making observable progress
    Stopped,      ///< Stopped on request, may be started again
    Failed        ///< Unrecoverable failure (terminal until reset)
};

/**
 * @brief Why the supervisor left the happy path
 */
enum class FailureReason {
    None,
    FetchError,
    LaunchError,
    PortUnavailable,
    EngineError,
    FreezeTimeout,
    DeadlineExceeded,
    UnexpectedExit
};

/**
 * @brief How liveness is judged once the engine is serving
 */
enum class ServeLivenessPolicy {
    ProcessAlive,    ///< Only process exit counts as a failure
    OutputActivity,  ///< Silence longer than the freeze timeout -> Frozen
    TcpProbe         ///< Repeated failed connects to the serve port -> Frozen
};

[[nodiscard]] auto toString(Phase phase) noexcept -> std::string_view;
[[nodiscard]] auto toString(SupervisorState state) noexcept
    -> std::string_view;
[[nodiscard]] auto toString(FailureReason reason) noexcept
    -> std::string_view;
[[nodiscard]] auto toString(ServeLivenessPolicy policy) noexcept
    -> std::string_view;

[[nodiscard]] auto livenessPolicyFromString(std::string_view name)
    -> std::optional<ServeLivenessPolicy>;

/**
 * @brief Check whether the state machine permits a transition
 */
[[nodiscard]] auto canTransition(SupervisorState from,
                                 SupervisorState to) noexcept -> bool;

/**
 * @brief True for states a start() call ends in
 */
[[nodiscard]] constexpr auto isStartOutcome(SupervisorState state) noexcept
    -> bool {
    return state == SupervisorState::Running ||
           state == SupervisorState::BuildFailed ||
           state == SupervisorState::Failed ||
           state == SupervisorState::Stopped;
}

/**
 * @brief True while a start() call is driving the engine up
 */
[[nodiscard]] constexpr auto isStartingUp(SupervisorState state) noexcept
    -> bool {
    return state == SupervisorState::Preparing ||
           state == SupervisorState::Building ||
           state == SupervisorState::GraphReady ||
           state == SupervisorState::Starting;
}

/**
 * @brief Details of the failure that ended the last start() or serve phase
 */
struct FailureInfo {
    FailureReason reason{FailureReason::None};
    std::optional<Phase> phase;
    std::string detail;
    std::optional<int> exitCode;
    std::chrono::milliseconds elapsed{0};
    std::vector<std::string> recentOutput;

    /**
     * @brief Throw the exception type matching the failure reason
     * @throws SupervisorError subclass; does nothing when reason is None
     */
    void raise() const;

    [[nodiscard]] auto summary() const -> std::string;
};

/**
 * @brief Snapshot of the supervisor returned by status()
 */
struct SupervisorStatus {
    SupervisorState state{SupervisorState::Idle};
    std::optional<Phase> phase;
    FailureReason reason{FailureReason::None};
    std::string detail;
    std::string lastLine;  ///< Last classified output line
    std::vector<std::string> recentOutput;
    std::optional<int> port;
    std::optional<int> securePort;
    std::optional<pid_t> pid;
    std::optional<int> exitCode;
    std::chrono::milliseconds elapsed{0};  ///< Time spent in current phase
    bool portMismatch{false};  ///< Engine bound a port other than allocated
    int serveAttempts{0};      ///< Serve launches for the current start()
};

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_TYPES_HPP
