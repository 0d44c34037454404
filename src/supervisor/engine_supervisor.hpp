/*
 * engine_supervisor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-07

Description: Lifecycle supervisor for a journey-planning engine process

**************************************************/

#ifndef WAYFARER_SUPERVISOR_ENGINE_SUPERVISOR_HPP
#define WAYFARER_SUPERVISOR_ENGINE_SUPERVISOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "clock.hpp"
#include "engine_profile.hpp"
#include "graph_workspace.hpp"
#include "line_classifier.hpp"
#include "port_allocator.hpp"
#include "types.hpp"

#include "config/supervisor_config.hpp"
#include "fetch/data_fetcher.hpp"

namespace wayfarer::supervisor {

/**
 * @brief Supervisor event callback type
 *
 * Invoked after every state change with the new state and a short detail
 * message. Called without internal locks held, from the thread that caused
 * the change.
 */
using SupervisorEventCallback =
    std::function<void(SupervisorState, const std::string&)>;

/**
 * @brief Drives an engine through graph build and serve phases
 *
 * Manages one engine with:
 * - Input preparation through a DataFetcher
 * - Graph build with completion/error markers and freeze detection
 * - Port allocation with retry after bind failures
 * - Serve startup detection and liveness monitoring
 * - Guaranteed process cleanup on stop, failure and destruction
 *
 * start() runs on the caller's thread until the engine is serving or has
 * failed. Once Running, a watch thread keeps monitoring the engine until
 * stop() is called or the engine exits.
 */
class EngineSupervisor {
public:
    /**
     * @brief Construct supervisor
     * @param config Supervisor configuration
     * @param fetcher Source of missing inputs, none disables fetching
     * @param profile Engine profile, derived from config.engine when null
     * @param clock Time source, steady clock when null
     * @throws ConfigError if the configuration is invalid
     */
    explicit EngineSupervisor(config::SupervisorConfig config,
                              std::shared_ptr<fetch::DataFetcher> fetcher = nullptr,
                              std::shared_ptr<EngineProfile> profile = nullptr,
                              std::shared_ptr<Clock> clock = nullptr);

    /**
     * @brief Destructor - ensures the engine is stopped
     */
    ~EngineSupervisor();

    EngineSupervisor(const EngineSupervisor&) = delete;
    EngineSupervisor& operator=(const EngineSupervisor&) = delete;

    // ==================== Lifecycle ====================

    /**
     * @brief Prepare inputs, build the graph if needed and start serving
     *
     * Blocks until the engine is Running, the build failed, startup failed,
     * or stop() cancelled the attempt.
     *
     * @return Running, BuildFailed, Failed or Stopped
     * @throws InvalidStateError if called after a failure without reset(),
     *         or while another start() is in progress
     */
    auto start() -> SupervisorState;

    /**
     * @brief Stop the engine, cancelling a start() in progress
     *
     * Safe from any state and from any thread; repeated calls return the
     * same state.
     *
     * Only a start() that has already begun is cancelled. A stop() that
     * returns Idle leaves nothing pending, so a later start() runs normally.
     *
     * @return Resulting state
     */
    auto stop() -> SupervisorState;

    /**
     * @brief Return to Idle after a failure or stop
     * @throws InvalidStateError while an engine is starting or running
     */
    void reset();

    // ==================== Status ====================

    [[nodiscard]] auto state() const -> SupervisorState;

    [[nodiscard]] auto status() const -> SupervisorStatus;

    /**
     * @brief Serve port, only while Running or Frozen
     */
    [[nodiscard]] auto port() const -> std::optional<int>;

    /**
     * @brief Failure that ended the last start() or serve phase
     */
    [[nodiscard]] auto failure() const -> std::optional<FailureInfo>;

    [[nodiscard]] auto config() const -> const config::SupervisorConfig& {
        return config_;
    }

    [[nodiscard]] auto workspace() const -> const GraphWorkspace& {
        return workspace_;
    }

    // ==================== Events ====================

    void setEventCallback(SupervisorEventCallback callback);

private:
    struct PhaseRun;
    using RunPtr = std::shared_ptr<PhaseRun>;

    enum class BuildResult { GraphReady, BuildFailed, Failed, Cancelled };
    enum class ServeResult { Running, Retry, Failed, Cancelled };

    auto runStartup() -> SupervisorState;

    /**
     * @brief Create workspace, fetch missing inputs, check the engine
     * @return Launch context and whether a cached graph can be used
     * @throws FetchError, LaunchError
     */
    auto prepare(bool& graphCached) -> LaunchContext;

    auto runBuild(const LaunchContext& context) -> BuildResult;
    auto runServeAttempt(LaunchContext context, int attempt) -> ServeResult;

    auto allocatePorts() -> std::vector<int>;

    /**
     * @brief Spawn the phase process and its output monitor
     * @throws LaunchError
     */
    auto launch(Phase phase, const LaunchContext& context) -> RunPtr;

    /**
     * @brief Detach the current run from status and tear it down
     */
    void releaseRun(bool terminate = true);

    void watchLoop();
    void checkLiveness(PhaseRun& run, Clock::time_point& nextProbe,
                       int& probeFailures);
    void joinWatchThread();

    auto transition(SupervisorState to, const std::string& detail = "")
        -> bool;

    /**
     * @brief Record a failure, tear down the run and enter a terminal state
     */
    void fail(SupervisorState terminal, FailureReason reason,
              const std::string& detail, std::optional<Phase> phase);

    void markGraphBuilt();

    /**
     * @brief Tear down after stop() interrupted start()
     */
    auto finishCancelled() -> SupervisorState;

    [[nodiscard]] auto cancelled() const -> bool { return cancel_.load(); }
    [[nodiscard]] auto isWorkerThread() const -> bool;

    config::SupervisorConfig config_;
    std::shared_ptr<fetch::DataFetcher> fetcher_;
    std::shared_ptr<EngineProfile> profile_;
    std::shared_ptr<Clock> clock_;
    LineClassifier classifier_;
    GraphWorkspace workspace_;
    PortAllocator allocator_;

    mutable std::mutex mutex_;
    SupervisorState state_{SupervisorState::Idle};
    std::optional<Phase> phase_;
    Clock::time_point phaseStart_;
    std::optional<FailureInfo> failure_;
    std::optional<int> port_;
    std::optional<int> securePort_;
    bool portMismatch_{false};
    int serveAttempts_{0};
    FailureReason frozenReason_{FailureReason::None};
    std::string frozenDetail_;
    RunPtr run_;
    std::vector<std::string> lastOutput_;  ///< Output of the released run

    std::mutex startMutex_;
    std::mutex stopMutex_;
    std::condition_variable startDone_;
    bool startActive_{false};
    std::thread::id startThread_;
    std::atomic<bool> cancel_{false};

    std::mutex watchMutex_;  ///< Guards watchThread_
    std::thread watchThread_;
    std::thread::id watchThreadId_;  ///< Guarded by mutex_
    std::atomic<bool> watchStop_{false};
    std::atomic<bool> deferredStop_{false};  ///< stop() came from a callback

    std::mutex callbackMutex_;
    SupervisorEventCallback eventCallback_;
};

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_ENGINE_SUPERVISOR_HPP
