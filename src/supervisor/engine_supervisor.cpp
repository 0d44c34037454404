/*
 * engine_supervisor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-07

Description: Engine supervisor state machine implementation

**************************************************/

#include "engine_supervisor.hpp"

#include "activity_state.hpp"
#include "engine_process.hpp"
#include "event_queue.hpp"
#include "exceptions.hpp"
#include "output_monitor.hpp"
#include "process_reaper.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace wayfarer::supervisor {

namespace fs = std::filesystem;

namespace {

/// How long the reader may take to collect output after the process exits
constexpr auto EOF_GRACE = std::chrono::milliseconds(1000);

/// Upper bound for one TCP liveness probe
constexpr auto MAX_PROBE_TIMEOUT = std::chrono::milliseconds(2000);

auto toMillis(Clock::duration duration) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
}

auto toSeconds(Clock::duration duration) -> long long {
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

/**
 * @brief Wait for the first event, then take everything already queued
 */
auto collectEvents(MonitorQueue& queue, std::chrono::milliseconds wait)
    -> std::vector<MonitorEvent> {
    std::vector<MonitorEvent> events;
    if (auto first = queue.waitPop(wait)) {
        events.push_back(std::move(*first));
        auto rest = queue.drain();
        std::move(rest.begin(), rest.end(), std::back_inserter(events));
    }
    return events;
}

}  // namespace

/**
 * @brief Everything that lives exactly as long as one engine process
 *
 * The destructor closes the queue, stops the reader and then terminates the
 * process, so a run that goes out of scope on any path leaves nothing behind.
 */
struct EngineSupervisor::PhaseRun {
    PhaseRun(Phase runPhase, const std::shared_ptr<Clock>& clock,
             std::chrono::milliseconds stopGrace)
        : phase(runPhase),
          activity(clock),
          started(clock->now()),
          grace(stopGrace) {}

    ~PhaseRun() {
        queue.close();
        if (monitor) {
            monitor->stop();
        }
        if (process) {
            process->terminate(grace);
        }
    }

    PhaseRun(const PhaseRun&) = delete;
    PhaseRun& operator=(const PhaseRun&) = delete;

    /**
     * @brief Terminate the process and let the reader drain its output
     * @return Exit code of the process
     */
    auto shutdown() -> int {
        int code = process->terminate(grace);
        monitor->waitForEof(EOF_GRACE);
        monitor->stop();
        queue.close();
        return code;
    }

    Phase phase;
    MonitorQueue queue;
    ActivityState activity;
    Clock::time_point started;
    std::chrono::milliseconds grace;
    std::unique_ptr<EngineProcess> process;
    std::unique_ptr<OutputMonitor> monitor;
};

EngineSupervisor::EngineSupervisor(config::SupervisorConfig config,
                                   std::shared_ptr<fetch::DataFetcher> fetcher,
                                   std::shared_ptr<EngineProfile> profile,
                                   std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      fetcher_(std::move(fetcher)),
      profile_(profile ? std::move(profile)
                       : makeEngineProfile(config_.engine)),
      clock_(clock ? std::move(clock) : defaultClock()),
      classifier_(profile_->markers()),
      workspace_(config_.graphRoot, config_.graphName),
      allocator_(config_.portRange) {
    if (auto error = config_.validate(); !error.empty()) {
        throw ConfigError(error);
    }
    phaseStart_ = clock_->now();
    ProcessReaper::instance().installExitHook();

    spdlog::debug("Engine supervisor created for {} graph '{}' in {}",
                  profile_->name(), workspace_.name(),
                  workspace_.directory().string());
}

EngineSupervisor::~EngineSupervisor() {
    stop();
    joinWatchThread();
}

// ==================== Lifecycle ====================

auto EngineSupervisor::start() -> SupervisorState {
    std::unique_lock startLock(startMutex_, std::try_to_lock);
    if (!startLock.owns_lock()) {
        throw InvalidStateError("start() is already in progress",
                                toString(state()));
    }

    {
        std::lock_guard lock(mutex_);
        if (state_ == SupervisorState::Failed ||
            state_ == SupervisorState::BuildFailed) {
            throw InvalidStateError("call reset() after a failure",
                                    toString(state_));
        }
        if (state_ == SupervisorState::Running ||
            state_ == SupervisorState::Frozen) {
            return state_;
        }
    }

    // A previous serve session may have ended on its own
    joinWatchThread();

    {
        std::lock_guard lock(mutex_);
        cancel_ = false;
        watchStop_ = false;
        deferredStop_ = false;
        failure_.reset();
        port_.reset();
        securePort_.reset();
        portMismatch_ = false;
        serveAttempts_ = 0;
        frozenReason_ = FailureReason::None;
        frozenDetail_.clear();
        startActive_ = true;
        startThread_ = std::this_thread::get_id();
    }

    SupervisorState result;
    try {
        result = runStartup();
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error while starting engine: {}", e.what());
        std::optional<Phase> phase;
        {
            std::lock_guard lock(mutex_);
            phase = phase_;
        }
        fail(SupervisorState::Failed, FailureReason::LaunchError, e.what(),
             phase);
        result = state();
    }

    {
        std::lock_guard lock(mutex_);
        startActive_ = false;
        startThread_ = {};
    }
    startDone_.notify_all();
    return result;
}

auto EngineSupervisor::stop() -> SupervisorState {
    if (isWorkerThread()) {
        // Called from an event callback; the worker finishes the teardown
        deferredStop_ = true;
        cancel_ = true;
        watchStop_ = true;
        return state();
    }

    std::lock_guard stopLock(stopMutex_);

    cancel_ = true;
    watchStop_ = true;
    {
        std::unique_lock lock(mutex_);
        if (run_) {
            run_->queue.push(MonitorEvent{MonitorEvent::Kind::Wakeup, {},
                                          std::nullopt, clock_->now()});
        }
        startDone_.wait(lock, [this] { return !startActive_; });
    }

    joinWatchThread();
    releaseRun(true);

    auto current = state();
    if (current == SupervisorState::Running ||
        current == SupervisorState::Frozen) {
        transition(SupervisorState::Stopped, "stopped on request");
    }
    return state();
}

void EngineSupervisor::reset() {
    std::unique_lock startLock(startMutex_, std::try_to_lock);
    if (!startLock.owns_lock()) {
        throw InvalidStateError("cannot reset while start() is in progress",
                                toString(state()));
    }

    {
        std::lock_guard lock(mutex_);
        if (isStartingUp(state_) || state_ == SupervisorState::Running ||
            state_ == SupervisorState::Frozen) {
            throw InvalidStateError("stop() the engine before reset()",
                                    toString(state_));
        }
        if (state_ == SupervisorState::Idle) {
            return;
        }
    }

    joinWatchThread();
    releaseRun(true);

    {
        std::lock_guard lock(mutex_);
        failure_.reset();
        port_.reset();
        securePort_.reset();
        portMismatch_ = false;
        serveAttempts_ = 0;
        lastOutput_.clear();
    }
    transition(SupervisorState::Idle, "reset");
}

// ==================== Status ====================

auto EngineSupervisor::state() const -> SupervisorState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto EngineSupervisor::status() const -> SupervisorStatus {
    SupervisorStatus status;
    std::lock_guard lock(mutex_);

    status.state = state_;
    status.phase = phase_;
    if (failure_) {
        status.reason = failure_->reason;
        status.detail = failure_->detail;
        status.exitCode = failure_->exitCode;
    } else if (state_ == SupervisorState::Frozen) {
        status.reason = frozenReason_;
        status.detail = frozenDetail_;
    }
    status.port = port_;
    status.securePort = securePort_;
    status.portMismatch = portMismatch_;
    status.serveAttempts = serveAttempts_;
    status.elapsed = toMillis(clock_->now() - phaseStart_);

    if (run_) {
        if (!run_->process->exitCode()) {
            status.pid = run_->process->pid();
        }
        status.recentOutput = run_->monitor->recentLines();
    } else {
        status.recentOutput = lastOutput_;
    }
    if (!status.recentOutput.empty()) {
        status.lastLine = status.recentOutput.back();
    }
    return status;
}

auto EngineSupervisor::port() const -> std::optional<int> {
    std::lock_guard lock(mutex_);
    if (state_ == SupervisorState::Running ||
        state_ == SupervisorState::Frozen) {
        return port_;
    }
    return std::nullopt;
}

auto EngineSupervisor::failure() const -> std::optional<FailureInfo> {
    std::lock_guard lock(mutex_);
    return failure_;
}

void EngineSupervisor::setEventCallback(SupervisorEventCallback callback) {
    std::lock_guard lock(callbackMutex_);
    eventCallback_ = std::move(callback);
}

// ==================== Startup ====================

auto EngineSupervisor::runStartup() -> SupervisorState {
    transition(SupervisorState::Preparing);

    bool graphCached = false;
    LaunchContext context;
    try {
        context = prepare(graphCached);
    } catch (const FetchError& e) {
        fail(SupervisorState::Failed, FailureReason::FetchError, e.what(),
             std::nullopt);
        return state();
    } catch (const LaunchError& e) {
        fail(SupervisorState::Failed, FailureReason::LaunchError, e.what(),
             std::nullopt);
        return state();
    }

    if (cancelled()) {
        return finishCancelled();
    }

    if (graphCached) {
        transition(SupervisorState::GraphReady, "using previously built graph");
    } else {
        {
            std::lock_guard lock(mutex_);
            phase_ = Phase::Build;
        }
        transition(SupervisorState::Building);

        switch (runBuild(context)) {
            case BuildResult::GraphReady:
                markGraphBuilt();
                transition(SupervisorState::GraphReady);
                break;
            case BuildResult::BuildFailed:
            case BuildResult::Failed:
                return state();
            case BuildResult::Cancelled:
                return finishCancelled();
        }
    }

    if (cancelled()) {
        return finishCancelled();
    }

    for (int attempt = 1;; ++attempt) {
        switch (runServeAttempt(context, attempt)) {
            case ServeResult::Retry:
                continue;
            case ServeResult::Running: {
                std::lock_guard watchLock(watchMutex_);
                watchThread_ = std::thread([this] { watchLoop(); });
                std::lock_guard lock(mutex_);
                watchThreadId_ = watchThread_.get_id();
                return state_;
            }
            case ServeResult::Failed:
                return state();
            case ServeResult::Cancelled:
                return finishCancelled();
        }
    }
}

auto EngineSupervisor::prepare(bool& graphCached) -> LaunchContext {
    workspace_.create();
    auto manifest = workspace_.loadManifest();
    auto now = std::chrono::system_clock::now();

    // Engine distribution
    if (auto artifact = profile_->engineArtifact();
        artifact && !fs::exists(*artifact)) {
        auto url = profile_->downloadUrl();
        if (!url.empty()) {
            if (!fetcher_) {
                throw FetchError("engine " + artifact->string() +
                                 " is missing and no fetcher is configured");
            }
            spdlog::info("Downloading {} engine from {}", profile_->name(),
                         url);
            fetcher_->fetchEngine(url, *artifact);
        }
    }
    if (auto problem = profile_->validate(); !problem.empty()) {
        throw LaunchError(problem);
    }

    // Inputs
    std::string boxText = config_.bbox ? config_.bbox->toString() : "";
    bool boxChanged = config_.bbox && !manifest.bbox.empty() &&
                      manifest.bbox != boxText;
    if (boxChanged) {
        spdlog::info("Bounding box changed from {} to {}, refreshing inputs",
                     manifest.bbox, boxText);
    }

    auto maps = workspace_.findMapExtracts();
    auto feeds = workspace_.findTransitFeeds();
    bool needMap = maps.empty() || boxChanged;
    bool needTransit = config_.fetch.fetchTransit &&
                       (feeds.empty() || boxChanged ||
                        !manifest.transitFetchedAt);
    bool canFetch = config_.fetchInputs && fetcher_ && config_.bbox;
    bool inputsFetched = false;

    if (canFetch && (needMap || needTransit)) {
        const auto& dir = workspace_.directory();
        if (needMap && needTransit) {
            auto result = fetcher_->fetch(*config_.bbox, dir,
                                          config_.fetch.requireTransit);
            maps = {result.mapExtract};
            manifest.mapFile = result.mapExtract.filename().string();
            manifest.mapFetchedAt = now;
            inputsFetched = true;
            if (!result.transitFeeds.empty()) {
                manifest.transitFiles.clear();
                for (const auto& feed : result.transitFeeds) {
                    manifest.transitFiles.push_back(
                        feed.filename().string());
                }
                manifest.transitFetchedAt = now;
            }
        } else if (needMap) {
            auto map = fetcher_->fetchMapExtract(*config_.bbox, dir);
            maps = {map};
            manifest.mapFile = map.filename().string();
            manifest.mapFetchedAt = now;
            inputsFetched = true;
        } else {
            try {
                auto fetched = fetcher_->fetchTransitFeeds(*config_.bbox, dir);
                manifest.transitFiles.clear();
                for (const auto& feed : fetched) {
                    manifest.transitFiles.push_back(feed.filename().string());
                }
                manifest.transitFetchedAt = now;
                // An empty feed list leaves the graph inputs unchanged
                inputsFetched = !fetched.empty();
            } catch (const FetchError& e) {
                if (config_.fetch.requireTransit) {
                    throw;
                }
                spdlog::warn("Continuing without transit feeds: {}", e.what());
            }
        }
        manifest.bbox = boxText;
        workspace_.saveManifest(manifest);
    }

    if (maps.empty()) {
        throw FetchError(fmt::format(
            "no map extract in {} and {}", workspace_.directory().string(),
            config_.bbox ? "no data fetcher to download one"
                         : "no bounding box to download one for"));
    }

    LaunchContext context;
    context.graphRoot = fs::absolute(workspace_.root());
    context.graphDirectory = fs::absolute(workspace_.directory());
    context.graphName = workspace_.name();
    context.mapExtract = fs::absolute(maps.back());

    std::error_code ec;
    graphCached = !config_.rebuildGraph && !inputsFetched &&
                  manifest.graphBuiltAt.has_value() &&
                  manifest.engine == profile_->name() &&
                  fs::exists(profile_->graphArtifact(context), ec);
    if (graphCached) {
        spdlog::info("Reusing {} graph built at {}", profile_->name(),
                     formatTimestamp(*manifest.graphBuiltAt));
    }
    return context;
}

auto EngineSupervisor::launch(Phase phase, const LaunchContext& context)
    -> RunPtr {
    auto run = std::make_shared<PhaseRun>(phase, clock_,
                                          config_.stopGracePeriod);
    run->process = EngineProcess::spawn(profile_->buildCommand(phase, context));

    OutputMonitorOptions options;
    options.historySize = config_.outputHistory;
    if (config_.logging.teeEngineOutput) {
        options.logFile = workspace_.engineLogFile(phase);
    }
    run->monitor = std::make_unique<OutputMonitor>(
        *run->process, phase, classifier_, run->activity, run->queue, options);
    run->monitor->start();

    std::lock_guard lock(mutex_);
    run_ = run;
    lastOutput_.clear();
    return run;
}

auto EngineSupervisor::runBuild(const LaunchContext& context) -> BuildResult {
    RunPtr run;
    try {
        run = launch(Phase::Build, context);
    } catch (const LaunchError& e) {
        fail(SupervisorState::Failed, FailureReason::LaunchError, e.what(),
             Phase::Build);
        return BuildResult::Failed;
    }

    std::optional<Clock::time_point> completedAt;
    std::optional<std::string> engineError;

    auto absorb = [&](std::vector<MonitorEvent> events) {
        for (auto& event : events) {
            if (event.kind == MonitorEvent::Kind::BuildComplete &&
                !completedAt) {
                completedAt = event.timestamp;
                spdlog::info("Graph build reported completion");
            } else if ((event.kind == MonitorEvent::Kind::EngineError ||
                        event.kind == MonitorEvent::Kind::BindFailure) &&
                       !engineError) {
                engineError = std::move(event.line);
            }
        }
    };

    while (true) {
        absorb(collectEvents(run->queue, config_.pollInterval));

        if (engineError) {
            fail(SupervisorState::BuildFailed, FailureReason::EngineError,
                 *engineError, Phase::Build);
            return BuildResult::BuildFailed;
        }
        if (cancelled()) {
            return BuildResult::Cancelled;
        }

        if (auto code = run->process->poll()) {
            run->monitor->waitForEof(EOF_GRACE);
            absorb(run->queue.drain());

            if (engineError) {
                fail(SupervisorState::BuildFailed, FailureReason::EngineError,
                     *engineError, Phase::Build);
                return BuildResult::BuildFailed;
            }
            if (completedAt && *code == 0) {
                releaseRun(false);
                return BuildResult::GraphReady;
            }
            fail(SupervisorState::BuildFailed, FailureReason::UnexpectedExit,
                 completedAt
                     ? fmt::format("build exited with code {} after "
                                   "reporting completion",
                                   *code)
                     : fmt::format("build exited with code {} before the "
                                   "graph was written",
                                   *code),
                 Phase::Build);
            return BuildResult::BuildFailed;
        }

        auto now = clock_->now();
        // A marker delivered since the last wait is decided before any timeout
        bool wasComplete = completedAt.has_value();
        absorb(run->queue.drain());
        if (engineError || (completedAt && !wasComplete)) {
            continue;
        }
        if (completedAt) {
            if (now - *completedAt > config_.idleTimeout) {
                spdlog::warn("Build process still running {}s after writing "
                             "the graph, terminating it",
                             toSeconds(now - *completedAt));
                releaseRun(true);
                return BuildResult::GraphReady;
            }
            continue;
        }

        if (auto idle = run->activity.idleFor(); idle > config_.idleTimeout) {
            fail(SupervisorState::BuildFailed, FailureReason::FreezeTimeout,
                 fmt::format("no build output for {}s (limit {}s)",
                             toSeconds(idle), config_.idleTimeout.count()),
                 Phase::Build);
            return BuildResult::BuildFailed;
        }
        if (config_.buildDeadline.count() > 0 &&
            now - run->started > config_.buildDeadline) {
            fail(SupervisorState::BuildFailed, FailureReason::DeadlineExceeded,
                 fmt::format("build did not finish within {}s",
                             config_.buildDeadline.count()),
                 Phase::Build);
            return BuildResult::BuildFailed;
        }
    }
}

auto EngineSupervisor::allocatePorts() -> std::vector<int> {
    int count = profile_->portsRequired();
    if (config_.port && config_.securePort && count > 1) {
        return {allocator_.allocate(config_.port),
                allocator_.allocate(config_.securePort)};
    }
    return allocator_.allocateMany(count, config_.port);
}

auto EngineSupervisor::runServeAttempt(LaunchContext context, int attempt)
    -> ServeResult {
    {
        std::lock_guard lock(mutex_);
        phase_ = Phase::Serve;
        serveAttempts_ = attempt;
    }
    transition(SupervisorState::Starting,
               attempt > 1 ? fmt::format("attempt {}", attempt) : "");

    try {
        context.ports = allocatePorts();
    } catch (const PortUnavailable& e) {
        fail(SupervisorState::Failed, FailureReason::PortUnavailable,
             e.what(), Phase::Serve);
        return ServeResult::Failed;
    }
    {
        std::lock_guard lock(mutex_);
        port_ = context.ports[0];
        securePort_ = context.ports.size() > 1
                          ? std::optional<int>(context.ports[1])
                          : std::nullopt;
        portMismatch_ = false;
    }

    RunPtr run;
    try {
        run = launch(Phase::Serve, context);
    } catch (const LaunchError& e) {
        fail(SupervisorState::Failed, FailureReason::LaunchError, e.what(),
             Phase::Serve);
        return ServeResult::Failed;
    }

    std::optional<MonitorEvent> ready;
    std::optional<std::string> engineError;
    std::optional<std::string> bindFailure;

    auto absorb = [&](std::vector<MonitorEvent> events) {
        for (auto& event : events) {
            switch (event.kind) {
                case MonitorEvent::Kind::ServeReady:
                    if (!ready) {
                        ready = std::move(event);
                    }
                    break;
                case MonitorEvent::Kind::BindFailure:
                    if (!bindFailure) {
                        bindFailure = std::move(event.line);
                    }
                    break;
                case MonitorEvent::Kind::EngineError:
                    if (!engineError) {
                        engineError = std::move(event.line);
                    }
                    break;
                default:
                    break;
            }
        }
    };

    // Bind failures and engine errors, in that order, end the attempt
    auto handleErrors = [&]() -> std::optional<ServeResult> {
        if (bindFailure) {
            bool dynamic = !config_.port.has_value();
            if (dynamic && attempt <= config_.maxBindRetries) {
                spdlog::warn("Engine could not bind port {} ({}), retrying "
                             "with a new port ({}/{})",
                             context.ports[0], *bindFailure, attempt,
                             config_.maxBindRetries);
                releaseRun(true);
                return ServeResult::Retry;
            }
            fail(SupervisorState::Failed, FailureReason::PortUnavailable,
                 *bindFailure, Phase::Serve);
            return ServeResult::Failed;
        }
        if (engineError) {
            fail(SupervisorState::Failed, FailureReason::EngineError,
                 *engineError, Phase::Serve);
            return ServeResult::Failed;
        }
        return std::nullopt;
    };

    while (true) {
        absorb(collectEvents(run->queue, config_.pollInterval));

        if (auto result = handleErrors()) {
            return *result;
        }

        if (ready) {
            int allocated = context.ports[0];
            if (ready->port && *ready->port != allocated) {
                spdlog::warn("Engine reports port {} but was given {}, "
                             "using the reported port",
                             *ready->port, allocated);
                std::lock_guard lock(mutex_);
                portMismatch_ = true;
                port_ = *ready->port;
            }
            transition(SupervisorState::Running,
                       fmt::format("serving on port {}",
                                   ready->port.value_or(allocated)));
            return ServeResult::Running;
        }

        if (cancelled()) {
            return ServeResult::Cancelled;
        }

        if (auto code = run->process->poll()) {
            run->monitor->waitForEof(EOF_GRACE);
            absorb(run->queue.drain());
            if (auto result = handleErrors()) {
                return *result;
            }
            fail(SupervisorState::Failed, FailureReason::UnexpectedExit,
                 fmt::format("serve process exited with code {} before it "
                             "was ready",
                             *code),
                 Phase::Serve);
            return ServeResult::Failed;
        }

        auto now = clock_->now();
        absorb(run->queue.drain());
        if (ready || bindFailure || engineError) {
            continue;
        }
        if (auto idle = run->activity.idleFor(); idle > config_.idleTimeout) {
            fail(SupervisorState::Failed, FailureReason::FreezeTimeout,
                 fmt::format("no startup output for {}s (limit {}s)",
                             toSeconds(idle), config_.idleTimeout.count()),
                 Phase::Serve);
            return ServeResult::Failed;
        }
        if (config_.startupDeadline.count() > 0 &&
            now - run->started > config_.startupDeadline) {
            fail(SupervisorState::Failed, FailureReason::DeadlineExceeded,
                 fmt::format("engine was not ready within {}s",
                             config_.startupDeadline.count()),
                 Phase::Serve);
            return ServeResult::Failed;
        }
    }
}

auto EngineSupervisor::finishCancelled() -> SupervisorState {
    releaseRun(true);
    transition(SupervisorState::Stopped, "start cancelled");
    return state();
}

void EngineSupervisor::markGraphBuilt() {
    auto manifest = workspace_.loadManifest();
    manifest.engine = std::string(profile_->name());
    manifest.graphBuiltAt = std::chrono::system_clock::now();
    if (config_.bbox && manifest.bbox.empty()) {
        manifest.bbox = config_.bbox->toString();
    }
    try {
        workspace_.saveManifest(manifest);
    } catch (const LaunchError& e) {
        spdlog::warn("Graph built but manifest not updated: {}", e.what());
    }
}

void EngineSupervisor::releaseRun(bool terminate) {
    RunPtr run;
    {
        std::lock_guard lock(mutex_);
        run.swap(run_);
        if (run) {
            lastOutput_ = run->monitor->recentLines();
        }
    }
    if (run && terminate) {
        run->shutdown();
    }
}

// ==================== Serving ====================

void EngineSupervisor::watchLoop() {
    RunPtr run;
    {
        std::lock_guard lock(mutex_);
        run = run_;
    }
    if (!run) {
        return;
    }

    spdlog::debug("Watching engine process {} ({} liveness)",
                  run->process->pid(), toString(config_.livenessPolicy));

    auto nextProbe = clock_->now() + config_.healthCheckInterval;
    int probeFailures = 0;

    while (!watchStop_) {
        auto events = collectEvents(run->queue, config_.pollInterval);
        if (watchStop_) {
            break;
        }

        for (const auto& event : events) {
            if (event.kind == MonitorEvent::Kind::EngineError) {
                spdlog::error("Engine reported an error while serving: {}",
                              event.line);
            }
        }

        if (auto code = run->process->poll()) {
            run->monitor->waitForEof(EOF_GRACE);
            fail(SupervisorState::Failed, FailureReason::UnexpectedExit,
                 fmt::format("serve process exited with code {}", *code),
                 Phase::Serve);
            return;
        }

        checkLiveness(*run, nextProbe, probeFailures);
    }

    if (deferredStop_) {
        run.reset();
        releaseRun(true);
        auto current = state();
        if (current == SupervisorState::Running ||
            current == SupervisorState::Frozen) {
            transition(SupervisorState::Stopped, "stopped on request");
        }
    }
}

void EngineSupervisor::checkLiveness(PhaseRun& run,
                                     Clock::time_point& nextProbe,
                                     int& probeFailures) {
    auto current = state();

    switch (config_.livenessPolicy) {
        case ServeLivenessPolicy::ProcessAlive:
            return;

        case ServeLivenessPolicy::OutputActivity: {
            auto idle = run.activity.idleFor();
            bool silent = idle > config_.freezeTimeout;
            if (silent && current == SupervisorState::Running) {
                auto detail = fmt::format("no output for {}s (limit {}s)",
                                          toSeconds(idle),
                                          config_.freezeTimeout.count());
                {
                    std::lock_guard lock(mutex_);
                    frozenReason_ = FailureReason::FreezeTimeout;
                    frozenDetail_ = detail;
                }
                spdlog::warn("Engine appears frozen: {}", detail);
                transition(SupervisorState::Frozen, detail);
            } else if (!silent && current == SupervisorState::Frozen) {
                transition(SupervisorState::Running, "output resumed");
            }
            return;
        }

        case ServeLivenessPolicy::TcpProbe: {
            auto now = clock_->now();
            if (now < nextProbe) {
                return;
            }
            nextProbe = now + config_.healthCheckInterval;

            auto servePort = port();
            if (!servePort) {
                return;
            }
            auto timeout = std::min<std::chrono::milliseconds>(
                config_.healthCheckInterval, MAX_PROBE_TIMEOUT);
            if (PortAllocator::probe(config_.probeHost, *servePort, timeout)) {
                probeFailures = 0;
                if (current == SupervisorState::Frozen) {
                    transition(SupervisorState::Running, "probe succeeded");
                }
                return;
            }

            ++probeFailures;
            spdlog::debug("Liveness probe {}:{} failed ({}/{})",
                          config_.probeHost, *servePort, probeFailures,
                          config_.maxProbeFailures);
            if (probeFailures >= config_.maxProbeFailures &&
                current == SupervisorState::Running) {
                auto detail = fmt::format("{} consecutive failed probes of "
                                          "port {}",
                                          probeFailures, *servePort);
                {
                    std::lock_guard lock(mutex_);
                    frozenReason_ = FailureReason::FreezeTimeout;
                    frozenDetail_ = detail;
                }
                spdlog::warn("Engine appears frozen: {}", detail);
                transition(SupervisorState::Frozen, detail);
            }
            return;
        }
    }
}

void EngineSupervisor::joinWatchThread() {
    std::lock_guard watchLock(watchMutex_);
    if (watchThread_.joinable() &&
        watchThread_.get_id() != std::this_thread::get_id()) {
        watchThread_.join();
        std::lock_guard lock(mutex_);
        watchThreadId_ = {};
    }
}

// ==================== Internals ====================

auto EngineSupervisor::transition(SupervisorState to,
                                  const std::string& detail) -> bool {
    SupervisorState from;
    {
        std::lock_guard lock(mutex_);
        from = state_;
        if (!canTransition(from, to)) {
            spdlog::error("Rejected engine state transition {} -> {}",
                          toString(from), toString(to));
            return false;
        }
        state_ = to;
        phaseStart_ = clock_->now();
        if (to == SupervisorState::Idle) {
            phase_.reset();
        }
    }

    if (detail.empty()) {
        spdlog::info("Engine {} -> {}", toString(from), toString(to));
    } else {
        spdlog::info("Engine {} -> {}: {}", toString(from), toString(to),
                     detail);
    }

    SupervisorEventCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = eventCallback_;
    }
    if (callback) {
        try {
            callback(to, detail);
        } catch (const std::exception& e) {
            spdlog::error("Engine event callback threw: {}", e.what());
        }
    }
    return true;
}

void EngineSupervisor::fail(SupervisorState terminal, FailureReason reason,
                            const std::string& detail,
                            std::optional<Phase> phase) {
    FailureInfo info;
    info.reason = reason;
    info.phase = phase;
    info.detail = detail;

    RunPtr run;
    Clock::time_point since;
    {
        std::lock_guard lock(mutex_);
        run = run_;
        since = phaseStart_;
    }

    if (run) {
        // Killed before the failure is recorded
        info.exitCode = run->shutdown();
        info.elapsed = toMillis(clock_->now() - run->started);
        info.recentOutput = run->monitor->recentLines();
        run.reset();
        releaseRun(false);
    } else {
        info.elapsed = toMillis(clock_->now() - since);
        std::lock_guard lock(mutex_);
        info.recentOutput = lastOutput_;
    }

    {
        std::lock_guard lock(mutex_);
        failure_ = info;
    }
    spdlog::error("Engine failed: {}", info.summary());
    for (const auto& line : info.recentOutput) {
        spdlog::debug("  | {}", line);
    }
    transition(terminal, detail);
}

auto EngineSupervisor::isWorkerThread() const -> bool {
    auto self = std::this_thread::get_id();
    std::lock_guard lock(mutex_);
    return (startActive_ && self == startThread_) || self == watchThreadId_;
}

}  // namespace wayfarer::supervisor
