/*
 * test_engine_supervisor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-09

Description: Lifecycle tests for EngineSupervisor using shell-scripted
engines

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "supervisor/engine_supervisor.hpp"
#include "supervisor_test_helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace wayfarer::supervisor;
using namespace wayfarer::test;
using namespace std::chrono_literals;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

constexpr auto BUILD_OK = "echo 'Loading OSM'; echo 'Graph written'; "
                          "touch Graph.obj; exit 0";
constexpr auto SERVE_OK = "echo 'Server started on port '$1; exec sleep 30";

/// Listening socket on an OS-chosen port, closed on destruction
class BusyPort {
public:
    BusyPort() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = 0;
        EXPECT_EQ(::bind(fd_, reinterpret_cast<sockaddr*>(&addr),
                         sizeof(addr)),
                  0);
        EXPECT_EQ(::listen(fd_, 1), 0);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~BusyPort() { ::close(fd_); }

    [[nodiscard]] int port() const { return port_; }

private:
    int fd_{-1};
    int port_{0};
};

}  // namespace

class EngineSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = makeTestConfig(tempDir.path());
        fetcher = std::make_shared<FakeDataFetcher>();
    }

    auto makeSupervisor(std::string buildScript, std::string serveScript,
                        std::shared_ptr<Clock> clock = nullptr)
        -> std::unique_ptr<EngineSupervisor> {
        auto profile = std::make_shared<ScriptedProfile>(
            std::move(buildScript), std::move(serveScript));
        auto supervisor = std::make_unique<EngineSupervisor>(
            config, fetcher, profile, std::move(clock));
        supervisor->setEventCallback(
            [this](SupervisorState state, const std::string&) {
                std::lock_guard lock(statesMutex);
                states.push_back(state);
            });
        return supervisor;
    }

    auto recordedStates() -> std::vector<SupervisorState> {
        std::lock_guard lock(statesMutex);
        return states;
    }

    void clearStates() {
        std::lock_guard lock(statesMutex);
        states.clear();
    }

    TempDir tempDir;
    wayfarer::config::SupervisorConfig config;
    std::shared_ptr<FakeDataFetcher> fetcher;

    std::mutex statesMutex;
    std::vector<SupervisorState> states;
};

// ============================================================================
// Happy path
// ============================================================================

TEST_F(EngineSupervisorTest, StartBuildsGraphAndServes) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_EQ(supervisor->state(), SupervisorState::Running);

    std::vector<SupervisorState> expected{
        SupervisorState::Preparing, SupervisorState::Building,
        SupervisorState::GraphReady, SupervisorState::Starting,
        SupervisorState::Running};
    EXPECT_EQ(recordedStates(), expected);

    auto status = supervisor->status();
    ASSERT_TRUE(status.port.has_value());
    EXPECT_EQ(supervisor->port(), status.port);
    EXPECT_TRUE(status.securePort.has_value());
    EXPECT_NE(status.port, status.securePort);
    EXPECT_FALSE(status.portMismatch);
    EXPECT_EQ(status.serveAttempts, 1);
    EXPECT_TRUE(status.pid.has_value());
    EXPECT_EQ(status.phase, Phase::Serve);
    EXPECT_THAT(status.lastLine, HasSubstr("Server started on port"));

    EXPECT_EQ(fetcher->mapFetches, 1);
    EXPECT_EQ(fetcher->transitFetches, 1);

    auto manifest = supervisor->workspace().loadManifest();
    EXPECT_EQ(manifest.engine, "scripted");
    EXPECT_TRUE(manifest.graphBuiltAt.has_value());
    EXPECT_EQ(manifest.bbox, config.bbox->toString());

    EXPECT_EQ(supervisor->stop(), SupervisorState::Stopped);
}

TEST_F(EngineSupervisorTest, EngineOutputIsTeedToPhaseLogs) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    supervisor->stop();

    std::vector<std::string> names;
    for (const auto& entry :
         fs::directory_iterator(supervisor->workspace().logDirectory())) {
        names.push_back(entry.path().filename().string());
    }
    ASSERT_EQ(names.size(), 2U);
    std::sort(names.begin(), names.end());
    EXPECT_THAT(names[0], ::testing::StartsWith("build_"));
    EXPECT_THAT(names[1], ::testing::StartsWith("serve_"));
}

TEST_F(EngineSupervisorTest, StopIsIdempotent) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    auto pid = supervisor->status().pid;
    ASSERT_TRUE(pid.has_value());

    EXPECT_EQ(supervisor->stop(), SupervisorState::Stopped);
    EXPECT_EQ(supervisor->stop(), SupervisorState::Stopped);
    EXPECT_FALSE(processExists(*pid));
    EXPECT_FALSE(supervisor->port().has_value());
    EXPECT_FALSE(supervisor->status().pid.has_value());
}

TEST_F(EngineSupervisorTest, StopFromIdleDoesNothing) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    EXPECT_EQ(supervisor->stop(), SupervisorState::Idle);
    EXPECT_TRUE(recordedStates().empty());
}

TEST_F(EngineSupervisorTest, StartWhileRunningReturnsRunning) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    auto port = supervisor->port();

    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_EQ(supervisor->port(), port);
}

TEST_F(EngineSupervisorTest, CachedGraphSkipsBuild) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    ASSERT_EQ(supervisor->stop(), SupervisorState::Stopped);
    clearStates();

    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_THAT(recordedStates(), Not(Contains(SupervisorState::Building)));
    EXPECT_THAT(recordedStates(), Contains(SupervisorState::GraphReady));
    EXPECT_EQ(fetcher->mapFetches, 1);
}

TEST_F(EngineSupervisorTest, MissingTransitFeedsKeepCachedGraph) {
    fetcher->failTransit = true;
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    ASSERT_EQ(supervisor->stop(), SupervisorState::Stopped);
    clearStates();

    // Transit is retried but nothing new was written
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_EQ(fetcher->mapFetches, 1);
    EXPECT_THAT(recordedStates(), Not(Contains(SupervisorState::Building)));
    EXPECT_THAT(recordedStates(), Contains(SupervisorState::GraphReady));
}

TEST_F(EngineSupervisorTest, RebuildGraphIgnoresCachedGraph) {
    {
        auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
        ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    }
    clearStates();

    config.rebuildGraph = true;
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_THAT(recordedStates(), Contains(SupervisorState::Building));
}

// ============================================================================
// Build failures
// ============================================================================

TEST_F(EngineSupervisorTest, BuildEngineErrorFailsBuild) {
    auto supervisor = makeSupervisor(
        "echo 'Exception in thread \"main\" java.lang.OutOfMemoryError: "
        "Java heap space'; exit 1",
        SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::BuildFailed);

    auto failure = supervisor->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->reason, FailureReason::EngineError);
    EXPECT_EQ(failure->phase, Phase::Build);
    EXPECT_THAT(failure->detail, HasSubstr("OutOfMemoryError"));
    EXPECT_FALSE(failure->recentOutput.empty());

    auto status = supervisor->status();
    EXPECT_EQ(status.reason, FailureReason::EngineError);
    EXPECT_FALSE(status.pid.has_value());
    EXPECT_THAT(recordedStates(), Not(Contains(SupervisorState::Starting)));
}

TEST_F(EngineSupervisorTest, BuildExitWithoutMarkerFailsBuild) {
    auto supervisor = makeSupervisor("echo 'Loading OSM'; exit 2", SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::BuildFailed);

    auto failure = supervisor->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->reason, FailureReason::UnexpectedExit);
    EXPECT_EQ(failure->exitCode, 2);
}

TEST_F(EngineSupervisorTest, BuildMarkerWithNonZeroExitFailsBuild) {
    auto supervisor =
        makeSupervisor("echo 'Graph written'; exit 1", SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::BuildFailed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::UnexpectedExit);
    EXPECT_EQ(supervisor->failure()->exitCode, 1);
}

TEST_F(EngineSupervisorTest, SilentBuildTimesOut) {
    auto clock = std::make_shared<ManualClock>();
    auto supervisor =
        makeSupervisor("echo 'Loading OSM'; exec sleep 30", SERVE_OK, clock);

    auto result = std::async(std::launch::async,
                             [&supervisor] { return supervisor->start(); });

    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->status().lastLine == "Loading OSM"; }));
    auto pid = supervisor->status().pid;
    ASSERT_TRUE(pid.has_value());

    clock->advance(120s);

    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), SupervisorState::BuildFailed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::FreezeTimeout);
    EXPECT_FALSE(processExists(*pid));
}

TEST_F(EngineSupervisorTest, BuildDeadlineExceeded) {
    auto clock = std::make_shared<ManualClock>();
    config.buildDeadline = 3600s;
    config.idleTimeout = 7200s;
    auto supervisor = makeSupervisor(
        "while true; do echo 'Loading OSM'; sleep 0.05; done", SERVE_OK,
        clock);

    auto result = std::async(std::launch::async,
                             [&supervisor] { return supervisor->start(); });
    ASSERT_TRUE(waitUntil([&] {
        return supervisor->state() == SupervisorState::Building &&
               !supervisor->status().lastLine.empty();
    }));

    clock->advance(3601s);

    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), SupervisorState::BuildFailed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::DeadlineExceeded);
}

TEST_F(EngineSupervisorTest, LingeringBuildIsAcceptedAfterMarker) {
    auto clock = std::make_shared<ManualClock>();
    auto supervisor = makeSupervisor(
        "echo 'Graph written'; touch Graph.obj; exec sleep 30", SERVE_OK,
        clock);

    auto result = std::async(std::launch::async,
                             [&supervisor] { return supervisor->start(); });
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->status().lastLine == "Graph written"; }));
    // Let the supervisor consume the completion marker first
    std::this_thread::sleep_for(200ms);

    clock->advance(61s);

    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), SupervisorState::Running);
}

TEST_F(EngineSupervisorTest, GraphBuiltMarkerCompletesBuild) {
    auto supervisor =
        makeSupervisor("echo 'Graph built'; touch Graph.obj; exit 0", SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_THAT(recordedStates(), Contains(SupervisorState::GraphReady));
    EXPECT_TRUE(supervisor->workspace().loadManifest().graphBuiltAt.has_value());
}

TEST_F(EngineSupervisorTest, BuildCompletionBeatsConcurrentTimeout) {
    auto clock = std::make_shared<GatedClock>();
    auto supervisor = makeSupervisor(
        "while [ ! -f go ]; do sleep 0.01; done; touch Graph.obj; "
        "echo 'Graph built'; echo 'closing'; exec sleep 30",
        SERVE_OK, clock);

    std::promise<std::thread::id> worker;
    auto result = std::async(std::launch::async, [&] {
        worker.set_value(std::this_thread::get_id());
        return supervisor->start();
    });
    auto workerId = worker.get_future().get();
    ASSERT_TRUE(waitUntil([&] {
        return supervisor->state() == SupervisorState::Building &&
               supervisor->status().pid.has_value();
    }));

    // Park the supervising thread right before its timeout checks, then let
    // the marker land and the idle limit pass while it is parked
    clock->hold(workerId);
    ASSERT_TRUE(clock->waitParked());
    std::ofstream(supervisor->workspace().directory() / "go") << "go\n";
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->status().lastLine == "closing"; }));
    clock->advance(120s);
    clock->release();

    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), SupervisorState::Running);
    EXPECT_THAT(recordedStates(), Contains(SupervisorState::GraphReady));
    EXPECT_FALSE(supervisor->failure().has_value());
}

// ============================================================================
// Serve startup
// ============================================================================

TEST_F(EngineSupervisorTest, ServeExitBeforeReadyFails) {
    auto supervisor = makeSupervisor(BUILD_OK, "echo 'starting'; exit 3");

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);

    auto failure = supervisor->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->reason, FailureReason::UnexpectedExit);
    EXPECT_EQ(failure->phase, Phase::Serve);
    EXPECT_EQ(failure->exitCode, 3);
    EXPECT_THAT(failure->recentOutput, Contains("starting"));
}

TEST_F(EngineSupervisorTest, SilentStartupTimesOut) {
    auto clock = std::make_shared<ManualClock>();
    auto supervisor = makeSupervisor(
        BUILD_OK, "echo 'Loading graph'; exec sleep 30", clock);

    auto result = std::async(std::launch::async,
                             [&supervisor] { return supervisor->start(); });
    ASSERT_TRUE(waitUntil([&] {
        return supervisor->state() == SupervisorState::Starting &&
               supervisor->status().lastLine == "Loading graph";
    }));
    auto pid = supervisor->status().pid;
    ASSERT_TRUE(pid.has_value());

    clock->advance(120s);

    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), SupervisorState::Failed);
    auto failure = supervisor->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->reason, FailureReason::FreezeTimeout);
    EXPECT_EQ(failure->phase, Phase::Serve);
    EXPECT_FALSE(processExists(*pid));
}

TEST_F(EngineSupervisorTest, ServeReadyBeatsConcurrentTimeout) {
    auto clock = std::make_shared<GatedClock>();
    auto supervisor = makeSupervisor(
        BUILD_OK,
        "while [ ! -f go ]; do sleep 0.01; done; "
        "echo 'Server started on port '$1; echo 'accepting'; exec sleep 30",
        clock);

    std::promise<std::thread::id> worker;
    auto result = std::async(std::launch::async, [&] {
        worker.set_value(std::this_thread::get_id());
        return supervisor->start();
    });
    auto workerId = worker.get_future().get();
    ASSERT_TRUE(waitUntil([&] {
        return supervisor->state() == SupervisorState::Starting &&
               supervisor->status().pid.has_value();
    }));

    clock->hold(workerId);
    ASSERT_TRUE(clock->waitParked());
    std::ofstream(supervisor->workspace().directory() / "go") << "go\n";
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->status().lastLine == "accepting"; }));
    clock->advance(120s);
    clock->release();

    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), SupervisorState::Running);
    EXPECT_FALSE(supervisor->failure().has_value());
}

TEST_F(EngineSupervisorTest, ServeEngineErrorFails) {
    auto supervisor = makeSupervisor(
        BUILD_OK,
        "echo 'java.util.zip.ZipException: invalid CEN header'; "
        "exec sleep 30");

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::EngineError);
}

TEST_F(EngineSupervisorTest, ReportedPortWinsOnMismatch) {
    auto supervisor = makeSupervisor(
        BUILD_OK, "echo 'Server started on port 8080'; exec sleep 30");

    ASSERT_EQ(supervisor->start(), SupervisorState::Running);

    auto status = supervisor->status();
    EXPECT_EQ(status.port, 8080);
    EXPECT_EQ(supervisor->port(), 8080);
    EXPECT_TRUE(status.portMismatch);
}

TEST_F(EngineSupervisorTest, ReadyMarkerWithoutPortKeepsAllocatedPort) {
    config.port = BusyPort().port();
    auto supervisor = makeSupervisor(
        BUILD_OK, "echo 'Grizzly server running.'; exec sleep 30");

    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_EQ(supervisor->port(), config.port);
    EXPECT_FALSE(supervisor->status().portMismatch);
}

TEST_F(EngineSupervisorTest, FixedPortInUseFails) {
    BusyPort busy;
    config.port = busy.port();
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::PortUnavailable);
    EXPECT_EQ(supervisor->failure()->phase, Phase::Serve);
}

TEST_F(EngineSupervisorTest, BindFailureRetriesOnNewPort) {
    auto supervisor = makeSupervisor(
        BUILD_OK,
        "n=$(cat attempts 2>/dev/null || echo 0); n=$((n+1)); "
        "echo $n > attempts; "
        "if [ $n -lt 2 ]; then "
        "echo 'java.net.BindException: Address already in use'; exit 1; fi; "
        "echo 'Server started on port '$1; exec sleep 30");

    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_EQ(supervisor->status().serveAttempts, 2);

    auto states = recordedStates();
    EXPECT_EQ(std::count(states.begin(), states.end(),
                         SupervisorState::Starting),
              2);
}

TEST_F(EngineSupervisorTest, BindFailureOnFixedPortDoesNotRetry) {
    config.port = BusyPort().port();
    auto supervisor = makeSupervisor(
        BUILD_OK,
        "echo 'java.net.BindException: Address already in use'; exit 1");

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::PortUnavailable);
    EXPECT_EQ(supervisor->status().serveAttempts, 1);
}

TEST_F(EngineSupervisorTest, BindRetriesAreBounded) {
    config.maxBindRetries = 1;
    auto supervisor = makeSupervisor(
        BUILD_OK, "echo 'java.net.BindException: bind failed'; exit 1");

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::PortUnavailable);
    EXPECT_EQ(supervisor->status().serveAttempts, 2);
}

// ============================================================================
// Preparation
// ============================================================================

TEST_F(EngineSupervisorTest, FetchFailureFails) {
    fetcher->failMap = true;
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);

    auto failure = supervisor->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->reason, FailureReason::FetchError);
    EXPECT_FALSE(failure->phase.has_value());
    EXPECT_THAT(recordedStates(), Not(Contains(SupervisorState::Building)));
}

TEST_F(EngineSupervisorTest, OptionalTransitFailureIsTolerated) {
    fetcher->failTransit = true;
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
}

TEST_F(EngineSupervisorTest, RequiredTransitFailureFails) {
    fetcher->failTransit = true;
    config.fetch.requireTransit = true;
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::FetchError);
}

TEST_F(EngineSupervisorTest, MissingInputsWithoutFetcherFail) {
    fetcher.reset();
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);

    EXPECT_EQ(supervisor->start(), SupervisorState::Failed);
    EXPECT_EQ(supervisor->failure()->reason, FailureReason::FetchError);
}

TEST_F(EngineSupervisorTest, ExistingInputsNeedNoFetcher) {
    fetcher.reset();
    config.fetch.fetchTransit = false;
    auto directory = tempDir.path() / "test";
    fs::create_directories(directory);
    std::ofstream(directory / "city.osm.pbf") << "pbf";

    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
}

TEST_F(EngineSupervisorTest, InvalidConfigurationIsRejected) {
    config.pollInterval = 0ms;
    EXPECT_THROW(makeSupervisor(BUILD_OK, SERVE_OK), ConfigError);
}

// ============================================================================
// Reset and restart
// ============================================================================

TEST_F(EngineSupervisorTest, StartAfterFailureRequiresReset) {
    auto supervisor = makeSupervisor("exit 1", SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::BuildFailed);

    EXPECT_THROW(supervisor->start(), InvalidStateError);

    supervisor->reset();
    EXPECT_EQ(supervisor->state(), SupervisorState::Idle);
    EXPECT_FALSE(supervisor->failure().has_value());
    EXPECT_EQ(supervisor->status().reason, FailureReason::None);

    EXPECT_EQ(supervisor->start(), SupervisorState::BuildFailed);
}

TEST_F(EngineSupervisorTest, ResetWhileRunningThrows) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_THROW(supervisor->reset(), InvalidStateError);
}

TEST_F(EngineSupervisorTest, StoppedEngineCanStartAgain) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    ASSERT_EQ(supervisor->stop(), SupervisorState::Stopped);
    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(EngineSupervisorTest, StopDuringBuildCancelsStart) {
    auto supervisor =
        makeSupervisor("echo 'Loading OSM'; exec sleep 30", SERVE_OK);

    auto result = std::async(std::launch::async,
                             [&supervisor] { return supervisor->start(); });
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->status().lastLine == "Loading OSM"; }));
    auto pid = supervisor->status().pid;
    ASSERT_TRUE(pid.has_value());

    EXPECT_EQ(supervisor->stop(), SupervisorState::Stopped);
    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), SupervisorState::Stopped);
    EXPECT_FALSE(processExists(*pid));
}

TEST_F(EngineSupervisorTest, StopBeforeStartDoesNotCancelLaterStart) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    ASSERT_EQ(supervisor->stop(), SupervisorState::Idle);

    EXPECT_EQ(supervisor->start(), SupervisorState::Running);
    EXPECT_EQ(supervisor->stop(), SupervisorState::Stopped);
}

TEST_F(EngineSupervisorTest, ConcurrentStartIsRejected) {
    auto supervisor =
        makeSupervisor("echo 'Loading OSM'; exec sleep 30", SERVE_OK);

    auto result = std::async(std::launch::async,
                             [&supervisor] { return supervisor->start(); });
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->state() == SupervisorState::Building; }));

    EXPECT_THROW(supervisor->start(), InvalidStateError);

    supervisor->stop();
    EXPECT_EQ(result.get(), SupervisorState::Stopped);
}

TEST_F(EngineSupervisorTest, StopFromCallbackIsDeferred) {
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
    EngineSupervisor* raw = supervisor.get();
    supervisor->setEventCallback(
        [raw](SupervisorState state, const std::string&) {
            if (state == SupervisorState::Running) {
                raw->stop();
            }
        });

    supervisor->start();
    EXPECT_TRUE(waitUntil(
        [&] { return supervisor->state() == SupervisorState::Stopped; }));
}

TEST_F(EngineSupervisorTest, DestructorKillsEngine) {
    std::optional<pid_t> pid;
    {
        auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);
        ASSERT_EQ(supervisor->start(), SupervisorState::Running);
        pid = supervisor->status().pid;
    }
    ASSERT_TRUE(pid.has_value());
    EXPECT_FALSE(processExists(*pid));
}

// ============================================================================
// Serving
// ============================================================================

TEST_F(EngineSupervisorTest, CrashWhileRunningFails) {
    auto supervisor = makeSupervisor(
        BUILD_OK, "echo 'Server started on port '$1; sleep 0.3; exit 5");

    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->state() == SupervisorState::Failed; }));

    auto failure = supervisor->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->reason, FailureReason::UnexpectedExit);
    EXPECT_EQ(failure->exitCode, 5);
    EXPECT_FALSE(supervisor->port().has_value());
    EXPECT_EQ(supervisor->stop(), SupervisorState::Failed);
}

TEST_F(EngineSupervisorTest, SilentServerFreezesAndRecovers) {
    auto clock = std::make_shared<ManualClock>();
    config.livenessPolicy = ServeLivenessPolicy::OutputActivity;
    auto supervisor = makeSupervisor(
        BUILD_OK,
        "echo 'Server started on port '$1; "
        "while [ ! -f resume ]; do sleep 0.05; done; "
        "echo 'request served'; exec sleep 30",
        clock);

    ASSERT_EQ(supervisor->start(), SupervisorState::Running);

    clock->advance(60s);
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->state() == SupervisorState::Frozen; }));

    auto status = supervisor->status();
    EXPECT_EQ(status.reason, FailureReason::FreezeTimeout);
    EXPECT_TRUE(status.pid.has_value());
    EXPECT_TRUE(supervisor->port().has_value());

    std::ofstream(supervisor->workspace().directory() / "resume") << "";
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->state() == SupervisorState::Running; }));
    EXPECT_EQ(supervisor->status().reason, FailureReason::None);
}

TEST_F(EngineSupervisorTest, ProcessAlivePolicyIgnoresSilence) {
    auto clock = std::make_shared<ManualClock>();
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK, clock);
    ASSERT_EQ(supervisor->start(), SupervisorState::Running);

    clock->advance(3600s);
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(supervisor->state(), SupervisorState::Running);
}

TEST_F(EngineSupervisorTest, FailedProbesFreezeEngine) {
    config.livenessPolicy = ServeLivenessPolicy::TcpProbe;
    config.maxProbeFailures = 2;
    // The scripted engine never listens, so every probe is refused
    auto supervisor = makeSupervisor(BUILD_OK, SERVE_OK);

    ASSERT_EQ(supervisor->start(), SupervisorState::Running);
    ASSERT_TRUE(waitUntil(
        [&] { return supervisor->state() == SupervisorState::Frozen; }));
    EXPECT_THAT(supervisor->status().detail, HasSubstr("failed probes"));
    EXPECT_EQ(supervisor->stop(), SupervisorState::Stopped);
}
