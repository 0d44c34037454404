/*
 * supervisor_test_helpers.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-09

Description: Shell-scripted engines, manual clock and fake fetcher shared
by the supervisor tests

**************************************************/

#ifndef WAYFARER_TESTS_SUPERVISOR_TEST_HELPERS_HPP
#define WAYFARER_TESTS_SUPERVISOR_TEST_HELPERS_HPP

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>

#include "config/supervisor_config.hpp"
#include "fetch/data_fetcher.hpp"
#include "supervisor/clock.hpp"
#include "supervisor/command_builder.hpp"
#include "supervisor/engine_profile.hpp"
#include "supervisor/exceptions.hpp"
#include "supervisor/line_classifier.hpp"

namespace wayfarer::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public supervisor::Clock {
public:
    [[nodiscard]] auto now() const -> time_point override {
        return start_ + std::chrono::nanoseconds(offset_.load());
    }

    void advance(std::chrono::nanoseconds step) { offset_ += step.count(); }

private:
    time_point start_{std::chrono::steady_clock::now()};
    std::atomic<std::int64_t> offset_{0};
};

/**
 * @brief Manual clock that can park one thread inside now()
 *
 * After hold(), the next now() on that thread blocks until release(). Tests
 * use it to line up output with a timeout check on the supervising thread.
 */
class GatedClock : public ManualClock {
public:
    [[nodiscard]] auto now() const -> time_point override {
        std::unique_lock lock(mutex_);
        if (armed_ && std::this_thread::get_id() == held_) {
            armed_ = false;
            parked_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !parked_; });
        }
        return ManualClock::now();
    }

    void hold(std::thread::id thread) {
        std::lock_guard lock(mutex_);
        held_ = thread;
        armed_ = true;
    }

    auto waitParked(std::chrono::milliseconds timeout = std::chrono::seconds(5))
        -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return parked_; });
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            armed_ = false;
            parked_ = false;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable bool armed_{false};
    mutable bool parked_{false};
    std::thread::id held_;
};

/**
 * @brief Engine profile running /bin/sh scripts in place of java
 *
 * Scripts run in the graph directory as `sh -c <script> engine <ports...>`,
 * so the serve script sees the allocated ports as $1 and $2. Markers are the
 * OpenTripPlanner ones.
 */
class ScriptedProfile : public supervisor::EngineProfile {
public:
    ScriptedProfile(std::string buildScript, std::string serveScript,
                    int ports = 2)
        : buildScript_(std::move(buildScript)),
          serveScript_(std::move(serveScript)),
          ports_(ports) {}

    [[nodiscard]] auto name() const -> std::string_view override {
        return "scripted";
    }

    [[nodiscard]] auto buildCommand(supervisor::Phase phase,
                                    const supervisor::LaunchContext& context)
        const -> supervisor::ProcessConfig override {
        supervisor::CommandBuilder builder("/bin/sh");
        builder.addOption("-c", phase == supervisor::Phase::Build
                                    ? buildScript_
                                    : serveScript_);
        builder.addArg("engine");
        for (int port : context.ports) {
            builder.addArg(std::to_string(port));
        }
        builder.setWorkingDirectory(context.graphDirectory);
        return builder.build();
    }

    [[nodiscard]] auto markers() const
        -> std::vector<supervisor::MarkerRule> override {
        return supervisor::otpMarkers();
    }

    [[nodiscard]] auto portsRequired() const -> int override { return ports_; }

    [[nodiscard]] auto graphArtifact(const supervisor::LaunchContext& context)
        const -> fs::path override {
        return context.graphDirectory / "Graph.obj";
    }

private:
    std::string buildScript_;
    std::string serveScript_;
    int ports_;
};

/**
 * @brief Writes tiny placeholder inputs instead of downloading
 */
class FakeDataFetcher : public fetch::DataFetcher {
public:
    auto fetchMapExtract(const fetch::BoundingBox&, const fs::path& directory)
        -> fs::path override {
        if (failMap) {
            throw supervisor::FetchError("overpass unreachable");
        }
        ++mapFetches;
        auto path = directory / "map.osm";
        std::ofstream(path) << "<osm version=\"0.6\"/>\n";
        return path;
    }

    auto fetchTransitFeeds(const fetch::BoundingBox&, const fs::path& directory)
        -> std::vector<fs::path> override {
        if (failTransit) {
            throw supervisor::FetchError("no feeds cover the box");
        }
        ++transitFetches;
        auto path = directory / "feed.zip";
        std::ofstream(path) << "PK";
        return {path};
    }

    void fetchEngine(const std::string& url, const fs::path&) override {
        throw supervisor::FetchError("unexpected engine download " + url);
    }

    std::atomic<int> mapFetches{0};
    std::atomic<int> transitFetches{0};
    bool failMap{false};
    bool failTransit{false};
};

/**
 * @brief Fresh directory below the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info != nullptr
                               ? std::string(info->test_suite_name()) + "_" +
                                     info->name()
                               : "wayfarer";
        path_ = fs::temp_directory_path() /
                ("wayfarer_" + name + "_" + std::to_string(::getpid()));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const fs::path& { return path_; }

private:
    fs::path path_;
};

/**
 * @brief Configuration with fast polling and a small box
 */
inline auto makeTestConfig(const fs::path& root) -> config::SupervisorConfig {
    config::SupervisorConfig config;
    config.graphRoot = root.string();
    config.graphName = "test";
    config.bbox = fetch::BoundingBox{13.3, 52.4, 13.5, 52.6};
    config.idleTimeout = 60s;
    config.freezeTimeout = 30s;
    config.pollInterval = 20ms;
    config.stopGracePeriod = 500ms;
    config.healthCheckInterval = 50ms;
    config.logging.teeEngineOutput = true;
    return config;
}

/**
 * @brief Poll a predicate until it holds or the timeout expires
 */
inline auto waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = 5000ms) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

/**
 * @brief Whether a live (non-zombie) process with this pid exists
 */
inline auto processExists(pid_t pid) -> bool {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(stat)),
                        std::istreambuf_iterator<char>());
    // The state field follows the parenthesised command name
    auto close = content.rfind(')');
    return close != std::string::npos && close + 2 < content.size() &&
           content[close + 2] != 'Z';
}

}  // namespace wayfarer::test

#endif  // WAYFARER_TESTS_SUPERVISOR_TEST_HELPERS_HPP
