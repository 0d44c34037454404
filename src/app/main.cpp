/**
 * @file main.cpp
 * @brief Command line entry point for the wayfarer engine supervisor
 *
 * Loads a JSON configuration, prepares the graph workspace, builds the
 * routing graph when needed and keeps the engine serving until SIGINT or
 * SIGTERM arrives.
 */

#include "config/supervisor_config.hpp"
#include "fetch/http_data_fetcher.hpp"
#include "logging/logging_manager.hpp"
#include "supervisor/engine_supervisor.hpp"
#include "supervisor/exceptions.hpp"
#include "supervisor/process_reaper.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {

using wayfarer::supervisor::SupervisorState;

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_BUILD_FAILED = 2;
constexpr int EXIT_ENGINE_FAILED = 3;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <config.json>\n"
              << "Options:\n"
              << "  --check        Validate the configuration and exit\n"
              << "  --schema       Print the configuration schema and exit\n"
              << "  --help, -h     Show this help message\n";
}

auto exitCodeFor(SupervisorState state) -> int {
    switch (state) {
        case SupervisorState::BuildFailed:
            return EXIT_BUILD_FAILED;
        case SupervisorState::Failed:
            return EXIT_ENGINE_FAILED;
        default:
            return 0;
    }
}

/**
 * @brief Signals handled synchronously by a dedicated thread
 *
 * Blocked before any other thread starts so every thread inherits the mask.
 * Engine children clear the mask before exec.
 */
auto shutdownSignals() -> sigset_t {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

}  // namespace

int main(int argc, char* argv[]) {
    bool checkOnly = false;
    std::string configPath;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--schema") {
            std::cout << wayfarer::config::SupervisorConfig::schema().dump(2)
                      << std::endl;
            return 0;
        }
        if (arg == "--check") {
            checkOnly = true;
        } else if (configPath.empty() && !arg.starts_with("-")) {
            configPath = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
    }
    if (configPath.empty()) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    wayfarer::config::SupervisorConfig config;
    try {
        config = wayfarer::config::SupervisorConfig::loadFromFile(configPath);
    } catch (const wayfarer::supervisor::ConfigError& e) {
        std::cerr << "Invalid configuration " << configPath << ": "
                  << e.what() << "\n";
        return EXIT_USAGE;
    }
    if (checkOnly) {
        std::cout << configPath << ": OK\n";
        return 0;
    }

    try {
        wayfarer::logging::LoggingManager::getInstance().initialize(
            config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Cannot initialize logging: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    spdlog::info("==============================================");
    spdlog::info("  wayfarer journey-planner engine supervisor  ");
    spdlog::info("==============================================");
    spdlog::info("Engine: {}  Graph: {}  Liveness: {}", config.engine.kind,
                 config.graphName,
                 wayfarer::supervisor::toString(config.livenessPolicy));

    auto signals = shutdownSignals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    int exitCode = 0;
    try {
        auto fetcher =
            std::make_shared<wayfarer::fetch::HttpDataFetcher>(config.fetch);
        wayfarer::supervisor::EngineSupervisor supervisor(config, fetcher);

        std::mutex doneMutex;
        std::condition_variable doneCv;
        bool done = false;

        supervisor.setEventCallback(
            [&](SupervisorState state, const std::string&) {
                std::lock_guard lock(doneMutex);
                if (state == SupervisorState::Failed ||
                    state == SupervisorState::BuildFailed ||
                    state == SupervisorState::Stopped) {
                    done = true;
                }
                doneCv.notify_all();
            });

        std::atomic<bool> finished{false};
        std::thread signalThread([&] {
            timespec timeout{0, 250'000'000};
            while (!finished) {
                int signal = sigtimedwait(&signals, nullptr, &timeout);
                if (signal > 0) {
                    spdlog::warn("Received signal {}, stopping engine...",
                                 signal);
                    supervisor.stop();
                    return;
                }
            }
        });

        auto state = supervisor.start();
        if (state == SupervisorState::Running) {
            spdlog::info("Engine serving on port {}",
                         supervisor.port().value_or(0));
            std::unique_lock lock(doneMutex);
            doneCv.wait(lock, [&] { return done; });
        }

        finished = true;
        signalThread.join();
        state = supervisor.stop();

        auto status = supervisor.status();
        if (auto failure = supervisor.failure()) {
            spdlog::error("{}", failure->summary());
        }
        spdlog::info("Supervisor finished in state {}",
                     wayfarer::supervisor::toString(status.state));
        exitCode = exitCodeFor(state);
    } catch (const wayfarer::supervisor::SupervisorError& e) {
        spdlog::critical("Supervisor error: {}", e.what());
        exitCode = EXIT_ENGINE_FAILED;
    }

    wayfarer::supervisor::ProcessReaper::instance().reapAll();
    wayfarer::logging::LoggingManager::getInstance().shutdown();
    return exitCode;
}
