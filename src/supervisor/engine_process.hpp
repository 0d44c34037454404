/*
 * engine_process.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-04

Description: Spawned engine process with merged output stream

**************************************************/

#ifndef WAYFARER_SUPERVISOR_ENGINE_PROCESS_HPP
#define WAYFARER_SUPERVISOR_ENGINE_PROCESS_HPP

#include "command_builder.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <sys/types.h>

namespace wayfarer::supervisor {

/**
 * @brief Handle to one running engine process
 *
 * The child runs in its own process group with stdout and stderr merged into
 * a single pipe. Signals are always delivered to the whole group so helper
 * processes started by the engine die with it.
 *
 * readLine() is meant for a single reader thread; the remaining methods may
 * be called from any thread.
 */
class EngineProcess {
public:
    enum class ReadStatus {
        Line,     ///< A complete line was returned
        Timeout,  ///< No complete line within the timeout
        Closed    ///< End of stream, no more lines
    };

    /**
     * @brief Spawn a process
     * @throws LaunchError if the executable cannot be found or exec fails
     */
    [[nodiscard]] static auto spawn(const ProcessConfig& config)
        -> std::unique_ptr<EngineProcess>;

    /**
     * @brief Resolve an executable name against PATH
     * @return Absolute path, or nullopt if not found or not executable
     */
    [[nodiscard]] static auto resolveExecutable(
        const std::filesystem::path& executable)
        -> std::optional<std::filesystem::path>;

    ~EngineProcess();

    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;

    [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

    [[nodiscard]] auto startTime() const noexcept
        -> std::chrono::steady_clock::time_point {
        return startTime_;
    }

    /**
     * @brief Read the next output line without its terminator
     */
    auto readLine(std::string& line, std::chrono::milliseconds timeout)
        -> ReadStatus;

    /**
     * @brief Reap the process if it has exited
     * @return Exit code (128 + signal when killed), nullopt while running
     */
    auto poll() -> std::optional<int>;

    [[nodiscard]] auto exitCode() const -> std::optional<int>;

    [[nodiscard]] auto isRunning() -> bool { return !poll().has_value(); }

    /**
     * @brief Wait for the process to exit on its own
     */
    auto waitFor(std::chrono::milliseconds timeout) -> std::optional<int>;

    /**
     * @brief SIGTERM the group, wait for the grace period, then SIGKILL
     * @return Exit code of the process
     */
    auto terminate(std::chrono::milliseconds grace) -> int;

    /**
     * @brief SIGKILL the group and reap it
     */
    auto kill() -> int;

private:
    EngineProcess(pid_t pid, int outputFd);

    void recordExit(int status);

    pid_t pid_;
    int outputFd_;
    std::chrono::steady_clock::time_point startTime_;
    std::string buffer_;
    bool eof_{false};

    mutable std::mutex exitMutex_;
    std::optional<int> exitCode_;
};

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_ENGINE_PROCESS_HPP
