/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Installs the process-wide spdlog logger from LoggingConfig

**************************************************/

#ifndef WAYFARER_LOGGING_LOGGING_MANAGER_HPP
#define WAYFARER_LOGGING_LOGGING_MANAGER_HPP

#include <mutex>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/logging_config.hpp"

namespace wayfarer::logging {

/**
 * @brief Owns the sinks behind the default "wayfarer" logger
 *
 * All supervisor code logs through the spdlog free functions, so replacing
 * the default logger here redirects every module at once.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief Build sinks and install the default logger
     *
     * Can be called again to apply a new configuration.
     *
     * @throws spdlog::spdlog_ex if the log file cannot be opened
     */
    void initialize(const config::LoggingConfig& config);

    /**
     * @brief Flush all sinks
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    [[nodiscard]] auto sinkCount() const -> size_t;

private:
    LoggingManager() = default;

    mutable std::mutex mutex_;
    std::vector<spdlog::sink_ptr> sinks_;
    bool initialized_{false};
};

/**
 * @brief Parse a level name, defaulting to info
 */
[[nodiscard]] auto parseLevel(const std::string& name)
    -> spdlog::level::level_enum;

}  // namespace wayfarer::logging

#endif  // WAYFARER_LOGGING_LOGGING_MANAGER_HPP
