/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Factory for the spdlog sinks used by the supervisor

**************************************************/

#ifndef WAYFARER_LOGGING_SINK_FACTORY_HPP
#define WAYFARER_LOGGING_SINK_FACTORY_HPP

#include <string>

#include <spdlog/spdlog.h>

namespace wayfarer::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * Supports:
 * - Console (stdout, with or without colors)
 * - Rotating file
 */
class SinkFactory {
public:
    /**
     * @brief Create a stdout sink
     * @param level Log level for the sink
     * @param color Emit ANSI color codes
     * @param pattern Optional format pattern
     */
    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level = spdlog::level::trace,
        bool color = true, const std::string& pattern = "")
        -> spdlog::sink_ptr;

    /**
     * @brief Create a rotating file sink
     * @param filePath Base path for log files
     * @param maxSize Maximum file size before rotation
     * @param maxFiles Maximum number of rotated files to keep
     * @param level Log level
     * @param pattern Optional format pattern
     */
    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& filePath, size_t maxSize, size_t maxFiles,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& filePath);
};

}  // namespace wayfarer::logging

#endif  // WAYFARER_LOGGING_SINK_FACTORY_HPP
