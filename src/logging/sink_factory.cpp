/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace wayfarer::logging {

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    bool color, const std::string& pattern)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& filePath,
                                         size_t maxSize, size_t maxFiles,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(filePath);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        filePath, maxSize, maxFiles);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace wayfarer::logging
