/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include "sink_factory.hpp"

#include <spdlog/sinks/sink.h>

#include <algorithm>
#include <filesystem>

namespace wayfarer::logging {

auto parseLevel(const std::string& name) -> spdlog::level::level_enum {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

void LoggingManager::initialize(const config::LoggingConfig& config) {
    std::lock_guard lock(mutex_);

    if (initialized_) {
        spdlog::drop_all();
        sinks_.clear();
    }

    auto lowest = spdlog::level::off;
    if (config.enableConsole) {
        auto level = parseLevel(config.consoleLevel);
        sinks_.push_back(SinkFactory::createConsoleSink(
            level, config.consoleColor, config.pattern));
        lowest = std::min(lowest, level);
    }
    if (config.enableFile) {
        auto level = parseLevel(config.fileLevel);
        auto path = std::filesystem::path(config.logDir) /
                    (config.logFilename + ".log");
        sinks_.push_back(SinkFactory::createRotatingFileSink(
            path.string(), config.maxFileSize, config.maxFiles, level,
            config.pattern));
        lowest = std::min(lowest, level);
    }

    auto logger = std::make_shared<spdlog::logger>("wayfarer", sinks_.begin(),
                                                   sinks_.end());
    logger->set_level(lowest);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    initialized_ = true;
    spdlog::debug("Logging initialized with {} sink(s)", sinks_.size());
}

void LoggingManager::shutdown() {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return;
    }
    // The default logger stays installed for late messages from exit hooks
    for (auto& sink : sinks_) {
        sink->flush();
    }
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto LoggingManager::sinkCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return sinks_.size();
}

}  // namespace wayfarer::logging
