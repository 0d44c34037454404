/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Logging configuration section

**************************************************/

#ifndef WAYFARER_CONFIG_LOGGING_CONFIG_HPP
#define WAYFARER_CONFIG_LOGGING_CONFIG_HPP

#include <string>

#include "config_section.hpp"

namespace wayfarer::config {

/**
 * @brief Check a spdlog level name
 */
[[nodiscard]] inline bool isValidLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "error" || level == "critical" ||
           level == "off";
}

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * "logging": {
 *   "enableConsole": true,
 *   "consoleLevel": "info",
 *   "enableFile": true,
 *   "logDir": "logs",
 *   "logFilename": "wayfarer",
 *   "fileLevel": "debug",
 *   "maxFileSize": 10485760,
 *   "maxFiles": 5
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "logging";

    // ========================================================================
    // Console Settings
    // ========================================================================

    bool enableConsole{true};          ///< Enable console output
    std::string consoleLevel{"info"};  ///< Console log level
    bool consoleColor{true};           ///< Enable ANSI color codes

    // ========================================================================
    // File Settings
    // ========================================================================

    bool enableFile{false};               ///< Enable rotating file output
    std::string logDir{"logs"};           ///< Log directory path
    std::string logFilename{"wayfarer"};  ///< Base filename (without extension)
    std::string fileLevel{"debug"};       ///< File log level

    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation
    size_t maxFiles{5};                    ///< Max number of rotated files

    // ========================================================================
    // Format Settings
    // ========================================================================

    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    // ========================================================================
    // Engine Output
    // ========================================================================

    bool teeEngineOutput{true};  ///< Copy engine output to logs/<phase>_*.log

    [[nodiscard]] json serialize() const {
        return {{"enableConsole", enableConsole},
                {"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"pattern", pattern},
                {"teeEngineOutput", teeEngineOutput}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);

        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);

        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.teeEngineOutput = j.value("teeEngineOutput", cfg.teeEngineOutput);

        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties",
             {{"enableConsole", {{"type", "boolean"}, {"default", true}}},
              {"consoleLevel",
               {{"type", "string"},
                {"enum",
                 {"trace", "debug", "info", "warn", "error", "critical",
                  "off"}},
                {"default", "info"}}},
              {"consoleColor", {{"type", "boolean"}, {"default", true}}},
              {"enableFile", {{"type", "boolean"}, {"default", false}}},
              {"logDir", {{"type", "string"}, {"default", "logs"}}},
              {"logFilename", {{"type", "string"}, {"default", "wayfarer"}}},
              {"fileLevel",
               {{"type", "string"},
                {"enum",
                 {"trace", "debug", "info", "warn", "error", "critical",
                  "off"}},
                {"default", "debug"}}},
              {"maxFileSize",
               {{"type", "integer"},
                {"minimum", 1024},
                {"default", 10485760}}},
              {"maxFiles",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", 100},
                {"default", 5}}},
              {"pattern", {{"type", "string"}}},
              {"teeEngineOutput", {{"type", "boolean"}, {"default", true}}}}}};
    }

    /**
     * @brief Check values the schema cannot express
     * @return Empty string when valid, otherwise the first problem found
     */
    [[nodiscard]] std::string validate() const {
        if (!isValidLogLevel(consoleLevel)) {
            return "logging.consoleLevel is not a log level: " + consoleLevel;
        }
        if (!isValidLogLevel(fileLevel)) {
            return "logging.fileLevel is not a log level: " + fileLevel;
        }
        if (enableFile && logFilename.empty()) {
            return "logging.logFilename must not be empty";
        }
        if (maxFiles == 0) {
            return "logging.maxFiles must be at least 1";
        }
        return {};
    }
};

}  // namespace wayfarer::config

#endif  // WAYFARER_CONFIG_LOGGING_CONFIG_HPP
