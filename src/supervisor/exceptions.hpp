/*
 * exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Engine supervisor exception types

*************************************************/

#pragma once

#include <fmt/format.h>

#include <chrono>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wayfarer::supervisor {

/**
 * @brief Base exception class for supervisor errors
 */
class SupervisorError : public std::runtime_error {
public:
    explicit SupervisorError(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : std::runtime_error(std::string(message)), location_(location) {}

    [[nodiscard]] auto location() const noexcept -> const std::source_location& {
        return location_;
    }

private:
    std::source_location location_;
};

/**
 * @brief Input acquisition failed (map extract, transit feeds, engine jar)
 */
class FetchError : public SupervisorError {
public:
    explicit FetchError(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : SupervisorError(fmt::format("Fetch error: {}", message), location) {}
};

/**
 * @brief Engine process could not be spawned
 */
class LaunchError : public SupervisorError {
public:
    explicit LaunchError(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : SupervisorError(fmt::format("Launch error: {}", message), location) {}
};

/**
 * @brief Requested port is busy or no free port could be found
 */
class PortUnavailable : public SupervisorError {
public:
    explicit PortUnavailable(
        int port, std::string_view message = "port is in use",
        std::source_location location = std::source_location::current())
        : SupervisorError(port > 0 ? fmt::format("Port {} unavailable: {}",
                                                 port, message)
                                   : fmt::format("No port available: {}",
                                                 message),
                          location),
          port_(port) {}

    [[nodiscard]] auto port() const noexcept -> int { return port_; }

private:
    int port_;
};

/**
 * @brief The engine reported a fatal condition or died unexpectedly
 */
class EngineError : public SupervisorError {
public:
    explicit EngineError(
        std::string_view detail,
        std::source_location location = std::source_location::current())
        : SupervisorError(fmt::format("Engine error: {}", detail), location),
          detail_(detail) {}

    [[nodiscard]] auto detail() const noexcept -> std::string_view {
        return detail_;
    }

private:
    std::string detail_;
};

/**
 * @brief The engine stopped producing output for too long
 */
class FreezeTimeout : public SupervisorError {
public:
    explicit FreezeTimeout(
        std::chrono::milliseconds idle, std::string_view message = "",
        std::source_location location = std::source_location::current())
        : SupervisorError(
              message.empty()
                  ? fmt::format("Engine froze: no activity for {}ms",
                                idle.count())
                  : fmt::format("Engine froze ({}ms): {}", idle.count(),
                                message),
              location),
          idle_(idle) {}

    [[nodiscard]] auto idle() const noexcept -> std::chrono::milliseconds {
        return idle_;
    }

private:
    std::chrono::milliseconds idle_;
};

/**
 * @brief Operation not allowed in the current lifecycle state
 */
class InvalidStateError : public SupervisorError {
public:
    explicit InvalidStateError(
        std::string_view message, std::string_view currentState = "",
        std::source_location location = std::source_location::current())
        : SupervisorError(
              currentState.empty()
                  ? fmt::format("Invalid state: {}", message)
                  : fmt::format("Invalid state ({}): {}", currentState,
                                message),
              location),
          currentState_(currentState) {}

    [[nodiscard]] auto currentState() const noexcept -> std::string_view {
        return currentState_;
    }

private:
    std::string currentState_;
};

/**
 * @brief Configuration could not be loaded or is invalid
 */
class ConfigError : public SupervisorError {
public:
    explicit ConfigError(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : SupervisorError(fmt::format("Configuration error: {}", message),
                          location) {}
};

}  // namespace wayfarer::supervisor
