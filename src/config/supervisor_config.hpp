/*
 * supervisor_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Engine supervisor configuration

**************************************************/

#ifndef WAYFARER_CONFIG_SUPERVISOR_CONFIG_HPP
#define WAYFARER_CONFIG_SUPERVISOR_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "config_section.hpp"
#include "engine_config.hpp"
#include "fetch_config.hpp"
#include "logging_config.hpp"

#include "fetch/bounding_box.hpp"
#include "supervisor/port_allocator.hpp"
#include "supervisor/types.hpp"

namespace wayfarer::config {

/**
 * @brief Everything an EngineSupervisor needs
 *
 * Durations are stored as std::chrono values; the JSON form uses whole
 * seconds for timeouts and deadlines and milliseconds for the keys ending
 * in "Ms".
 *
 * @example
 * ```json
 * {
 *   "graphName": "portland",
 *   "graphRoot": "graphs",
 *   "bbox": {"left": -122.8, "bottom": 45.4, "right": -122.5, "top": 45.6},
 *   "idleTimeout": 600,
 *   "livenessPolicy": "process_alive",
 *   "engine": {"kind": "otp", "jarPath": "otp.jar"}
 * }
 * ```
 */
struct SupervisorConfig : ConfigSection<SupervisorConfig> {
    static constexpr std::string_view PATH = "supervisor";

    // ========================================================================
    // Graph
    // ========================================================================

    std::string graphName{"default"};  ///< Directory name below graphRoot
    std::string graphRoot{"graphs"};   ///< Parent of all graph directories
    std::optional<fetch::BoundingBox> bbox;  ///< Area to fetch inputs for
    bool fetchInputs{true};    ///< Download missing inputs while preparing
    bool rebuildGraph{false};  ///< Ignore a graph recorded in the manifest

    // ========================================================================
    // Ports
    // ========================================================================

    std::optional<int> port;        ///< Fixed serve port, dynamic when unset
    std::optional<int> securePort;  ///< Fixed secure port (OpenTripPlanner)
    std::optional<supervisor::PortRange> portRange;  ///< Scan instead of OS
    std::string probeHost{"127.0.0.1"};  ///< Host for TCP liveness probes

    // ========================================================================
    // Timeouts
    // ========================================================================

    std::chrono::seconds idleTimeout{600};    ///< Silence allowed while
                                              ///< building and starting
    std::chrono::seconds freezeTimeout{300};  ///< Silence allowed while
                                              ///< serving (OutputActivity)
    std::chrono::seconds buildDeadline{0};    ///< 0 disables
    std::chrono::seconds startupDeadline{0};  ///< 0 disables
    std::chrono::milliseconds stopGracePeriod{5000};
    std::chrono::milliseconds pollInterval{250};
    std::chrono::milliseconds healthCheckInterval{5000};

    // ========================================================================
    // Policies
    // ========================================================================

    supervisor::ServeLivenessPolicy livenessPolicy{
        supervisor::ServeLivenessPolicy::ProcessAlive};
    int maxProbeFailures{3};  ///< Consecutive failed probes before Frozen
    int maxBindRetries{3};    ///< Serve relaunches after a bind failure
    size_t outputHistory{50};  ///< Lines kept for status and failures

    // ========================================================================
    // Sections
    // ========================================================================

    EngineConfig engine;
    FetchConfig fetch;
    LoggingConfig logging;

    [[nodiscard]] json serialize() const;

    [[nodiscard]] static SupervisorConfig deserialize(const json& j);

    [[nodiscard]] static json generateSchema();

    /**
     * @brief Check the configuration and its sections
     * @return Empty string when valid, otherwise the first problem found
     */
    [[nodiscard]] std::string validate() const;

    /**
     * @brief Load and validate a JSON configuration file
     *
     * The file may hold the supervisor keys at top level or below a
     * "supervisor" object.
     *
     * @throws supervisor::ConfigError on I/O, parse or validation errors
     */
    [[nodiscard]] static SupervisorConfig loadFromFile(
        const std::filesystem::path& path);

    /**
     * @brief graphRoot/graphName with unsafe characters replaced
     */
    [[nodiscard]] std::filesystem::path graphDirectory() const;
};

static_assert(ConfigSectionDerived<SupervisorConfig>);

/**
 * @brief Replace characters that break engine command lines with '_'
 */
[[nodiscard]] std::string sanitizeName(std::string_view name);

}  // namespace wayfarer::config

#endif  // WAYFARER_CONFIG_SUPERVISOR_CONFIG_HPP
