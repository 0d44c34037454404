/*
 * engine_profile.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Engine-specific command lines, markers and artifacts

**************************************************/

#ifndef WAYFARER_SUPERVISOR_ENGINE_PROFILE_HPP
#define WAYFARER_SUPERVISOR_ENGINE_PROFILE_HPP

#include "command_builder.hpp"
#include "line_classifier.hpp"
#include "types.hpp"

#include "config/engine_config.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wayfarer::supervisor {

/**
 * @brief Inputs for building one command line
 */
struct LaunchContext {
    std::filesystem::path graphRoot;       ///< Absolute
    std::filesystem::path graphDirectory;  ///< Absolute
    std::string graphName;
    std::vector<int> ports;  ///< Serve phase only, portsRequired() entries
    std::optional<std::filesystem::path> mapExtract;
};

/**
 * @brief Describes how to drive one journey-planning engine
 */
class EngineProfile {
public:
    virtual ~EngineProfile() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Build the phase-specific command line
     * @throws LaunchError if the context lacks something the engine needs
     */
    [[nodiscard]] virtual auto buildCommand(Phase phase,
                                            const LaunchContext& context) const
        -> ProcessConfig = 0;

    [[nodiscard]] virtual auto markers() const -> std::vector<MarkerRule> = 0;

    /**
     * @brief Number of ports the serve phase listens on
     */
    [[nodiscard]] virtual auto portsRequired() const -> int { return 1; }

    /**
     * @brief Path whose existence means a graph was built
     */
    [[nodiscard]] virtual auto graphArtifact(const LaunchContext& context) const
        -> std::filesystem::path = 0;

    /**
     * @brief File the engine itself is shipped as, if any
     */
    [[nodiscard]] virtual auto engineArtifact() const
        -> std::optional<std::filesystem::path> {
        return std::nullopt;
    }

    /**
     * @brief Where engineArtifact() can be downloaded from, empty if nowhere
     */
    [[nodiscard]] virtual auto downloadUrl() const -> std::string { return {}; }

    /**
     * @brief Check the engine can be launched
     * @return Empty string when launchable, otherwise the reason
     */
    [[nodiscard]] virtual auto validate() const -> std::string { return {}; }
};

/**
 * @brief Common launch logic for engines shipped as a runnable jar
 */
class JavaEngineProfile : public EngineProfile {
public:
    explicit JavaEngineProfile(config::EngineConfig config);

    [[nodiscard]] auto engineArtifact() const
        -> std::optional<std::filesystem::path> override;

    [[nodiscard]] auto downloadUrl() const -> std::string override;

    [[nodiscard]] auto validate() const -> std::string override;

    [[nodiscard]] auto engineConfig() const -> const config::EngineConfig& {
        return config_;
    }

protected:
    /**
     * @brief java [options] -jar <jar> with working directory and environment
     */
    [[nodiscard]] auto javaCommand(const LaunchContext& context) const
        -> CommandBuilder;

    config::EngineConfig config_;
};

/**
 * @brief OpenTripPlanner 1.x
 */
class OtpProfile : public JavaEngineProfile {
public:
    using JavaEngineProfile::JavaEngineProfile;

    [[nodiscard]] auto name() const -> std::string_view override {
        return "otp";
    }

    [[nodiscard]] auto buildCommand(Phase phase,
                                    const LaunchContext& context) const
        -> ProcessConfig override;

    [[nodiscard]] auto markers() const -> std::vector<MarkerRule> override {
        return otpMarkers();
    }

    /// HTTP and HTTPS
    [[nodiscard]] auto portsRequired() const -> int override { return 2; }

    [[nodiscard]] auto graphArtifact(const LaunchContext& context) const
        -> std::filesystem::path override {
        return context.graphDirectory / "Graph.obj";
    }
};

/**
 * @brief GraphHopper web service
 */
class GraphHopperProfile : public JavaEngineProfile {
public:
    using JavaEngineProfile::JavaEngineProfile;

    [[nodiscard]] auto name() const -> std::string_view override {
        return "graphhopper";
    }

    [[nodiscard]] auto buildCommand(Phase phase,
                                    const LaunchContext& context) const
        -> ProcessConfig override;

    [[nodiscard]] auto markers() const -> std::vector<MarkerRule> override {
        return graphHopperMarkers();
    }

    [[nodiscard]] auto graphArtifact(const LaunchContext& context) const
        -> std::filesystem::path override {
        return context.graphDirectory / "graph-cache";
    }
};

/**
 * @brief Create the profile named by config.kind
 * @throws ConfigError for an unknown kind
 */
[[nodiscard]] auto makeEngineProfile(const config::EngineConfig& config)
    -> std::shared_ptr<EngineProfile>;

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_ENGINE_PROFILE_HPP
