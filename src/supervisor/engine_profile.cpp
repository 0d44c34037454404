/*
 * engine_profile.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: OpenTripPlanner and GraphHopper launch profiles

**************************************************/

#include "engine_profile.hpp"

#include "engine_process.hpp"
#include "exceptions.hpp"

#include <fmt/format.h>

namespace wayfarer::supervisor {

namespace {

auto requirePorts(const LaunchContext& context, std::size_t count,
                  std::string_view engine) -> void {
    if (context.ports.size() < count) {
        throw LaunchError(fmt::format("{} serve phase needs {} port(s), got {}",
                                      engine, count, context.ports.size()));
    }
}

}  // namespace

JavaEngineProfile::JavaEngineProfile(config::EngineConfig config)
    : config_(std::move(config)) {}

auto JavaEngineProfile::engineArtifact() const
    -> std::optional<std::filesystem::path> {
    if (config_.jarPath.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(config_.jarPath);
}

auto JavaEngineProfile::downloadUrl() const -> std::string {
    return config_.downloadUrl;
}

auto JavaEngineProfile::validate() const -> std::string {
    if (config_.jarPath.empty()) {
        return "no engine jar configured";
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_.jarPath, ec)) {
        return fmt::format("engine jar not found: {}", config_.jarPath);
    }
    if (!EngineProcess::resolveExecutable(config_.javaPath)) {
        return fmt::format("java executable not found: {}", config_.javaPath);
    }
    return {};
}

auto JavaEngineProfile::javaCommand(const LaunchContext& context) const
    -> CommandBuilder {
    CommandBuilder builder(config_.javaPath);
    builder.addArgs(config_.javaOptions);

    std::error_code ec;
    auto jar = std::filesystem::absolute(config_.jarPath, ec);
    builder.addOption("-jar", ec ? config_.jarPath : jar.string());

    builder.setWorkingDirectory(context.graphDirectory);
    for (const auto& [key, value] : config_.environment) {
        builder.setEnv(key, value);
    }
    return builder;
}

auto OtpProfile::buildCommand(Phase phase, const LaunchContext& context) const
    -> ProcessConfig {
    auto builder = javaCommand(context);
    builder.addOption("--basePath", context.graphRoot.string());

    if (phase == Phase::Build) {
        builder.addOption("--build", context.graphDirectory.string());
        builder.addArgs(config_.extraBuildArgs);
        return builder.build();
    }

    requirePorts(context, 2, name());
    builder.addOption("--graphs", context.graphRoot.string())
        .addOption("--router", context.graphName)
        .addFlag("--server")
        .addOption("--port", context.ports[0])
        .addOption("--securePort", context.ports[1]);
    builder.addArgs(config_.extraServeArgs);
    return builder.build();
}

auto GraphHopperProfile::buildCommand(Phase phase,
                                      const LaunchContext& context) const
    -> ProcessConfig {
    if (!context.mapExtract) {
        throw LaunchError("GraphHopper needs an OSM extract in " +
                          context.graphDirectory.string());
    }

    auto builder = javaCommand(context);
    builder.addProperty("action", phase == Phase::Build ? "import" : "web")
        .addProperty("datareader.file", context.mapExtract->string())
        .addProperty("graph.location", graphArtifact(context).string())
        .addProperty("graph.flag_encoders", "car,foot,bike");

    if (phase == Phase::Build) {
        builder.addArgs(config_.extraBuildArgs);
        return builder.build();
    }

    requirePorts(context, 1, name());
    builder.addProperty("jetty.port", std::to_string(context.ports[0]));
    builder.addArgs(config_.extraServeArgs);
    return builder.build();
}

auto makeEngineProfile(const config::EngineConfig& config)
    -> std::shared_ptr<EngineProfile> {
    if (config.kind == "otp") {
        return std::make_shared<OtpProfile>(config);
    }
    if (config.kind == "graphhopper") {
        return std::make_shared<GraphHopperProfile>(config);
    }
    throw ConfigError(fmt::format("unknown engine kind: {}", config.kind));
}

}  // namespace wayfarer::supervisor
