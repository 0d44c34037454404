/*
 * supervisor_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Engine supervisor configuration (JSON mapping and validation)

**************************************************/

#include "supervisor_config.hpp"

#include "supervisor/exceptions.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace wayfarer::config {

namespace {

constexpr std::string_view ILLEGAL_CHARACTERS = "()?";

auto bboxToJson(const fetch::BoundingBox& box) -> json {
    return {{"left", box.left},
            {"bottom", box.bottom},
            {"right", box.right},
            {"top", box.top}};
}

/// Accepts {"left":..,"bottom":..,"right":..,"top":..} or [l, b, r, t]
auto bboxFromJson(const json& j) -> fetch::BoundingBox {
    fetch::BoundingBox box;
    if (j.is_array()) {
        if (j.size() != 4) {
            throw supervisor::ConfigError(
                "bbox array must hold left, bottom, right, top");
        }
        box.left = j[0].get<double>();
        box.bottom = j[1].get<double>();
        box.right = j[2].get<double>();
        box.top = j[3].get<double>();
        return box;
    }
    box.left = j.at("left").get<double>();
    box.bottom = j.at("bottom").get<double>();
    box.right = j.at("right").get<double>();
    box.top = j.at("top").get<double>();
    return box;
}

template <typename T>
auto optionalValue(const json& j, const char* key) -> std::optional<T> {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return std::nullopt;
}

}  // namespace

std::string sanitizeName(std::string_view name) {
    std::string result(name);
    for (auto& c : result) {
        if (ILLEGAL_CHARACTERS.find(c) != std::string_view::npos) {
            c = '_';
        }
    }
    return result;
}

json SupervisorConfig::serialize() const {
    json j = {
        // Graph
        {"graphName", graphName},
        {"graphRoot", graphRoot},
        {"bbox", bbox ? bboxToJson(*bbox) : json(nullptr)},
        {"fetchInputs", fetchInputs},
        {"rebuildGraph", rebuildGraph},
        // Ports
        {"port", port ? json(*port) : json(nullptr)},
        {"securePort", securePort ? json(*securePort) : json(nullptr)},
        {"portRange", portRange ? json::array({portRange->first,
                                               portRange->last})
                                : json(nullptr)},
        {"probeHost", probeHost},
        // Timeouts
        {"idleTimeout", idleTimeout.count()},
        {"freezeTimeout", freezeTimeout.count()},
        {"buildDeadline", buildDeadline.count()},
        {"startupDeadline", startupDeadline.count()},
        {"stopGracePeriodMs", stopGracePeriod.count()},
        {"pollIntervalMs", pollInterval.count()},
        {"healthCheckIntervalMs", healthCheckInterval.count()},
        // Policies
        {"livenessPolicy", std::string(supervisor::toString(livenessPolicy))},
        {"maxProbeFailures", maxProbeFailures},
        {"maxBindRetries", maxBindRetries},
        {"outputHistory", outputHistory}};

    j[std::string(EngineConfig::PATH)] = engine.toJson();
    j[std::string(FetchConfig::PATH)] = fetch.toJson();
    j[std::string(LoggingConfig::PATH)] = logging.toJson();
    return j;
}

SupervisorConfig SupervisorConfig::deserialize(const json& j) {
    SupervisorConfig cfg;

    // Graph
    cfg.graphName = j.value("graphName", cfg.graphName);
    cfg.graphRoot = j.value("graphRoot", cfg.graphRoot);
    if (j.contains("bbox") && !j["bbox"].is_null()) {
        cfg.bbox = bboxFromJson(j["bbox"]);
    }
    cfg.fetchInputs = j.value("fetchInputs", cfg.fetchInputs);
    cfg.rebuildGraph = j.value("rebuildGraph", cfg.rebuildGraph);

    // Ports
    cfg.port = optionalValue<int>(j, "port");
    cfg.securePort = optionalValue<int>(j, "securePort");
    if (auto range = optionalValue<std::vector<int>>(j, "portRange")) {
        if (range->size() != 2) {
            throw supervisor::ConfigError("portRange must be [first, last]");
        }
        cfg.portRange = supervisor::PortRange{(*range)[0], (*range)[1]};
    }
    cfg.probeHost = j.value("probeHost", cfg.probeHost);

    // Timeouts
    cfg.idleTimeout =
        std::chrono::seconds(j.value("idleTimeout", cfg.idleTimeout.count()));
    cfg.freezeTimeout = std::chrono::seconds(
        j.value("freezeTimeout", cfg.freezeTimeout.count()));
    cfg.buildDeadline = std::chrono::seconds(
        j.value("buildDeadline", cfg.buildDeadline.count()));
    cfg.startupDeadline = std::chrono::seconds(
        j.value("startupDeadline", cfg.startupDeadline.count()));
    cfg.stopGracePeriod = std::chrono::milliseconds(
        j.value("stopGracePeriodMs", cfg.stopGracePeriod.count()));
    cfg.pollInterval = std::chrono::milliseconds(
        j.value("pollIntervalMs", cfg.pollInterval.count()));
    cfg.healthCheckInterval = std::chrono::milliseconds(
        j.value("healthCheckIntervalMs", cfg.healthCheckInterval.count()));

    // Policies
    if (j.contains("livenessPolicy")) {
        auto name = j["livenessPolicy"].get<std::string>();
        auto policy = supervisor::livenessPolicyFromString(name);
        if (!policy) {
            throw supervisor::ConfigError("unknown livenessPolicy: " + name);
        }
        cfg.livenessPolicy = *policy;
    }
    cfg.maxProbeFailures = j.value("maxProbeFailures", cfg.maxProbeFailures);
    cfg.maxBindRetries = j.value("maxBindRetries", cfg.maxBindRetries);
    cfg.outputHistory = j.value("outputHistory", cfg.outputHistory);

    cfg.engine = EngineConfig::fromParent(j);
    cfg.fetch = FetchConfig::fromParent(j);
    cfg.logging = LoggingConfig::fromParent(j);

    return cfg;
}

json SupervisorConfig::generateSchema() {
    json schema = {
        {"type", "object"},
        {"properties",
         {{"graphName", {{"type", "string"}, {"default", "default"}}},
          {"graphRoot", {{"type", "string"}, {"default", "graphs"}}},
          {"bbox", {{"type", {"object", "array", "null"}}}},
          {"fetchInputs", {{"type", "boolean"}, {"default", true}}},
          {"rebuildGraph", {{"type", "boolean"}, {"default", false}}},
          {"port",
           {{"type", {"integer", "null"}}, {"minimum", 1}, {"maximum", 65535}}},
          {"securePort",
           {{"type", {"integer", "null"}}, {"minimum", 1}, {"maximum", 65535}}},
          {"portRange",
           {{"type", {"array", "null"}},
            {"items", {{"type", "integer"}}},
            {"minItems", 2},
            {"maxItems", 2}}},
          {"probeHost", {{"type", "string"}, {"default", "127.0.0.1"}}},
          {"idleTimeout",
           {{"type", "integer"}, {"minimum", 1}, {"default", 600}}},
          {"freezeTimeout",
           {{"type", "integer"}, {"minimum", 1}, {"default", 300}}},
          {"buildDeadline",
           {{"type", "integer"}, {"minimum", 0}, {"default", 0}}},
          {"startupDeadline",
           {{"type", "integer"}, {"minimum", 0}, {"default", 0}}},
          {"stopGracePeriodMs",
           {{"type", "integer"}, {"minimum", 0}, {"default", 5000}}},
          {"pollIntervalMs",
           {{"type", "integer"},
            {"minimum", 10},
            {"maximum", 10000},
            {"default", 250}}},
          {"healthCheckIntervalMs",
           {{"type", "integer"}, {"minimum", 100}, {"default", 5000}}},
          {"livenessPolicy",
           {{"type", "string"},
            {"enum", {"process_alive", "output_activity", "tcp_probe"}},
            {"default", "process_alive"}}},
          {"maxProbeFailures",
           {{"type", "integer"}, {"minimum", 1}, {"default", 3}}},
          {"maxBindRetries",
           {{"type", "integer"}, {"minimum", 0}, {"default", 3}}},
          {"outputHistory",
           {{"type", "integer"}, {"minimum", 1}, {"default", 50}}}}}};

    schema["properties"][std::string(EngineConfig::PATH)] =
        EngineConfig::schema();
    schema["properties"][std::string(FetchConfig::PATH)] = FetchConfig::schema();
    schema["properties"][std::string(LoggingConfig::PATH)] =
        LoggingConfig::schema();
    return schema;
}

std::string SupervisorConfig::validate() const {
    if (graphName.empty()) {
        return "graphName must not be empty";
    }
    if (graphName.find('/') != std::string::npos) {
        return "graphName must not contain '/'";
    }
    if (graphRoot.empty()) {
        return "graphRoot must not be empty";
    }
    if (bbox && !bbox->isValid()) {
        return "bbox is not a valid WGS84 box: " + bbox->toString();
    }
    if (port && !supervisor::PortAllocator::isValidPort(*port)) {
        return "port out of range: " + std::to_string(*port);
    }
    if (securePort && !supervisor::PortAllocator::isValidPort(*securePort)) {
        return "securePort out of range: " + std::to_string(*securePort);
    }
    if (port && securePort && *port == *securePort) {
        return "port and securePort must differ";
    }
    if (portRange) {
        if (!supervisor::PortAllocator::isValidPort(portRange->first) ||
            !supervisor::PortAllocator::isValidPort(portRange->last) ||
            portRange->first > portRange->last) {
            return "portRange must be an ascending pair of valid ports";
        }
    }
    if (idleTimeout.count() <= 0) {
        return "idleTimeout must be positive";
    }
    if (freezeTimeout.count() <= 0) {
        return "freezeTimeout must be positive";
    }
    if (buildDeadline.count() < 0 || startupDeadline.count() < 0) {
        return "deadlines must not be negative";
    }
    if (stopGracePeriod.count() < 0) {
        return "stopGracePeriodMs must not be negative";
    }
    if (pollInterval.count() <= 0) {
        return "pollIntervalMs must be positive";
    }
    if (healthCheckInterval.count() <= 0) {
        return "healthCheckIntervalMs must be positive";
    }
    if (maxProbeFailures < 1) {
        return "maxProbeFailures must be at least 1";
    }
    if (maxBindRetries < 0) {
        return "maxBindRetries must not be negative";
    }
    if (outputHistory == 0) {
        return "outputHistory must be at least 1";
    }

    if (auto error = engine.validate(); !error.empty()) {
        return error;
    }
    if (auto error = fetch.validate(); !error.empty()) {
        return error;
    }
    return logging.validate();
}

SupervisorConfig SupervisorConfig::loadFromFile(
    const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw supervisor::ConfigError("cannot open " + path.string());
    }

    json document;
    try {
        document = json::parse(file, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw supervisor::ConfigError(path.string() + ": " + e.what());
    }

    if (!document.is_object()) {
        throw supervisor::ConfigError(path.string() +
                                      ": top level must be an object");
    }

    const json& root = document.contains(std::string(PATH)) &&
                               document[std::string(PATH)].is_object()
                           ? document[std::string(PATH)]
                           : document;

    SupervisorConfig cfg;
    try {
        cfg = deserialize(root);
    } catch (const json::exception& e) {
        throw supervisor::ConfigError(path.string() + ": " + e.what());
    }

    if (auto error = cfg.validate(); !error.empty()) {
        throw supervisor::ConfigError(path.string() + ": " + error);
    }

    spdlog::info("Loaded configuration from {}", path.string());
    return cfg;
}

std::filesystem::path SupervisorConfig::graphDirectory() const {
    return std::filesystem::path(sanitizeName(graphRoot)) /
           sanitizeName(graphName);
}

}  // namespace wayfarer::config
