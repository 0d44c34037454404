/*
 * engine_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Journey-planning engine launch configuration section

**************************************************/

#ifndef WAYFARER_CONFIG_ENGINE_CONFIG_HPP
#define WAYFARER_CONFIG_ENGINE_CONFIG_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "config_section.hpp"

namespace wayfarer::config {

/**
 * @brief Which engine to run and how to launch its JVM
 *
 * @example
 * ```json
 * "engine": {
 *   "kind": "otp",
 *   "javaPath": "java",
 *   "javaOptions": ["-Xmx4G"],
 *   "jarPath": "engines/otp-1.5.0-shaded.jar",
 *   "downloadUrl": "https://repo1.maven.org/.../otp-1.5.0-shaded.jar"
 * }
 * ```
 */
struct EngineConfig : ConfigSection<EngineConfig> {
    static constexpr std::string_view PATH = "engine";

    std::string kind{"otp"};                        ///< "otp" or "graphhopper"
    std::string javaPath{"java"};                   ///< JVM executable
    std::vector<std::string> javaOptions{"-Xmx2G"};  ///< Options before -jar
    std::string jarPath;                            ///< Engine jar
    std::string downloadUrl;  ///< Jar to fetch when jarPath is missing

    std::vector<std::string> extraBuildArgs;  ///< Appended to the build line
    std::vector<std::string> extraServeArgs;  ///< Appended to the serve line
    std::map<std::string, std::string> environment;  ///< Extra variables

    [[nodiscard]] json serialize() const {
        return {{"kind", kind},
                {"javaPath", javaPath},
                {"javaOptions", javaOptions},
                {"jarPath", jarPath},
                {"downloadUrl", downloadUrl},
                {"extraBuildArgs", extraBuildArgs},
                {"extraServeArgs", extraServeArgs},
                {"environment", environment}};
    }

    [[nodiscard]] static EngineConfig deserialize(const json& j) {
        EngineConfig cfg;
        cfg.kind = j.value("kind", cfg.kind);
        cfg.javaPath = j.value("javaPath", cfg.javaPath);
        cfg.javaOptions = j.value("javaOptions", cfg.javaOptions);
        cfg.jarPath = j.value("jarPath", cfg.jarPath);
        cfg.downloadUrl = j.value("downloadUrl", cfg.downloadUrl);
        cfg.extraBuildArgs = j.value("extraBuildArgs", cfg.extraBuildArgs);
        cfg.extraServeArgs = j.value("extraServeArgs", cfg.extraServeArgs);
        cfg.environment = j.value("environment", cfg.environment);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {{"type", "object"},
                {"properties",
                 {{"kind",
                   {{"type", "string"},
                    {"enum", {"otp", "graphhopper"}},
                    {"default", "otp"}}},
                  {"javaPath", {{"type", "string"}, {"default", "java"}}},
                  {"javaOptions",
                   {{"type", "array"}, {"items", {{"type", "string"}}}}},
                  {"jarPath", {{"type", "string"}}},
                  {"downloadUrl", {{"type", "string"}}},
                  {"extraBuildArgs",
                   {{"type", "array"}, {"items", {{"type", "string"}}}}},
                  {"extraServeArgs",
                   {{"type", "array"}, {"items", {{"type", "string"}}}}},
                  {"environment", {{"type", "object"}}}}}};
    }

    [[nodiscard]] std::string validate() const {
        if (kind != "otp" && kind != "graphhopper") {
            return "engine.kind must be \"otp\" or \"graphhopper\", got \"" +
                   kind + "\"";
        }
        if (javaPath.empty()) {
            return "engine.javaPath must not be empty";
        }
        // Downloads are saved as the jar itself and never unpacked
        auto path = downloadUrl.substr(0, downloadUrl.find_first_of("?#"));
        for (std::string_view archive : {".zip", ".tar.gz", ".tgz"}) {
            if (path.ends_with(archive)) {
                return "engine.downloadUrl must point at a runnable jar, not "
                       "an archive: " +
                       downloadUrl;
            }
        }
        return {};
    }
};

}  // namespace wayfarer::config

#endif  // WAYFARER_CONFIG_ENGINE_CONFIG_HPP
