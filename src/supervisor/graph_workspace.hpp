/*
 * graph_workspace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Per-graph working directory and its manifest

**************************************************/

#ifndef WAYFARER_SUPERVISOR_GRAPH_WORKSPACE_HPP
#define WAYFARER_SUPERVISOR_GRAPH_WORKSPACE_HPP

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace wayfarer::supervisor {

/**
 * @brief Contents of wayfarer.json inside a graph directory
 */
struct WorkspaceManifest {
    using time_point = std::chrono::system_clock::time_point;

    std::string engine;  ///< Engine that built the graph
    std::string bbox;    ///< Box the inputs were fetched for
    std::optional<time_point> mapFetchedAt;
    std::optional<time_point> transitFetchedAt;
    std::optional<time_point> graphBuiltAt;
    std::string mapFile;
    std::vector<std::string> transitFiles;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> WorkspaceManifest;
};

/**
 * @brief <root>/<name>/ holding inputs, the built graph and engine logs
 */
class GraphWorkspace {
public:
    static constexpr std::string_view MANIFEST_NAME = "wayfarer.json";

    GraphWorkspace(const std::filesystem::path& root, std::string_view name);

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto root() const -> const std::filesystem::path& {
        return root_;
    }
    [[nodiscard]] auto directory() const -> const std::filesystem::path& {
        return directory_;
    }

    /**
     * @brief Create the directory tree
     * @throws LaunchError if it cannot be created
     */
    void create() const;

    [[nodiscard]] auto manifestPath() const -> std::filesystem::path;

    /**
     * @brief Read the manifest; missing or unreadable yields an empty one
     */
    [[nodiscard]] auto loadManifest() const -> WorkspaceManifest;

    /**
     * @brief Write the manifest atomically (temp file + rename)
     * @throws LaunchError on I/O failure
     */
    void saveManifest(const WorkspaceManifest& manifest) const;

    /// *.osm and *.pbf files in the directory, sorted by name
    [[nodiscard]] auto findMapExtracts() const
        -> std::vector<std::filesystem::path>;

    /// *.zip files in the directory, sorted by name
    [[nodiscard]] auto findTransitFeeds() const
        -> std::vector<std::filesystem::path>;

    [[nodiscard]] auto logDirectory() const -> std::filesystem::path;

    /**
     * @brief logs/<phase>_<YYYYmmdd-HHMMSS>.log
     */
    [[nodiscard]] auto engineLogFile(Phase phase) const
        -> std::filesystem::path;

private:
    [[nodiscard]] auto findByExtension(
        std::initializer_list<std::string_view> extensions) const
        -> std::vector<std::filesystem::path>;

    std::filesystem::path root_;
    std::string name_;
    std::filesystem::path directory_;
};

/**
 * @brief UTC ISO-8601 with seconds, e.g. 2024-12-06T10:15:00Z
 */
[[nodiscard]] auto formatTimestamp(std::chrono::system_clock::time_point time)
    -> std::string;

[[nodiscard]] auto parseTimestamp(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point>;

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_GRAPH_WORKSPACE_HPP
