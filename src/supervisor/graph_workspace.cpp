/*
 * graph_workspace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Graph workspace implementation

**************************************************/

#include "graph_workspace.hpp"

#include "exceptions.hpp"

#include "config/supervisor_config.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace wayfarer::supervisor {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

auto optionalTimestamp(const json& j, const char* key)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (j.contains(key) && j[key].is_string()) {
        return parseTimestamp(j[key].get<std::string>());
    }
    return std::nullopt;
}

auto timestampOrNull(
    const std::optional<std::chrono::system_clock::time_point>& time)
    -> json {
    return time ? json(formatTimestamp(*time)) : json(nullptr);
}

}  // namespace

auto formatTimestamp(std::chrono::system_clock::time_point time)
    -> std::string {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(seconds));
}

auto parseTimestamp(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream input(text);
    input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (input.fail()) {
        return std::nullopt;
    }
    auto seconds = ::timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

auto WorkspaceManifest::toJson() const -> json {
    return {{"engine", engine},
            {"bbox", bbox},
            {"mapFetchedAt", timestampOrNull(mapFetchedAt)},
            {"transitFetchedAt", timestampOrNull(transitFetchedAt)},
            {"graphBuiltAt", timestampOrNull(graphBuiltAt)},
            {"mapFile", mapFile},
            {"transitFiles", transitFiles}};
}

auto WorkspaceManifest::fromJson(const json& j) -> WorkspaceManifest {
    WorkspaceManifest manifest;
    manifest.engine = j.value("engine", "");
    manifest.bbox = j.value("bbox", "");
    manifest.mapFetchedAt = optionalTimestamp(j, "mapFetchedAt");
    manifest.transitFetchedAt = optionalTimestamp(j, "transitFetchedAt");
    manifest.graphBuiltAt = optionalTimestamp(j, "graphBuiltAt");
    manifest.mapFile = j.value("mapFile", "");
    manifest.transitFiles =
        j.value("transitFiles", std::vector<std::string>{});
    return manifest;
}

GraphWorkspace::GraphWorkspace(const fs::path& root, std::string_view name)
    : root_(config::sanitizeName(root.string())),
      name_(config::sanitizeName(name)),
      directory_(root_ / name_) {}

void GraphWorkspace::create() const {
    std::error_code ec;
    fs::create_directories(logDirectory(), ec);
    if (ec) {
        throw LaunchError(fmt::format("cannot create graph directory {}: {}",
                                      directory_.string(), ec.message()));
    }
}

auto GraphWorkspace::manifestPath() const -> fs::path {
    return directory_ / MANIFEST_NAME;
}

auto GraphWorkspace::loadManifest() const -> WorkspaceManifest {
    auto path = manifestPath();
    std::ifstream file(path);
    if (!file) {
        return {};
    }

    try {
        return WorkspaceManifest::fromJson(json::parse(file));
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring unreadable manifest {}: {}", path.string(),
                     e.what());
        return {};
    }
}

void GraphWorkspace::saveManifest(const WorkspaceManifest& manifest) const {
    auto path = manifestPath();
    auto temp = path;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            throw LaunchError(
                fmt::format("cannot write manifest {}", temp.string()));
        }
        file << manifest.toJson().dump(2) << '\n';
        if (!file) {
            throw LaunchError(
                fmt::format("cannot write manifest {}", temp.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        throw LaunchError(fmt::format("cannot replace manifest {}: {}",
                                      path.string(), ec.message()));
    }
    spdlog::debug("Manifest written to {}", path.string());
}

auto GraphWorkspace::findByExtension(
    std::initializer_list<std::string_view> extensions) const
    -> std::vector<fs::path> {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        auto extension = it->path().extension().string();
        if (std::find(extensions.begin(), extensions.end(), extension) !=
            extensions.end()) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

auto GraphWorkspace::findMapExtracts() const -> std::vector<fs::path> {
    return findByExtension({".osm", ".pbf"});
}

auto GraphWorkspace::findTransitFeeds() const -> std::vector<fs::path> {
    return findByExtension({".zip"});
}

auto GraphWorkspace::logDirectory() const -> fs::path {
    return directory_ / "logs";
}

auto GraphWorkspace::engineLogFile(Phase phase) const -> fs::path {
    auto now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    auto stamp = fmt::format("{:%Y%m%d-%H%M%S}", fmt::localtime(now));
    std::string prefix = phase == Phase::Build ? "build" : "serve";
    return logDirectory() / fmt::format("{}_{}.log", prefix, stamp);
}

}  // namespace wayfarer::supervisor
