/*
 * fetch_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Input data download configuration section

**************************************************/

#ifndef WAYFARER_CONFIG_FETCH_CONFIG_HPP
#define WAYFARER_CONFIG_FETCH_CONFIG_HPP

#include <string>

#include "config_section.hpp"

namespace wayfarer::config {

/**
 * @brief Where and how map extracts and transit feeds are downloaded
 *
 * @example
 * ```json
 * "fetch": {
 *   "waysOnly": false,
 *   "minMapSize": 10000,
 *   "parallelDownloads": 4,
 *   "requireTransit": false
 * }
 * ```
 */
struct FetchConfig : ConfigSection<FetchConfig> {
    static constexpr std::string_view PATH = "fetch";

    // ========================================================================
    // Endpoints
    // ========================================================================

    std::string overpassInterpreterUrl{
        "https://overpass-api.de/api/interpreter"};  ///< Ways-only queries
    std::string overpassMapUrl{
        "https://overpass-api.de/api/map"};  ///< Full map exports
    std::string transitlandUrl{
        "https://transit.land/api/v1/feeds"};  ///< Feed index

    // ========================================================================
    // Behaviour
    // ========================================================================

    bool fetchTransit{true};      ///< Download GTFS feeds for the box
    bool requireTransit{false};   ///< Fail when no feed could be downloaded
    bool waysOnly{false};         ///< Only highway ways and their nodes
    size_t minMapSize{10000};     ///< Smaller map extracts are rejected
    size_t parallelDownloads{4};  ///< Concurrent feed downloads

    // ========================================================================
    // HTTP
    // ========================================================================

    size_t connectTimeout{30};  ///< Seconds
    size_t requestTimeout{0};   ///< Seconds, 0 waits indefinitely
    std::string userAgent{"wayfarer/1.0"};

    [[nodiscard]] json serialize() const {
        return {{"overpassInterpreterUrl", overpassInterpreterUrl},
                {"overpassMapUrl", overpassMapUrl},
                {"transitlandUrl", transitlandUrl},
                {"fetchTransit", fetchTransit},
                {"requireTransit", requireTransit},
                {"waysOnly", waysOnly},
                {"minMapSize", minMapSize},
                {"parallelDownloads", parallelDownloads},
                {"connectTimeout", connectTimeout},
                {"requestTimeout", requestTimeout},
                {"userAgent", userAgent}};
    }

    [[nodiscard]] static FetchConfig deserialize(const json& j) {
        FetchConfig cfg;
        cfg.overpassInterpreterUrl =
            j.value("overpassInterpreterUrl", cfg.overpassInterpreterUrl);
        cfg.overpassMapUrl = j.value("overpassMapUrl", cfg.overpassMapUrl);
        cfg.transitlandUrl = j.value("transitlandUrl", cfg.transitlandUrl);
        cfg.fetchTransit = j.value("fetchTransit", cfg.fetchTransit);
        cfg.requireTransit = j.value("requireTransit", cfg.requireTransit);
        cfg.waysOnly = j.value("waysOnly", cfg.waysOnly);
        cfg.minMapSize = j.value("minMapSize", cfg.minMapSize);
        cfg.parallelDownloads =
            j.value("parallelDownloads", cfg.parallelDownloads);
        cfg.connectTimeout = j.value("connectTimeout", cfg.connectTimeout);
        cfg.requestTimeout = j.value("requestTimeout", cfg.requestTimeout);
        cfg.userAgent = j.value("userAgent", cfg.userAgent);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties",
             {{"overpassInterpreterUrl", {{"type", "string"}}},
              {"overpassMapUrl", {{"type", "string"}}},
              {"transitlandUrl", {{"type", "string"}}},
              {"fetchTransit", {{"type", "boolean"}, {"default", true}}},
              {"requireTransit", {{"type", "boolean"}, {"default", false}}},
              {"waysOnly", {{"type", "boolean"}, {"default", false}}},
              {"minMapSize",
               {{"type", "integer"}, {"minimum", 0}, {"default", 10000}}},
              {"parallelDownloads",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", 32},
                {"default", 4}}},
              {"connectTimeout",
               {{"type", "integer"}, {"minimum", 1}, {"default", 30}}},
              {"requestTimeout",
               {{"type", "integer"}, {"minimum", 0}, {"default", 0}}},
              {"userAgent", {{"type", "string"}}}}}};
    }

    [[nodiscard]] std::string validate() const {
        if (overpassInterpreterUrl.empty() || overpassMapUrl.empty()) {
            return "fetch: Overpass endpoints must not be empty";
        }
        if (fetchTransit && transitlandUrl.empty()) {
            return "fetch.transitlandUrl must not be empty";
        }
        if (parallelDownloads == 0) {
            return "fetch.parallelDownloads must be at least 1";
        }
        if (connectTimeout == 0) {
            return "fetch.connectTimeout must be at least 1 second";
        }
        return {};
    }
};

}  // namespace wayfarer::config

#endif  // WAYFARER_CONFIG_FETCH_CONFIG_HPP
