/*
 * data_fetcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Abstract source of engine inputs (map, transit feeds, jar)

**************************************************/

#ifndef WAYFARER_FETCH_DATA_FETCHER_HPP
#define WAYFARER_FETCH_DATA_FETCHER_HPP

#include "bounding_box.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wayfarer::fetch {

/**
 * @brief Files produced by one fetch() call
 */
struct FetchResult {
    std::filesystem::path mapExtract;
    std::vector<std::filesystem::path> transitFeeds;
};

/**
 * @brief Retrieves the data an engine needs before a graph build
 *
 * All methods report failures by throwing supervisor::FetchError.
 */
class DataFetcher {
public:
    virtual ~DataFetcher() = default;

    /**
     * @brief Download the street network for a box
     * @return Path of the written extract inside directory
     */
    virtual auto fetchMapExtract(const BoundingBox& box,
                                 const std::filesystem::path& directory)
        -> std::filesystem::path = 0;

    /**
     * @brief Download every GTFS feed covering a box
     * @return Paths of the feeds that were downloaded, never empty
     */
    virtual auto fetchTransitFeeds(const BoundingBox& box,
                                   const std::filesystem::path& directory)
        -> std::vector<std::filesystem::path> = 0;

    /**
     * @brief Download the engine distribution to destination
     */
    virtual void fetchEngine(const std::string& url,
                             const std::filesystem::path& destination) = 0;

    /**
     * @brief Map extract plus transit feeds
     *
     * A transit failure is logged and tolerated unless requireTransit is set.
     */
    auto fetch(const BoundingBox& box, const std::filesystem::path& directory,
               bool requireTransit = false) -> FetchResult;
};

}  // namespace wayfarer::fetch

#endif  // WAYFARER_FETCH_DATA_FETCHER_HPP
