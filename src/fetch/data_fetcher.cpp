/*
 * data_fetcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Combined fetch on top of the abstract fetcher operations

**************************************************/

#include "data_fetcher.hpp"

#include "supervisor/exceptions.hpp"

#include <spdlog/spdlog.h>

namespace wayfarer::fetch {

auto DataFetcher::fetch(const BoundingBox& box,
                        const std::filesystem::path& directory,
                        bool requireTransit) -> FetchResult {
    FetchResult result;
    result.mapExtract = fetchMapExtract(box, directory);

    try {
        result.transitFeeds = fetchTransitFeeds(box, directory);
    } catch (const supervisor::FetchError& e) {
        if (requireTransit) {
            throw;
        }
        spdlog::warn("Continuing without transit feeds: {}", e.what());
    }
    return result;
}

}  // namespace wayfarer::fetch
