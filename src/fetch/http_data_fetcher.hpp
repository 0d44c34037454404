/*
 * http_data_fetcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: DataFetcher downloading from Overpass and Transitland via libcurl

**************************************************/

#ifndef WAYFARER_FETCH_HTTP_DATA_FETCHER_HPP
#define WAYFARER_FETCH_HTTP_DATA_FETCHER_HPP

#include "data_fetcher.hpp"

#include "config/fetch_config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wayfarer::fetch {

/**
 * @brief Downloads engine inputs over HTTP
 *
 * - Map extracts come from the Overpass API, either the full map export or
 *   a ways-only query when FetchConfig::waysOnly is set.
 * - Transit feeds are listed by the Transitland feed index and downloaded
 *   in parallel.
 *
 * Every transfer uses its own curl handle, so the fetcher can be shared
 * between threads.
 */
class HttpDataFetcher : public DataFetcher {
public:
    explicit HttpDataFetcher(config::FetchConfig config = {});

    auto fetchMapExtract(const BoundingBox& box,
                         const std::filesystem::path& directory)
        -> std::filesystem::path override;

    auto fetchTransitFeeds(const BoundingBox& box,
                           const std::filesystem::path& directory)
        -> std::vector<std::filesystem::path> override;

    void fetchEngine(const std::string& url,
                     const std::filesystem::path& destination) override;

    [[nodiscard]] auto config() const -> const config::FetchConfig& {
        return config_;
    }

    /**
     * @brief Overpass URL for a box
     */
    [[nodiscard]] static auto mapExtractUrl(const config::FetchConfig& config,
                                            const BoundingBox& box)
        -> std::string;

    /**
     * @brief Transitland feed index URL for a box
     */
    [[nodiscard]] static auto feedIndexUrl(const config::FetchConfig& config,
                                           const BoundingBox& box)
        -> std::string;

    /**
     * @brief Extract feeds[].url from a feed index response
     * @throws supervisor::FetchError if the body is not a feed index
     */
    [[nodiscard]] static auto parseFeedUrls(const std::string& body)
        -> std::vector<std::string>;

    /**
     * @brief Local file name for a feed URL, always ending in .zip
     */
    [[nodiscard]] static auto feedFileName(const std::string& url)
        -> std::string;

    [[nodiscard]] static auto urlEncode(const std::string& value)
        -> std::string;

private:
    /**
     * @brief Stream url into destination through a .part file
     * @throws supervisor::FetchError
     */
    void download(const std::string& url,
                  const std::filesystem::path& destination) const;

    [[nodiscard]] auto get(const std::string& url) const -> std::string;

    config::FetchConfig config_;
};

}  // namespace wayfarer::fetch

#endif  // WAYFARER_FETCH_HTTP_DATA_FETCHER_HPP
