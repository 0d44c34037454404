/*
 * http_data_fetcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: HTTP data fetcher implementation

**************************************************/

#include "http_data_fetcher.hpp"

#include "supervisor/exceptions.hpp"

#include <curl/curl.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace wayfarer::fetch {

namespace fs = std::filesystem;
using json = nlohmann::json;
using supervisor::FetchError;

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

auto makeCurl() -> CurlHandle {
    static std::once_flag globalInit;
    std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_ALL); });

    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw FetchError("failed to initialize libcurl");
    }
    return curl;
}

// CURL write callback
size_t stringWriteCallback(char* ptr, size_t size, size_t nmemb,
                           void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// File write callback for downloads
size_t fileWriteCallback(char* ptr, size_t size, size_t nmemb,
                         void* userdata) {
    auto* file = static_cast<std::ofstream*>(userdata);
    file->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return file->good() ? size * nmemb : 0;
}

void applyCommonOptions(CURL* curl, const config::FetchConfig& config,
                        const std::string& url) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config.connectTimeout));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(config.requestTimeout));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

void checkTransfer(CURL* curl, CURLcode res, const std::string& url) {
    if (res != CURLE_OK) {
        throw FetchError(
            fmt::format("{}: {}", url, curl_easy_strerror(res)));
    }
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode < 200 || httpCode >= 300) {
        throw FetchError(fmt::format("{}: HTTP {}", url, httpCode));
    }
}

auto timestamp() -> std::string {
    auto now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y%m%d-%H%M%S}", fmt::localtime(now));
}

}  // namespace

HttpDataFetcher::HttpDataFetcher(config::FetchConfig config)
    : config_(std::move(config)) {}

auto HttpDataFetcher::urlEncode(const std::string& value) -> std::string {
    auto curl = makeCurl();
    char* output = curl_easy_escape(curl.get(), value.c_str(),
                                    static_cast<int>(value.length()));
    if (output == nullptr) {
        throw FetchError("failed to URL-encode query");
    }
    std::string result(output);
    curl_free(output);
    return result;
}

auto HttpDataFetcher::mapExtractUrl(const config::FetchConfig& config,
                                    const BoundingBox& box) -> std::string {
    if (config.waysOnly) {
        // Overpass QL boxes are south,west,north,east
        auto query = fmt::format(
            "way[\"highway\"]({:f},{:f},{:f},{:f});(._;>;);out;", box.bottom,
            box.left, box.top, box.right);
        return fmt::format("{}?data={}", config.overpassInterpreterUrl,
                           urlEncode(query));
    }
    return fmt::format("{}?bbox={}", config.overpassMapUrl, box.toString());
}

auto HttpDataFetcher::feedIndexUrl(const config::FetchConfig& config,
                                   const BoundingBox& box) -> std::string {
    return fmt::format("{}?bbox={}", config.transitlandUrl, box.toString());
}

auto HttpDataFetcher::parseFeedUrls(const std::string& body)
    -> std::vector<std::string> {
    json document;
    try {
        document = json::parse(body);
    } catch (const json::parse_error& e) {
        throw FetchError(fmt::format("malformed feed index: {}", e.what()));
    }

    if (!document.is_object() || !document.contains("feeds") ||
        !document["feeds"].is_array()) {
        throw FetchError("feed index has no feeds array");
    }

    std::vector<std::string> urls;
    for (const auto& feed : document["feeds"]) {
        if (feed.is_object() && feed.contains("url") &&
            feed["url"].is_string()) {
            urls.push_back(feed["url"].get<std::string>());
        }
    }
    return urls;
}

auto HttpDataFetcher::feedFileName(const std::string& url) -> std::string {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    auto slash = path.find_last_of('/');
    std::string name =
        slash == std::string::npos ? path : path.substr(slash + 1);

    if (name.empty()) {
        name = "untitled";
    }
    if (name.size() < 4 || name.compare(name.size() - 4, 4, ".zip") != 0) {
        name += ".zip";
    }
    return name;
}

void HttpDataFetcher::download(const std::string& url,
                               const fs::path& destination) const {
    auto partial = destination;
    partial += ".part";

    std::ofstream file(partial, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw FetchError(
            fmt::format("cannot open {} for writing", partial.string()));
    }

    auto curl = makeCurl();
    applyCommonOptions(curl.get(), config_, url);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, fileWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &file);

    spdlog::info("Downloading {}", url);
    CURLcode res = curl_easy_perform(curl.get());
    file.close();

    try {
        checkTransfer(curl.get(), res, url);
    } catch (const FetchError&) {
        std::error_code ec;
        fs::remove(partial, ec);
        throw;
    }

    std::error_code ec;
    fs::rename(partial, destination, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(partial, ec);
        throw FetchError(fmt::format("cannot move download to {}: {}",
                                     destination.string(), reason));
    }
    spdlog::info("=> {} ({} kB)", destination.string(),
                 fs::file_size(destination, ec) / 1024);
}

auto HttpDataFetcher::get(const std::string& url) const -> std::string {
    auto curl = makeCurl();
    std::string response;
    applyCommonOptions(curl.get(), config_, url);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, stringWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl.get());
    checkTransfer(curl.get(), res, url);
    return response;
}

auto HttpDataFetcher::fetchMapExtract(const BoundingBox& box,
                                      const fs::path& directory) -> fs::path {
    if (!box.isValid()) {
        throw FetchError("invalid bounding box " + box.toString());
    }

    std::error_code ec;
    fs::create_directories(directory, ec);

    auto destination = directory / fmt::format("map-{}.osm", timestamp());
    download(mapExtractUrl(config_, box), destination);

    auto size = fs::file_size(destination, ec);
    if (ec || size < config_.minMapSize) {
        fs::remove(destination, ec);
        throw FetchError(fmt::format(
            "map extract is smaller than {} bytes, the box may be empty or "
            "the server refused the query",
            config_.minMapSize));
    }
    return destination;
}

auto HttpDataFetcher::fetchTransitFeeds(const BoundingBox& box,
                                        const fs::path& directory)
    -> std::vector<fs::path> {
    auto indexUrl = feedIndexUrl(config_, box);
    spdlog::info("Querying feed index {}", indexUrl);
    auto urls = parseFeedUrls(get(indexUrl));
    if (urls.empty()) {
        throw FetchError("no transit feeds cover " + box.toString());
    }

    std::error_code ec;
    fs::create_directories(directory, ec);

    // Distinct destinations for feeds that share a basename
    std::vector<fs::path> destinations;
    std::set<std::string> used;
    for (const auto& url : urls) {
        auto name = feedFileName(url);
        auto stem = name.substr(0, name.size() - 4);
        for (int i = 1; used.contains(name); ++i) {
            name = fmt::format("{}.{}.zip", stem, i);
        }
        used.insert(name);
        destinations.push_back(directory / name);
    }

    std::atomic<std::size_t> next{0};
    std::mutex resultMutex;
    std::vector<fs::path> downloaded;

    auto worker = [&] {
        for (auto i = next++; i < urls.size(); i = next++) {
            try {
                download(urls[i], destinations[i]);
                std::lock_guard lock(resultMutex);
                downloaded.push_back(destinations[i]);
            } catch (const FetchError& e) {
                spdlog::warn("Feed download failed: {}", e.what());
            }
        }
    };

    auto threadCount =
        std::min<std::size_t>(std::max<std::size_t>(config_.parallelDownloads, 1),
                              urls.size());
    spdlog::info("Downloading {} feed(s) with {} parallel download(s)",
                 urls.size(), threadCount);

    std::vector<std::thread> workers;
    workers.reserve(threadCount);
    for (std::size_t t = 0; t < threadCount; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (downloaded.empty()) {
        throw FetchError(
            fmt::format("none of {} transit feeds could be downloaded",
                        urls.size()));
    }
    std::sort(downloaded.begin(), downloaded.end());
    return downloaded;
}

void HttpDataFetcher::fetchEngine(const std::string& url,
                                  const fs::path& destination) {
    if (url.empty()) {
        throw FetchError("no engine download URL configured");
    }
    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
    }
    download(url, destination);
}

}  // namespace wayfarer::fetch
