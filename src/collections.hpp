#pragma once

#include "http_client.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct CollectionInfo {
    std::string id; // CC-MAIN-YYYY-WW
    std::optional<std::string> name;
    std::optional<std::string> timegate_url;
    std::optional<std::string> cdx_api_url;
};

// True for ids shaped like CC-MAIN-2024-10.
bool isCrawlId(const std::string& id);

// Parses the collection directory JSON array. Throws ParseError.
std::vector<CollectionInfo> parseCollections(const std::string& json);

class CollectionDirectory {
public:
    CollectionDirectory(HttpTransport& transport, std::string url,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(60000));

    // Crawl collections, newest first (re-sorted by id). Throws NetworkError,
    // ProtocolError or ParseError; discovery cannot proceed without it.
    std::vector<CollectionInfo> fetch(const CancelToken* cancel = nullptr);

    std::vector<std::string> recentIds(size_t limit, const CancelToken* cancel = nullptr);

    // The requested id when given, else the newest collection.
    std::string select(const std::optional<std::string>& requested, const CancelToken* cancel = nullptr);

private:
    HttpTransport& transport_;
    std::string url_;
    std::chrono::milliseconds timeout_;
};
