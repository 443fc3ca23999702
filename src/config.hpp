#pragma once

#include "http_client.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <string>

struct Config {
    std::string collinfo_url = "https://index.commoncrawl.org/collinfo.json";
    std::string index_base = "https://index.commoncrawl.org";
    std::string data_base = "https://data.commoncrawl.org";
    std::string user_agent = "ccsift/1.0";

    size_t max_compressed_bytes = 5000000;
    size_t max_uncompressed_bytes = 15000000;
    std::chrono::milliseconds fetch_timeout{20000};
    std::chrono::milliseconds index_timeout{60000};

    unsigned page_size = 0; // 0 = server default
    int threads = 1;
    RetryPolicy retry; // index and collection directory requests
    Utils::LogLevel log_level = Utils::LogLevel::Info;
    bool profile = false;

    // Applies CCSIFT_* environment overrides (CCSIFT_RETRIES among them). Throws std::invalid_argument on bad values.
    void applyEnvironment();
};

// Strict unsigned parse used for flags and environment values.
size_t parseSize(const std::string& name, const std::string& value);
