#pragma once

#include "range_fetch.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

struct ExtractionCaps {
    size_t max_compressed_bytes = 5000000;
    size_t max_uncompressed_bytes = 15000000;
    std::chrono::milliseconds timeout{20000};
};

struct ExtractionResult {
    std::optional<std::string> html;
    std::string reason; // why html is absent; empty on success
};

// Single-document pipeline: range fetch, gunzip, record/HTTP split, transfer and
// content decoding, charset conversion, HTML gate. Holds no state between calls
// and never throws for a bad capture.
class HtmlExtractor {
public:
    explicit HtmlExtractor(RangeFetcher& fetcher) : fetcher_(fetcher) {}

    ExtractionResult extractHtml(const ByteRangeLocator& locator, const ExtractionCaps& caps = {},
                                 const CancelToken* cancel = nullptr);

    // Stages after the fetch, for a record that is already decompressed.
    static ExtractionResult extractFromRecord(std::string_view raw, size_t maxUncompressedBytes);

private:
    RangeFetcher& fetcher_;
};
