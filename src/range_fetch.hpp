#pragma once

#include "cdx.hpp"
#include "http_client.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Where one compressed record lives in the bulk data store.
struct ByteRangeLocator {
    std::string filename;
    uint64_t offset = 0;
    uint64_t length = 0;

    // "bytes=<offset>-<offset+length-1>"
    std::string rangeHeader() const;

    // nullopt when filename is missing, offset/length are not plain decimals, or
    // the range would run past 2^64.
    static std::optional<ByteRangeLocator> fromCapture(const CaptureRecord& record);
};

class RangeFetcher {
public:
    RangeFetcher(HttpTransport& transport, std::string dataBase);

    std::string objectUrl(const std::string& filename) const;

    // Compressed record bytes, or nullopt for a zero, oversized or wrapping
    // range (no request issued), a non-206 answer, a missing Content-Range, a
    // body longer than maxCompressedBytes (the transfer is cut off), a timeout
    // or any transport failure.
    std::optional<std::string> fetch(const ByteRangeLocator& locator, size_t maxCompressedBytes,
                                     std::chrono::milliseconds timeout,
                                     const CancelToken* cancel = nullptr);

private:
    HttpTransport& transport_;
    std::string data_base_;
};
