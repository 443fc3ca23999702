#pragma once

#include "http_client.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One row of the capture index.
struct CaptureRecord {
    std::optional<std::string> urlkey;
    std::string timestamp; // YYYYMMDDhhmmss
    std::string url;
    std::optional<std::string> mime;
    std::optional<std::string> mime_detected;
    std::optional<std::string> status;
    std::optional<std::string> digest;
    std::string length; // decimal, as served
    std::string offset; // decimal, as served
    std::string filename;
    std::optional<std::string> languages;
    std::optional<std::string> encoding;

    bool looksHtml() const;
};

struct CdxQuery {
    std::string url_pattern;          // "host/*" matches the host and everything below
    std::vector<std::string> filters; // each sent as its own filter= parameter
    std::vector<std::string> fields;  // fl=, empty for all
    bool sort_reverse = false;
    std::optional<unsigned> limit;
    unsigned page_size = 0; // 0 = server default
};

// Parses one NDJSON line. Blank or malformed lines yield nullopt.
std::optional<CaptureRecord> parseCaptureLine(std::string_view line);

class CdxClient;

// Lazy walk over every page of a query. Pages are fetched on demand;
// restart() rewinds to page 0 and re-fetches from the index.
class CaptureCursor {
public:
    CaptureCursor(CdxClient& client, std::string collectionId, CdxQuery query,
                  unsigned pages, const CancelToken* cancel);

    bool next(CaptureRecord& out);
    void restart();
    unsigned pageCount() const { return pages_; }

private:
    CdxClient& client_;
    std::string collection_;
    CdxQuery query_;
    unsigned pages_;
    const CancelToken* cancel_;

    unsigned next_page_ = 0;
    std::vector<CaptureRecord> buffer_;
    size_t pos_ = 0;
};

class CdxClient {
public:
    CdxClient(HttpTransport& transport, std::string indexBase,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(60000));

    std::string endpoint(const std::string& collectionId) const;
    std::string pageUrl(const std::string& collectionId, const CdxQuery& query, unsigned page) const;
    std::string pageCountUrl(const std::string& collectionId, const CdxQuery& query) const;

    // showNumPages query. Throws NetworkError, ProtocolError or ParseError.
    unsigned pageCount(const std::string& collectionId, const CdxQuery& query,
                       const CancelToken* cancel = nullptr);

    // One page; bad lines are skipped. Throws NetworkError or ProtocolError.
    std::vector<CaptureRecord> fetchPage(const std::string& collectionId, const CdxQuery& query,
                                         unsigned page, const CancelToken* cancel = nullptr);

    // Issues the page-count query, then iterates pages lazily.
    CaptureCursor queryCaptures(const std::string& collectionId, const CdxQuery& query,
                                const CancelToken* cancel = nullptr);

    // Newest HTML-looking 200 capture of one exact URL (not paginated).
    std::optional<CaptureRecord> latestCapture(const std::string& collectionId, const std::string& url,
                                               const CancelToken* cancel = nullptr);

private:
    std::vector<std::pair<std::string, std::string>> baseParams(const CdxQuery& query) const;
    std::vector<CaptureRecord> parseLines(const std::string& body) const;

    HttpTransport& transport_;
    std::string index_base_;
    std::chrono::milliseconds timeout_;
};
