#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// Header fields keyed by lowercased name; repeated fields are joined with ", ".
class HeaderMap {
public:
    void add(std::string_view name, std::string_view value);
    std::string get(std::string_view name) const; // empty when absent
    bool contains(std::string_view name) const;
    size_t size() const { return fields_.size(); }

private:
    std::unordered_map<std::string, std::string> fields_;
};

// The archive record's own header block.
struct WarcRecord {
    std::string version; // "1.0" from "WARC/1.0"
    HeaderMap headers;
    std::string type;    // WARC-Type
    std::string url;     // WARC-Target-URI
    std::string id;      // WARC-Record-ID
    size_t contentLength = 0;
};

// The HTTP response embedded in a record. body views into the buffer handed
// to parseHttpFromRecord and must not outlive it.
struct HttpPayload {
    std::string statusLine;
    HeaderMap headers;
    std::string_view body;
};

// Parses "Name: value" lines, splitting on the first colon.
HeaderMap parseHeaderLines(std::string_view block);

// Reads the WARC version line and header block at the start of a record.
std::optional<WarcRecord> parseWarcHeaders(std::string_view raw);

// True for "HTTP/<d>.<d> 200 ...".
bool isHttpOkStatusLine(std::string_view line);

// Locates the record/HTTP boundary and parses the embedded 200 response.
// nullopt when either boundary is missing or the status is not 200.
std::optional<HttpPayload> parseHttpFromRecord(std::string_view raw);
