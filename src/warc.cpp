#include "warc.hpp"
#include "utils.hpp"

#include <cctype>
#include <stdexcept>

namespace {

struct Boundary {
    size_t pos;
    size_t len;
};

// First blank line at or after `from`: CRLF CRLF, else LF LF.
std::optional<Boundary> findHeaderEnd(std::string_view data, size_t from) {
    size_t pos = data.find("\r\n\r\n", from);
    if (pos != std::string_view::npos) return Boundary{pos, 4};
    pos = data.find("\n\n", from);
    if (pos != std::string_view::npos) return Boundary{pos, 2};
    return std::nullopt;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

void HeaderMap::add(std::string_view name, std::string_view value) {
    std::string key = Utils::toLower(Utils::trimView(name));
    std::string val = Utils::trim(value);
    auto it = fields_.find(key);
    if (it != fields_.end()) {
        it->second += ", " + val;
    } else {
        fields_.emplace(std::move(key), std::move(val));
    }
}

std::string HeaderMap::get(std::string_view name) const {
    auto it = fields_.find(Utils::toLower(name));
    return it == fields_.end() ? std::string() : it->second;
}

bool HeaderMap::contains(std::string_view name) const {
    return fields_.count(Utils::toLower(name)) > 0;
}

HeaderMap parseHeaderLines(std::string_view block) {
    HeaderMap headers;
    for (std::string_view line : Utils::splitLines(block)) {
        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) continue;
        headers.add(line.substr(0, colon), line.substr(colon + 1));
    }
    return headers;
}

std::optional<WarcRecord> parseWarcHeaders(std::string_view raw) {
    // Skip blank lines some writers leave before the version line
    size_t start = raw.find_first_not_of("\r\n");
    if (start == std::string_view::npos || !Utils::startsWith(raw.substr(start), "WARC/")) {
        return std::nullopt;
    }
    auto end = findHeaderEnd(raw, start);
    if (!end) return std::nullopt;

    std::string_view block = raw.substr(start, end->pos - start);
    size_t eol = block.find('\n');
    std::string_view versionLine = Utils::trimView(block.substr(0, eol));

    WarcRecord record;
    record.version = std::string(versionLine.substr(5));
    if (eol != std::string_view::npos) {
        record.headers = parseHeaderLines(block.substr(eol + 1));
    }
    record.type = record.headers.get("warc-type");
    record.url = record.headers.get("warc-target-uri");
    record.id = record.headers.get("warc-record-id");
    std::string len = record.headers.get("content-length");
    if (!len.empty() && len.find_first_not_of("0123456789") == std::string::npos) {
        try {
            record.contentLength = static_cast<size_t>(std::stoull(len));
        } catch (const std::out_of_range&) {
            record.contentLength = 0;
        }
    }
    return record;
}

bool isHttpOkStatusLine(std::string_view line) {
    // HTTP/<d>.<d><ws>+200<word boundary>
    if (line.size() < 12 || !Utils::startsWith(line, "HTTP/")) return false;
    if (!isDigit(line[5]) || line[6] != '.' || !isDigit(line[7])) return false;
    size_t i = 8;
    if (i >= line.size() || (line[i] != ' ' && line[i] != '\t')) return false;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) i++;
    if (line.compare(i, 3, "200") != 0) return false;
    i += 3;
    if (i == line.size()) return true;
    unsigned char next = static_cast<unsigned char>(line[i]);
    return !(std::isalnum(next) || next == '_');
}

std::optional<HttpPayload> parseHttpFromRecord(std::string_view raw) {
    auto recordEnd = findHeaderEnd(raw, 0);
    if (!recordEnd) return std::nullopt;

    size_t httpStart = raw.find("HTTP/", recordEnd->pos + recordEnd->len);
    if (httpStart == std::string_view::npos) return std::nullopt;

    auto httpEnd = findHeaderEnd(raw, httpStart);
    if (!httpEnd) return std::nullopt;

    std::string_view block = raw.substr(httpStart, httpEnd->pos - httpStart);
    size_t eol = block.find('\n');
    std::string_view statusLine = block.substr(0, eol);
    if (!statusLine.empty() && statusLine.back() == '\r') statusLine.remove_suffix(1);
    if (!isHttpOkStatusLine(statusLine)) return std::nullopt;

    HttpPayload payload;
    payload.statusLine = std::string(statusLine);
    if (eol != std::string_view::npos) {
        payload.headers = parseHeaderLines(block.substr(eol + 1));
    }
    payload.body = raw.substr(httpEnd->pos + httpEnd->len);
    return payload;
}
