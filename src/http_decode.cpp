#include "http_decode.hpp"
#include "decompress.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Hex chunk size, ignoring extensions after ';'. False when malformed.
bool parseChunkSize(std::string_view line, size_t& size) {
    size_t semi = line.find(';');
    if (semi != std::string_view::npos) line = line.substr(0, semi);
    line = Utils::trimView(line);
    if (line.empty() || line.size() > 15) return false;
    size = 0;
    for (char c : line) {
        int v = hexValue(c);
        if (v < 0) return false;
        size = size * 16 + static_cast<size_t>(v);
    }
    return true;
}

} // namespace

std::string decodeChunked(std::string_view body) {
    std::string out;
    size_t i = 0;
    while (i < body.size()) {
        size_t lineEnd = body.find("\r\n", i);
        if (lineEnd == std::string_view::npos) break;

        size_t size = 0;
        if (!parseChunkSize(body.substr(i, lineEnd - i), size)) break;
        i = lineEnd + 2;
        if (size == 0) break;

        size_t take = std::min(size, body.size() - i);
        out.append(body.data() + i, take);
        if (take < size) break;
        i += size + 2; // trailing CRLF
    }
    return out;
}

std::string decodeBody(std::string_view body, const HeaderMap& headers, size_t maxOutput) {
    std::string bytes;
    if (Utils::containsIgnoreCase(headers.get("transfer-encoding"), "chunked")) {
        bytes = decodeChunked(body);
    } else {
        bytes.assign(body.data(), body.size());
    }

    std::string ce = Utils::toLower(headers.get("content-encoding"));
    if (ce.empty()) return bytes;

    try {
        if (ce.find("gzip") != std::string::npos) return gunzip(bytes, maxOutput);
        if (ce.find("br") != std::string::npos) return brotliDecompress(bytes, maxOutput);
        if (ce.find("deflate") != std::string::npos) return inflateDeflate(bytes, maxOutput);
    } catch (const DecodeError& e) {
        Utils::log(Utils::LogLevel::Debug, "decode", std::string("keeping encoded body: ") + e.what());
    }
    return bytes;
}
