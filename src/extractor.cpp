#include "extractor.hpp"
#include "charset.hpp"
#include "decompress.hpp"
#include "errors.hpp"
#include "html_gate.hpp"
#include "http_decode.hpp"
#include "utils.hpp"
#include "warc.hpp"

namespace {

ExtractionResult absent(std::string reason) {
    ExtractionResult r;
    r.reason = std::move(reason);
    return r;
}

} // namespace

ExtractionResult HtmlExtractor::extractFromRecord(std::string_view raw, size_t maxUncompressedBytes) {
    std::optional<HttpPayload> payload;
    {
        Utils::ScopedTimer t("RecordParse");
        payload = parseHttpFromRecord(raw);
    }
    if (!payload) return absent("no_http_200");

    std::string body;
    try {
        Utils::ScopedTimer t("BodyDecode");
        body = decodeBody(payload->body, payload->headers, maxUncompressedBytes);
    } catch (const CcsiftError& e) {
        return absent(std::string("body_decode: ") + e.what());
    }

    std::string text = decodeText(body, payload->headers);
    auto html = acceptHtml(std::move(text), payload->headers);
    if (!html) return absent("not_html");

    ExtractionResult r;
    r.html = std::move(html);
    return r;
}

ExtractionResult HtmlExtractor::extractHtml(const ByteRangeLocator& locator, const ExtractionCaps& caps,
                                            const CancelToken* cancel) {
    if (locator.length == 0) return absent("zero_length");
    if (locator.length > caps.max_compressed_bytes) return absent("compressed_cap");

    auto compressed = fetcher_.fetch(locator, caps.max_compressed_bytes, caps.timeout, cancel);
    if (!compressed) return absent("fetch_failed");

    auto raw = decompressRecord(*compressed, caps.max_uncompressed_bytes);
    if (!raw) return absent("decompress_failed");

    ExtractionResult r = extractFromRecord(*raw, caps.max_uncompressed_bytes);
    if (!r.html) {
        Utils::log(Utils::LogLevel::Debug, "extract",
                   locator.filename + "@" + std::to_string(locator.offset) + ": " + r.reason);
    }
    return r;
}
