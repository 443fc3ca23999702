#include "range_fetch.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <limits>
#include <stdexcept>

namespace {

bool parseDecimal(const std::string& s, uint64_t& out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = std::stoull(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

std::string ByteRangeLocator::rangeHeader() const {
    return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
}

std::optional<ByteRangeLocator> ByteRangeLocator::fromCapture(const CaptureRecord& record) {
    ByteRangeLocator loc;
    if (record.filename.empty()) return std::nullopt;
    if (!parseDecimal(record.offset, loc.offset) || !parseDecimal(record.length, loc.length)) {
        return std::nullopt;
    }
    if (loc.offset > std::numeric_limits<uint64_t>::max() - loc.length) return std::nullopt;
    loc.filename = record.filename;
    return loc;
}

RangeFetcher::RangeFetcher(HttpTransport& transport, std::string dataBase)
    : transport_(transport), data_base_(std::move(dataBase)) {
    while (!data_base_.empty() && data_base_.back() == '/') data_base_.pop_back();
}

std::string RangeFetcher::objectUrl(const std::string& filename) const {
    size_t start = filename.find_first_not_of('/');
    return data_base_ + "/" + (start == std::string::npos ? std::string() : filename.substr(start));
}

std::optional<std::string> RangeFetcher::fetch(const ByteRangeLocator& locator, size_t maxCompressedBytes,
                                               std::chrono::milliseconds timeout, const CancelToken* cancel) {
    if (locator.filename.empty() || locator.length == 0) return std::nullopt;
    if (locator.offset > std::numeric_limits<uint64_t>::max() - locator.length) return std::nullopt;
    if (locator.length > maxCompressedBytes) {
        Utils::log(Utils::LogLevel::Debug, "fetch",
                   "length " + std::to_string(locator.length) + " over cap for " + locator.filename);
        return std::nullopt;
    }

    HttpRequest req;
    req.url = objectUrl(locator.filename);
    req.headers.emplace_back("Range", locator.rangeHeader());
    req.timeout = timeout;
    req.max_body_bytes = maxCompressedBytes;

    HttpResponse res;
    try {
        Utils::ScopedTimer t("RangeFetch");
        res = transport_.get(req, cancel);
    } catch (const NetworkError& e) {
        Utils::log(Utils::LogLevel::Debug, "fetch", e.what());
        return std::nullopt;
    }

    if (res.status != 206) {
        Utils::log(Utils::LogLevel::Debug, "fetch", "HTTP " + std::to_string(res.status) + " for " + req.url);
        return std::nullopt;
    }
    if (!Utils::startsWith(Utils::toLower(res.header("content-range")), "bytes")) {
        Utils::log(Utils::LogLevel::Debug, "fetch", "no content-range for " + req.url);
        return std::nullopt;
    }
    if (res.body.size() > maxCompressedBytes) return std::nullopt;
    return std::move(res.body);
}
