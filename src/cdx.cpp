#include "cdx.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// CDX values are strings, but tolerate numbers.
std::optional<std::string> field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    return std::nullopt;
}

std::string joinFields(const std::vector<std::string>& fields) {
    std::string out;
    for (const auto& f : fields) {
        if (!out.empty()) out += ',';
        out += f;
    }
    return out;
}

const std::vector<std::string> kLatestFields = {
    "timestamp", "url", "length", "offset", "filename", "status",
    "mime", "mime-detected", "encoding", "languages", "digest",
};

} // namespace

bool CaptureRecord::looksHtml() const {
    auto html = [](const std::optional<std::string>& m) {
        return m && (Utils::containsIgnoreCase(*m, "text/html") ||
                     Utils::containsIgnoreCase(*m, "application/xhtml"));
    };
    return html(mime) || html(mime_detected);
}

std::optional<CaptureRecord> parseCaptureLine(std::string_view line) {
    std::string_view trimmed = Utils::trimView(line);
    if (trimmed.empty()) return std::nullopt;

    json obj = json::parse(trimmed.begin(), trimmed.end(), nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) return std::nullopt;

    auto url = field(obj, "url");
    if (!url || url->empty()) return std::nullopt;

    CaptureRecord rec;
    rec.url = *url;
    rec.urlkey = field(obj, "urlkey");
    rec.timestamp = field(obj, "timestamp").value_or("");
    rec.mime = field(obj, "mime");
    rec.mime_detected = field(obj, "mime-detected");
    rec.status = field(obj, "status");
    rec.digest = field(obj, "digest");
    rec.length = field(obj, "length").value_or("");
    rec.offset = field(obj, "offset").value_or("");
    rec.filename = field(obj, "filename").value_or("");
    rec.languages = field(obj, "languages");
    rec.encoding = field(obj, "encoding");
    return rec;
}

// CaptureCursor

CaptureCursor::CaptureCursor(CdxClient& client, std::string collectionId, CdxQuery query,
                             unsigned pages, const CancelToken* cancel)
    : client_(client), collection_(std::move(collectionId)), query_(std::move(query)),
      pages_(pages), cancel_(cancel) {}

bool CaptureCursor::next(CaptureRecord& out) {
    while (pos_ >= buffer_.size()) {
        if (next_page_ >= pages_) return false;
        buffer_ = client_.fetchPage(collection_, query_, next_page_++, cancel_);
        pos_ = 0;
    }
    out = buffer_[pos_++];
    return true;
}

void CaptureCursor::restart() {
    next_page_ = 0;
    buffer_.clear();
    pos_ = 0;
}

// CdxClient

CdxClient::CdxClient(HttpTransport& transport, std::string indexBase, std::chrono::milliseconds timeout)
    : transport_(transport), index_base_(std::move(indexBase)), timeout_(timeout) {
    while (!index_base_.empty() && index_base_.back() == '/') index_base_.pop_back();
}

std::string CdxClient::endpoint(const std::string& collectionId) const {
    return index_base_ + "/" + collectionId + "-index";
}

std::vector<std::pair<std::string, std::string>> CdxClient::baseParams(const CdxQuery& query) const {
    std::vector<std::pair<std::string, std::string>> params;
    params.emplace_back("url", query.url_pattern);
    params.emplace_back("output", "json");
    for (const auto& f : query.filters) {
        params.emplace_back("filter", f);
    }
    if (!query.fields.empty()) params.emplace_back("fl", joinFields(query.fields));
    if (query.sort_reverse) params.emplace_back("sort", "reverse");
    if (query.limit) params.emplace_back("limit", std::to_string(*query.limit));
    if (query.page_size > 0) params.emplace_back("pageSize", std::to_string(query.page_size));
    return params;
}

std::string CdxClient::pageUrl(const std::string& collectionId, const CdxQuery& query, unsigned page) const {
    auto params = baseParams(query);
    params.emplace_back("page", std::to_string(page));
    return buildUrl(endpoint(collectionId), params);
}

std::string CdxClient::pageCountUrl(const std::string& collectionId, const CdxQuery& query) const {
    auto params = baseParams(query);
    params.emplace_back("showNumPages", "true");
    return buildUrl(endpoint(collectionId), params);
}

unsigned CdxClient::pageCount(const std::string& collectionId, const CdxQuery& query, const CancelToken* cancel) {
    HttpRequest req;
    req.url = pageCountUrl(collectionId, query);
    req.timeout = timeout_;
    HttpResponse res = transport_.get(req, cancel);
    if (res.status != 200) {
        throw ProtocolError("page count: HTTP " + std::to_string(res.status) + " for " + req.url);
    }

    json doc = json::parse(res.body, nullptr, false);
    if (doc.is_discarded()) throw ParseError("page count: response is not JSON");
    if (doc.is_number_unsigned()) return doc.get<unsigned>();
    if (doc.is_object()) {
        auto it = doc.find("pages");
        if (it != doc.end() && it->is_number_unsigned()) return it->get<unsigned>();
    }
    throw ParseError("page count: no 'pages' value in response");
}

std::vector<CaptureRecord> CdxClient::parseLines(const std::string& body) const {
    std::vector<CaptureRecord> out;
    size_t skipped = 0;
    for (std::string_view line : Utils::splitLines(body)) {
        if (Utils::trimView(line).empty()) continue;
        auto rec = parseCaptureLine(line);
        if (rec) {
            out.push_back(std::move(*rec));
        } else {
            skipped++;
        }
    }
    if (skipped > 0) {
        Utils::log(Utils::LogLevel::Debug, "cdx", "skipped " + std::to_string(skipped) + " malformed lines");
    }
    return out;
}

std::vector<CaptureRecord> CdxClient::fetchPage(const std::string& collectionId, const CdxQuery& query,
                                                unsigned page, const CancelToken* cancel) {
    HttpRequest req;
    req.url = pageUrl(collectionId, query, page);
    req.timeout = timeout_;
    HttpResponse res = transport_.get(req, cancel);
    // The index answers 404 when nothing matches.
    if (res.status == 404) return {};
    if (res.status != 200) {
        throw ProtocolError("page " + std::to_string(page) + ": HTTP " + std::to_string(res.status));
    }
    auto records = parseLines(res.body);
    Utils::log(Utils::LogLevel::Debug, "cdx",
               collectionId + " page " + std::to_string(page) + ": " + std::to_string(records.size()) + " records");
    return records;
}

CaptureCursor CdxClient::queryCaptures(const std::string& collectionId, const CdxQuery& query,
                                       const CancelToken* cancel) {
    unsigned pages = pageCount(collectionId, query, cancel);
    Utils::log(Utils::LogLevel::Info, "cdx",
               collectionId + " " + query.url_pattern + ": " + std::to_string(pages) + " pages");
    return CaptureCursor(*this, collectionId, query, pages, cancel);
}

std::optional<CaptureRecord> CdxClient::latestCapture(const std::string& collectionId, const std::string& url,
                                                      const CancelToken* cancel) {
    CdxQuery query;
    query.url_pattern = url;
    query.filters = {"status:200"};
    query.fields = kLatestFields;
    query.sort_reverse = true;
    query.limit = 3; // a little slack for the mime post-filter

    HttpRequest req;
    req.url = buildUrl(endpoint(collectionId), baseParams(query));
    req.timeout = timeout_;
    HttpResponse res = transport_.get(req, cancel);
    if (res.status != 200) {
        Utils::log(Utils::LogLevel::Debug, "cdx", "latest " + url + ": HTTP " + std::to_string(res.status));
        return std::nullopt;
    }

    for (auto& rec : parseLines(res.body)) {
        if (!rec.looksHtml()) continue;
        if (rec.timestamp.empty() || rec.filename.empty() || rec.offset.empty() || rec.length.empty()) continue;
        return rec;
    }
    return std::nullopt;
}
