#include "collections.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace {

std::optional<std::string> optionalString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

bool isCrawlId(const std::string& id) {
    // CC-MAIN-YYYY-WW
    static const std::string prefix = "CC-MAIN-";
    if (id.size() != prefix.size() + 7 || !Utils::startsWith(id, prefix)) return false;
    for (size_t i = prefix.size(); i < id.size(); ++i) {
        bool dash = (i == prefix.size() + 4);
        if (dash ? id[i] != '-' : !std::isdigit(static_cast<unsigned char>(id[i]))) return false;
    }
    return true;
}

std::vector<CollectionInfo> parseCollections(const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("collection directory: ") + e.what());
    }
    if (!doc.is_array()) throw ParseError("collection directory: expected a JSON array");

    std::vector<CollectionInfo> out;
    for (const auto& item : doc) {
        if (!item.is_object()) continue;
        auto id = optionalString(item, "id");
        if (!id || id->empty()) continue;
        CollectionInfo info;
        info.id = *id;
        info.name = optionalString(item, "name");
        info.timegate_url = optionalString(item, "timegate");
        info.cdx_api_url = optionalString(item, "cdx-api");
        out.push_back(std::move(info));
    }
    return out;
}

CollectionDirectory::CollectionDirectory(HttpTransport& transport, std::string url,
                                         std::chrono::milliseconds timeout)
    : transport_(transport), url_(std::move(url)), timeout_(timeout) {}

std::vector<CollectionInfo> CollectionDirectory::fetch(const CancelToken* cancel) {
    HttpRequest req;
    req.url = url_;
    req.timeout = timeout_;
    HttpResponse res = transport_.get(req, cancel);
    if (res.status != 200) {
        throw ProtocolError("HTTP " + std::to_string(res.status) + " for " + url_);
    }

    std::vector<CollectionInfo> all = parseCollections(res.body);
    std::vector<CollectionInfo> crawls;
    for (auto& c : all) {
        if (isCrawlId(c.id)) crawls.push_back(std::move(c));
    }
    // Service order is not reliable; the id sorts chronologically.
    std::stable_sort(crawls.begin(), crawls.end(),
                     [](const CollectionInfo& a, const CollectionInfo& b) { return a.id > b.id; });
    Utils::log(Utils::LogLevel::Debug, "collinfo", std::to_string(crawls.size()) + " crawl collections");
    return crawls;
}

std::vector<std::string> CollectionDirectory::recentIds(size_t limit, const CancelToken* cancel) {
    std::vector<std::string> ids;
    for (const auto& c : fetch(cancel)) {
        if (ids.size() >= limit) break;
        ids.push_back(c.id);
    }
    return ids;
}

std::string CollectionDirectory::select(const std::optional<std::string>& requested, const CancelToken* cancel) {
    if (requested && !requested->empty()) return *requested;
    auto list = fetch(cancel);
    if (list.empty()) throw ParseError("collection directory lists no crawl collections");
    return list.front().id;
}
