#include "identifiers.hpp"
#include "utils.hpp"

#include <array>

namespace {

constexpr std::array<std::string_view, 9> kReservedPaths = {
    "api", "static", "favicon.ico", "robots.txt", "sitemap.xml",
    "meeting", "jobs", "assets", ".well-known",
};

// Path part of an absolute or scheme-less URL, without query or fragment.
std::string_view pathOf(std::string_view url) {
    size_t start = 0;
    size_t scheme = url.find("://");
    if (scheme != std::string_view::npos && scheme < url.find_first_of("/?#")) start = scheme + 3;
    // The authority ends at the first of "/?#"; only a '/' opens a path.
    size_t authorityEnd = url.find_first_of("/?#", start);
    if (authorityEnd == std::string_view::npos || url[authorityEnd] != '/') return {};
    std::string_view path = url.substr(authorityEnd);
    size_t cut = path.find_first_of("?#");
    if (cut != std::string_view::npos) path = path.substr(0, cut);
    return path;
}

} // namespace

bool isReservedPath(std::string_view segment) {
    for (auto r : kReservedPaths) {
        if (segment == r) return true;
    }
    return false;
}

std::optional<std::string> extractIdentifier(std::string_view url) {
    std::string_view path = pathOf(Utils::trimView(url));
    size_t pos = 0;
    while (pos < path.size()) {
        size_t end = path.find('/', pos);
        if (end == std::string_view::npos) end = path.size();
        std::string_view segment = path.substr(pos, end - pos);
        pos = end + 1;
        if (segment.empty()) continue;

        std::string id = Utils::toLower(Utils::trimView(segment));
        if (id.empty() || isReservedPath(id)) return std::nullopt;
        return id;
    }
    return std::nullopt;
}

std::vector<std::string> BoardProvider::urlPatterns() const {
    std::vector<std::string> patterns;
    for (const auto& h : hosts) patterns.push_back(h + "/*");
    return patterns;
}

const std::vector<BoardProvider>& boardProviders() {
    static const std::vector<BoardProvider> providers = {
        {"ashby", {"jobs.ashbyhq.com"}},
        {"greenhouse", {"boards.greenhouse.io", "job-boards.greenhouse.io"}},
        {"lever", {"jobs.lever.co"}},
        {"workable", {"apply.workable.com"}},
    };
    return providers;
}

std::optional<BoardProvider> findProvider(std::string_view name) {
    std::string n = Utils::toLower(name);
    for (const auto& p : boardProviders()) {
        if (p.name == n) return p;
    }
    return std::nullopt;
}

bool BoardSlugSet::insert(const std::string& identifier) {
    std::lock_guard<std::mutex> lk(mu_);
    return slugs_.insert(identifier).second;
}

size_t BoardSlugSet::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return slugs_.size();
}

std::unordered_set<std::string> BoardSlugSet::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return slugs_;
}
