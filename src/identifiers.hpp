#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

// First path segment of a board URL, lowercased and trimmed, or nullopt for
// empty paths and reserved platform routes (api, static, robots.txt, ...).
std::optional<std::string> extractIdentifier(std::string_view url);

bool isReservedPath(std::string_view segment);

// Known job-board hosts that can be swept for board identifiers.
struct BoardProvider {
    std::string name;
    std::vector<std::string> hosts; // canonical host first

    std::string urlPattern() const { return hosts.front() + "/*"; }
    std::vector<std::string> urlPatterns() const;
    std::string boardUrl(const std::string& identifier) const {
        return "https://" + hosts.front() + "/" + identifier;
    }
};

const std::vector<BoardProvider>& boardProviders();
std::optional<BoardProvider> findProvider(std::string_view name);

// Deduplicated identifiers, safe to fill from several page workers.
class BoardSlugSet {
public:
    bool insert(const std::string& identifier);
    size_t size() const;
    std::unordered_set<std::string> snapshot() const;

private:
    mutable std::mutex mu_;
    std::unordered_set<std::string> slugs_;
};
