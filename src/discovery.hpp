#pragma once

#include "cdx.hpp"
#include "collections.hpp"
#include "identifiers.hpp"
#include "range_fetch.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// One URL pattern to sweep. Boards are keyed by source and identifier, so the
// same slug under two providers stays two boards.
struct DiscoveryTarget {
    std::string source; // provider name, or the pattern itself
    std::string url_pattern;
};

struct DiscoveryOptions {
    std::optional<std::string> collection_id;  // single collection to sweep
    std::vector<std::string> collection_ids;   // explicit list, swept in order
    size_t recent_collections = 1;             // newest N when no id is given
    std::string url_pattern;                   // shorthand for one target
    std::vector<DiscoveryTarget> targets;
    std::vector<std::string> filters = {"status:200"};
    std::vector<std::string> fields = {"url", "timestamp", "status", "mime", "filename", "offset", "length"};
    unsigned page_size = 0;
    int threads = 1;
};

// Targets for every URL pattern of the given providers.
std::vector<DiscoveryTarget> providerTargets(const std::vector<BoardProvider>& providers);

// Newest capture seen for one board.
struct DiscoveredBoard {
    std::string source;
    std::string identifier;
    std::string url;
    std::string timestamp;
    std::string collection;       // collection holding the newest capture
    std::string first_collection; // first collection swept that listed the board
    std::optional<std::string> status;
    std::optional<std::string> mime;
    std::optional<ByteRangeLocator> locator;
};

std::string boardKey(const std::string& source, const std::string& identifier);

// Totals for one collection and pattern pair.
struct SweepSummary {
    std::string collection;
    std::string url_pattern;
    unsigned pages = 0;
    unsigned failed_pages = 0;
    size_t records = 0;
};

struct DiscoveryReport {
    std::vector<std::string> collections;
    std::vector<SweepSummary> sweeps;
    unsigned pages = 0;
    unsigned failed_pages = 0;
    size_t records = 0;
    std::unordered_set<std::string> identifiers;
    std::map<std::string, DiscoveredBoard> boards; // by boardKey
};

class BoardDiscovery {
public:
    BoardDiscovery(CollectionDirectory& directory, CdxClient& cdx) : directory_(directory), cdx_(cdx) {}

    // Sweeps every index page of each target in each collection, newest
    // collection first. Collection directory and page-count failures propagate;
    // a page that fails twice is logged and skipped.
    DiscoveryReport discover(const DiscoveryOptions& options, const CancelToken* cancel = nullptr);

    std::unordered_set<std::string> discoverIdentifiers(const DiscoveryOptions& options,
                                                        const CancelToken* cancel = nullptr);

private:
    std::vector<std::string> collectionsFor(const DiscoveryOptions& options, const CancelToken* cancel);

    CollectionDirectory& directory_;
    CdxClient& cdx_;
};
