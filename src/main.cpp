#include "cdx.hpp"
#include "collections.hpp"
#include "config.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "extractor.hpp"
#include "http_client.hpp"
#include "identifiers.hpp"
#include "range_fetch.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

struct Args {
    std::string command;
    std::optional<std::string> collection;
    std::vector<std::string> collection_list;
    size_t recent = 1;
    std::vector<std::string> providers;
    std::string pattern;
    std::vector<std::string> filters;
    bool filters_given = false;
    bool details = false;
    std::string url;
    std::string filename;
    std::string offset;
    std::string length;
    std::string output_file;
    size_t limit = 6;
};

void usage() {
    std::cerr << "Usage: ccsift <command> [options]\n"
                 "Commands:\n"
                 "  collections [--limit N]\n"
                 "  discover [--collection ID]... [--recent N] (--provider NAME|all ... | --pattern GLOB)\n"
                 "           [--filter F]... [--threads N] [--page-size N] [--details]\n"
                 "  captures --pattern GLOB [--collection ID] [--filter F]...\n"
                 "  latest --url URL [--collection ID]\n"
                 "  extract --filename F --offset O --length L [--max-compressed N] [--max-uncompressed N]\n"
                 "          [--timeout-ms N] [--output FILE]\n"
                 "Global: --log-level LEVEL --profile --user-agent UA --index-base URL --data-base URL --retries N\n";
}

Args parseArgs(int argc, char** argv, Config& config) {
    if (argc < 2) {
        usage();
        std::exit(1);
    }
    Args args;
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };
        if (arg == "--collection") {
            args.collection = value();
            args.collection_list.push_back(*args.collection);
        } else if (arg == "--provider") {
            args.providers.push_back(value());
        } else if (arg == "--pattern") {
            args.pattern = value();
        } else if (arg == "--filter") {
            args.filters.push_back(value());
            args.filters_given = true;
        } else if (arg == "--details") {
            args.details = true;
        } else if (arg == "--url") {
            args.url = value();
        } else if (arg == "--filename") {
            args.filename = value();
        } else if (arg == "--offset") {
            args.offset = value();
        } else if (arg == "--length") {
            args.length = value();
        } else if (arg == "--output") {
            args.output_file = value();
        } else if (arg == "--limit") {
            args.limit = parseSize(arg, value());
        } else if (arg == "--recent") {
            args.recent = parseSize(arg, value());
        } else if (arg == "--retries") {
            config.retry.retries = static_cast<unsigned>(parseSize(arg, value()));
        } else if (arg == "--threads") {
            config.threads = static_cast<int>(parseSize(arg, value()));
        } else if (arg == "--page-size") {
            config.page_size = static_cast<unsigned>(parseSize(arg, value()));
        } else if (arg == "--max-compressed") {
            config.max_compressed_bytes = parseSize(arg, value());
        } else if (arg == "--max-uncompressed") {
            config.max_uncompressed_bytes = parseSize(arg, value());
        } else if (arg == "--timeout-ms") {
            config.fetch_timeout = std::chrono::milliseconds(parseSize(arg, value()));
        } else if (arg == "--log-level") {
            std::string level = value();
            if (!Utils::parseLogLevel(level, config.log_level)) {
                throw std::invalid_argument("invalid log level: " + level);
            }
        } else if (arg == "--profile") {
            config.profile = true;
        } else if (arg == "--user-agent") {
            config.user_agent = value();
        } else if (arg == "--index-base") {
            config.index_base = value();
        } else if (arg == "--data-base") {
            config.data_base = value();
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return args;
}

json optionalJson(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

json captureJson(const CaptureRecord& rec) {
    return json{
        {"urlkey", optionalJson(rec.urlkey)},
        {"timestamp", rec.timestamp},
        {"url", rec.url},
        {"mime", optionalJson(rec.mime)},
        {"mime-detected", optionalJson(rec.mime_detected)},
        {"status", optionalJson(rec.status)},
        {"digest", optionalJson(rec.digest)},
        {"length", rec.length},
        {"offset", rec.offset},
        {"filename", rec.filename},
        {"languages", optionalJson(rec.languages)},
        {"encoding", optionalJson(rec.encoding)},
    };
}

json boardJson(const DiscoveredBoard& b) {
    json j{
        {"source", b.source},
        {"identifier", b.identifier},
        {"url", b.url},
        {"timestamp", b.timestamp},
        {"collection", b.collection},
        {"first_collection", b.first_collection},
        {"status", optionalJson(b.status)},
        {"mime", optionalJson(b.mime)},
    };
    if (b.locator) {
        j["filename"] = b.locator->filename;
        j["offset"] = b.locator->offset;
        j["length"] = b.locator->length;
    }
    return j;
}

std::vector<BoardProvider> resolveProviders(const Args& args) {
    std::vector<BoardProvider> providers;
    for (const auto& name : args.providers) {
        if (Utils::toLower(name) == "all") return boardProviders();
        auto provider = findProvider(name);
        if (!provider) throw std::invalid_argument("unknown provider: " + name);
        providers.push_back(*provider);
    }
    return providers;
}

std::string resolvePattern(const Args& args) {
    if (!args.pattern.empty()) return args.pattern;
    auto providers = resolveProviders(args);
    if (providers.empty()) throw std::invalid_argument("need --provider or --pattern");
    return providers.front().urlPattern();
}

int runCollections(const Args& args, CollectionDirectory& directory) {
    for (const auto& id : directory.recentIds(args.limit)) {
        std::cout << id << "\n";
    }
    return 0;
}

int runDiscover(const Args& args, const Config& config, CollectionDirectory& directory, CdxClient& cdx) {
    DiscoveryOptions options;
    options.collection_ids = args.collection_list;
    options.recent_collections = args.recent;
    options.url_pattern = args.pattern;
    options.targets = providerTargets(resolveProviders(args));
    if (options.url_pattern.empty() && options.targets.empty()) {
        throw std::invalid_argument("need --provider or --pattern");
    }
    if (args.filters_given) options.filters = args.filters;
    options.page_size = config.page_size;
    options.threads = config.threads;

    auto start = std::chrono::steady_clock::now();
    BoardDiscovery discovery(directory, cdx);
    DiscoveryReport report = discovery.discover(options);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    if (args.details) {
        for (const auto& entry : report.boards) {
            std::cout << boardJson(entry.second).dump() << "\n";
        }
    } else {
        std::vector<std::string> ids(report.identifiers.begin(), report.identifiers.end());
        std::sort(ids.begin(), ids.end());
        for (const auto& id : ids) std::cout << id << "\n";
    }

    for (const auto& sweep : report.sweeps) {
        std::cerr << sweep.collection << " " << sweep.url_pattern << ": " << sweep.records << " records, "
                  << sweep.pages << " pages (failed " << sweep.failed_pages << ")" << std::endl;
    }
    std::cerr << "Pages: " << report.pages << " (failed " << report.failed_pages << ")" << std::endl;
    std::cerr << "Records: " << report.records << std::endl;
    std::cerr << "Identifiers: " << report.identifiers.size() << std::endl;
    std::cerr << "Completed in " << elapsed.count() << " seconds." << std::endl;
    return 0;
}

int runCaptures(const Args& args, const Config& config, CollectionDirectory& directory, CdxClient& cdx) {
    CdxQuery query;
    query.url_pattern = resolvePattern(args);
    query.filters = args.filters_given ? args.filters : std::vector<std::string>{"status:200"};
    query.page_size = config.page_size;

    std::string collection = directory.select(args.collection);
    CaptureCursor cursor = cdx.queryCaptures(collection, query);
    CaptureRecord rec;
    size_t total = 0;
    while (cursor.next(rec)) {
        std::cout << captureJson(rec).dump() << "\n";
        total++;
    }
    std::cerr << "Captures: " << total << " over " << cursor.pageCount() << " pages" << std::endl;
    return 0;
}

int runLatest(const Args& args, CollectionDirectory& directory, CdxClient& cdx) {
    if (args.url.empty()) throw std::invalid_argument("latest needs --url");
    std::string collection = directory.select(args.collection);
    auto rec = cdx.latestCapture(collection, args.url);
    if (!rec) {
        std::cerr << "No HTML capture of " << args.url << " in " << collection << std::endl;
        return 2;
    }
    std::cout << captureJson(*rec).dump(2) << std::endl;
    return 0;
}

int runExtract(const Args& args, const Config& config, RangeFetcher& fetcher) {
    if (args.filename.empty()) throw std::invalid_argument("extract needs --filename");
    ByteRangeLocator locator;
    locator.filename = args.filename;
    locator.offset = parseSize("--offset", args.offset);
    locator.length = parseSize("--length", args.length);

    ExtractionCaps caps;
    caps.max_compressed_bytes = config.max_compressed_bytes;
    caps.max_uncompressed_bytes = config.max_uncompressed_bytes;
    caps.timeout = config.fetch_timeout;

    HtmlExtractor extractor(fetcher);
    ExtractionResult result = extractor.extractHtml(locator, caps);
    if (!result.html) {
        std::cerr << "No HTML: " << result.reason << std::endl;
        return 2;
    }

    if (args.output_file.empty()) {
        std::cout << *result.html;
        return 0;
    }
    std::ofstream out(args.output_file, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "Error: Could not open output file " << args.output_file << std::endl;
        return 1;
    }
    out << *result.html;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    Config config;
    Args args;
    try {
        config.applyEnvironment();
        args = parseArgs(argc, argv, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        usage();
        return 1;
    }
    Utils::setLogLevel(config.log_level);

    CurlTransport transport(config.user_agent);
    RetryingTransport indexTransport(transport, config.retry);
    CollectionDirectory directory(indexTransport, config.collinfo_url, config.index_timeout);
    CdxClient cdx(indexTransport, config.index_base, config.index_timeout);
    RangeFetcher fetcher(transport, config.data_base);

    int rc = 1;
    try {
        if (args.command == "collections") {
            rc = runCollections(args, directory);
        } else if (args.command == "discover") {
            rc = runDiscover(args, config, directory, cdx);
        } else if (args.command == "captures") {
            rc = runCaptures(args, config, directory, cdx);
        } else if (args.command == "latest") {
            rc = runLatest(args, directory, cdx);
        } else if (args.command == "extract") {
            rc = runExtract(args, config, fetcher);
        } else {
            std::cerr << "Unknown command: " << args.command << std::endl;
            usage();
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 1;
    } catch (const CcsiftError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 1;
    }

    if (config.profile) Utils::Profiler::instance().printStats(std::cerr);
    return rc;
}
