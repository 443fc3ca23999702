#include "discovery.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <stdexcept>
#include <mutex>
#include <thread>

namespace {

// Hands page indices from the producer to the page workers.
class PageQueue {
public:
    explicit PageQueue(size_t capacity) : capacity_(capacity) {}

    bool push(unsigned page) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_push_.wait(lock, [&] { return closed_ || pages_.size() < capacity_; });
        if (closed_) return false;
        pages_.push_back(page);
        cv_pop_.notify_one();
        return true;
    }

    bool pop(unsigned& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_pop_.wait(lock, [&] { return closed_ || !pages_.empty(); });
        if (pages_.empty()) return false;
        out = pages_.front();
        pages_.pop_front();
        cv_push_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
        cv_pop_.notify_all();
        cv_push_.notify_all();
    }

private:
    std::mutex mu_;
    std::condition_variable cv_push_;
    std::condition_variable cv_pop_;
    std::deque<unsigned> pages_;
    size_t capacity_;
    bool closed_ = false;
};

class Accumulator {
public:
    void absorb(const std::vector<CaptureRecord>& records, const std::string& collection,
                const std::string& source) {
        for (const auto& rec : records) {
            auto id = extractIdentifier(rec.url);
            if (!id) continue;
            slugs_.insert(*id);

            std::string key = boardKey(source, *id);
            std::lock_guard<std::mutex> lk(mu_);
            auto it = boards_.find(key);
            if (it != boards_.end() && it->second.timestamp >= rec.timestamp) continue;
            DiscoveredBoard board;
            board.source = source;
            board.identifier = *id;
            board.url = rec.url;
            board.timestamp = rec.timestamp;
            board.collection = collection;
            board.first_collection = it != boards_.end() ? it->second.first_collection : collection;
            board.status = rec.status;
            board.mime = rec.mime ? rec.mime : rec.mime_detected;
            board.locator = ByteRangeLocator::fromCapture(rec);
            boards_[key] = std::move(board);
        }
    }

    void fill(DiscoveryReport& r) {
        r.identifiers = slugs_.snapshot();
        std::lock_guard<std::mutex> lk(mu_);
        r.boards = boards_;
    }

private:
    BoardSlugSet slugs_;
    std::mutex mu_;
    std::map<std::string, DiscoveredBoard> boards_;
};

// Per collection and pattern counters, shared by that sweep's page workers.
struct SweepCounters {
    std::atomic<size_t> records{0};
    std::atomic<unsigned> failed{0};
};

struct Sweep {
    const std::string& collection;
    const DiscoveryTarget& target;
    const CdxQuery& query;
    Accumulator& acc;
    SweepCounters& counters;
};

// Pages are independently re-fetchable, so one retry is safe.
void sweepPage(CdxClient& cdx, const Sweep& sweep, unsigned page, const CancelToken* cancel) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (cancel && cancel->cancelled()) break;
        try {
            Utils::ScopedTimer t("CdxPage");
            auto records = cdx.fetchPage(sweep.collection, sweep.query, page, cancel);
            sweep.counters.records.fetch_add(records.size(), std::memory_order_relaxed);
            sweep.acc.absorb(records, sweep.collection, sweep.target.source);
            return;
        } catch (const CcsiftError& e) {
            Utils::log(Utils::LogLevel::Warn, "discover",
                       sweep.collection + " page " + std::to_string(page) + " attempt " +
                           std::to_string(attempt + 1) + ": " + e.what());
        }
    }
    sweep.counters.failed.fetch_add(1, std::memory_order_relaxed);
}

void sweepPages(CdxClient& cdx, const Sweep& sweep, unsigned pages, int threads, const CancelToken* cancel) {
    unsigned threadCount = static_cast<unsigned>(std::max(1, threads));
    threadCount = std::min(threadCount, std::max(1u, pages));

    if (threadCount <= 1) {
        for (unsigned page = 0; page < pages; ++page) sweepPage(cdx, sweep, page, cancel);
        return;
    }

    PageQueue queue(threadCount * 2);
    std::vector<std::thread> workers;
    workers.reserve(threadCount);
    std::mutex errMu;
    std::exception_ptr firstError;

    for (unsigned t = 0; t < threadCount; ++t) {
        workers.emplace_back([&]() {
            unsigned page = 0;
            while (queue.pop(page)) {
                try {
                    sweepPage(cdx, sweep, page, cancel);
                } catch (...) {
                    std::lock_guard<std::mutex> lk(errMu);
                    if (!firstError) firstError = std::current_exception();
                    queue.close();
                }
            }
        });
    }
    for (unsigned page = 0; page < pages; ++page) {
        if (!queue.push(page)) break;
    }
    queue.close();
    for (auto& w : workers) w.join();
    if (firstError) std::rethrow_exception(firstError);
}

} // namespace

std::vector<DiscoveryTarget> providerTargets(const std::vector<BoardProvider>& providers) {
    std::vector<DiscoveryTarget> targets;
    for (const auto& p : providers) {
        for (const auto& pattern : p.urlPatterns()) targets.push_back({p.name, pattern});
    }
    return targets;
}

std::string boardKey(const std::string& source, const std::string& identifier) {
    return source + "|" + identifier;
}

std::vector<std::string> BoardDiscovery::collectionsFor(const DiscoveryOptions& options,
                                                        const CancelToken* cancel) {
    if (!options.collection_ids.empty()) return options.collection_ids;
    if (options.collection_id && !options.collection_id->empty()) return {*options.collection_id};
    auto ids = directory_.recentIds(std::max<size_t>(1, options.recent_collections), cancel);
    if (ids.empty()) throw ParseError("collection directory lists no crawl collections");
    return ids;
}

DiscoveryReport BoardDiscovery::discover(const DiscoveryOptions& options, const CancelToken* cancel) {
    std::vector<DiscoveryTarget> targets = options.targets;
    if (!options.url_pattern.empty()) targets.insert(targets.begin(), DiscoveryTarget{options.url_pattern, options.url_pattern});
    for (const auto& t : targets) {
        if (t.url_pattern.empty()) throw std::invalid_argument("discovery target without a URL pattern");
    }
    if (targets.empty()) throw std::invalid_argument("discovery needs a URL pattern");

    DiscoveryReport report;
    report.collections = collectionsFor(options, cancel);
    Accumulator acc;

    for (const auto& collection : report.collections) {
        for (const auto& target : targets) {
            CdxQuery query;
            query.url_pattern = target.url_pattern;
            query.filters = options.filters;
            query.fields = options.fields;
            query.page_size = options.page_size;

            unsigned pages = cdx_.pageCount(collection, query, cancel);
            Utils::log(Utils::LogLevel::Info, "discover",
                       collection + " " + target.url_pattern + ": " + std::to_string(pages) + " pages");

            SweepCounters counters;
            sweepPages(cdx_, Sweep{collection, target, query, acc, counters}, pages, options.threads, cancel);

            SweepSummary summary;
            summary.collection = collection;
            summary.url_pattern = target.url_pattern;
            summary.pages = pages;
            summary.failed_pages = counters.failed.load();
            summary.records = counters.records.load();
            report.pages += summary.pages;
            report.failed_pages += summary.failed_pages;
            report.records += summary.records;
            report.sweeps.push_back(std::move(summary));
        }
    }

    acc.fill(report);
    Utils::log(Utils::LogLevel::Info, "discover",
               std::to_string(report.identifiers.size()) + " identifiers from " + std::to_string(report.records) +
                   " records (" + std::to_string(report.failed_pages) + " failed pages)");
    return report;
}

std::unordered_set<std::string> BoardDiscovery::discoverIdentifiers(const DiscoveryOptions& options,
                                                                    const CancelToken* cancel) {
    return discover(options, cancel).identifiers;
}
