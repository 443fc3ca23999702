#include "http_client.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <thread>

namespace {

std::once_flag curlInitOnce;

struct CurlEasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

struct CurlListDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

struct BodySink {
    std::string* body;
    size_t limit;
    bool overflowed = false;
};

// Returning short of size * nmemb makes curl fail the transfer.
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<BodySink*>(userp);
    size_t n = size * nmemb;
    if (sink->limit > 0 && sink->body->size() + n > sink->limit) {
        sink->overflowed = true;
        return 0;
    }
    sink->body->append(static_cast<char*>(contents), n);
    return n;
}

// Collects "Name: value" lines; a new status line restarts the set.
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::unordered_map<std::string, std::string>*>(userp);
    size_t n = size * nitems;
    std::string_view line(buffer, n);
    if (Utils::startsWith(line, "HTTP/")) {
        headers->clear();
        return n;
    }
    size_t colon = line.find(':');
    if (colon != std::string_view::npos && colon > 0) {
        std::string key = Utils::toLower(Utils::trimView(line.substr(0, colon)));
        std::string val = Utils::trim(line.substr(colon + 1));
        auto it = headers->find(key);
        if (it != headers->end()) {
            it->second += ", " + val;
        } else {
            headers->emplace(std::move(key), std::move(val));
        }
    }
    return n;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancelToken*>(clientp);
    return (cancel && cancel->cancelled()) ? 1 : 0;
}

} // namespace

CurlTransport::CurlTransport(std::string userAgent) : userAgent_(std::move(userAgent)) {
    std::call_once(curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::get(const HttpRequest& request, const CancelToken* cancel) {
    if (cancel && cancel->cancelled()) {
        throw NetworkError("request cancelled before start: " + request.url);
    }

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) throw NetworkError("failed to initialize curl");

    HttpResponse response;
    BodySink sink{&response.body, request.max_body_bytes};
    curl_slist* rawList = nullptr;
    for (const auto& h : request.headers) {
        rawList = curl_slist_append(rawList, (h.first + ": " + h.second).c_str());
    }
    std::unique_ptr<curl_slist, CurlListDeleter> headerList(rawList);

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout_.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    // Bodies are handed over exactly as sent; content decoding is ours.
    curl_easy_setopt(h, CURLOPT_HTTP_CONTENT_DECODING, 0L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<CancelToken*>(cancel));

    CURLcode res = curl_easy_perform(h);
    if (sink.overflowed) {
        throw NetworkError("body exceeds " + std::to_string(request.max_body_bytes) + " bytes for " + request.url);
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw NetworkError("request cancelled: " + request.url);
    }
    if (res != CURLE_OK) {
        throw NetworkError(std::string(curl_easy_strerror(res)) + " for " + request.url);
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

RetryingTransport::RetryingTransport(HttpTransport& inner, RetryPolicy policy)
    : inner_(inner), policy_(policy), rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryingTransport::backoffDelay(unsigned attempt) {
    long long delay = policy_.base_delay.count() << std::min(attempt, 20u);
    if (policy_.jitter.count() > 0) {
        std::lock_guard<std::mutex> lk(rngMu_);
        std::uniform_int_distribution<long long> dist(0, policy_.jitter.count());
        delay += dist(rng_);
    }
    return std::chrono::milliseconds(std::min(delay, static_cast<long long>(policy_.max_delay.count())));
}

namespace {

// Sleeps in short slices so a cancel is noticed. False when cancelled.
bool pause(std::chrono::milliseconds delay, const CancelToken* cancel) {
    auto until = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < until) {
        if (cancel && cancel->cancelled()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
    }
    return !(cancel && cancel->cancelled());
}

bool retryableStatus(long status) {
    return status == 429 || status >= 500;
}

} // namespace

HttpResponse RetryingTransport::get(const HttpRequest& request, const CancelToken* cancel) {
    for (unsigned attempt = 0;; ++attempt) {
        bool last = attempt >= policy_.retries;
        try {
            HttpResponse res = inner_.get(request, cancel);
            if (!retryableStatus(res.status) || last) return res;
            Utils::log(Utils::LogLevel::Warn, "http",
                       "HTTP " + std::to_string(res.status) + " for " + request.url + ", retrying");
        } catch (const NetworkError& e) {
            if (last || (cancel && cancel->cancelled())) throw;
            Utils::log(Utils::LogLevel::Warn, "http", std::string(e.what()) + ", retrying");
        }
        if (!pause(backoffDelay(attempt), cancel)) {
            throw NetworkError("request cancelled: " + request.url);
        }
    }
}

std::string buildUrl(const std::string& base, const std::vector<std::pair<std::string, std::string>>& params) {
    std::string url = base;
    char sep = base.find('?') == std::string::npos ? '?' : '&';
    for (const auto& p : params) {
        url += sep;
        url += Utils::urlEncode(p.first);
        url += '=';
        url += Utils::urlEncode(p.second);
        sep = '&';
    }
    return url;
}
