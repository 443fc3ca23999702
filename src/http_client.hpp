#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Shared by the caller and any number of in-flight requests.
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds timeout{60000};
    size_t max_body_bytes = 0; // 0 = unlimited; a larger body fails the transfer
};

struct HttpResponse {
    long status = 0;
    std::unordered_map<std::string, std::string> headers; // keys lowercased
    std::string body;

    std::string header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string() : it->second;
    }
};

// Network seam. Implementations throw NetworkError when no response was received
// (including timeout and cancellation); any received status is returned as is.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const HttpRequest& request, const CancelToken* cancel) = 0;
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string userAgent);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse get(const HttpRequest& request, const CancelToken* cancel) override;

    void setConnectTimeout(std::chrono::milliseconds timeout) { connectTimeout_ = timeout; }

private:
    std::string userAgent_;
    std::chrono::milliseconds connectTimeout_{10000};
};

struct RetryPolicy {
    unsigned retries = 3;
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{30000};
    std::chrono::milliseconds jitter{1000};
};

// Re-issues a request answered with 429 or 5xx, or failed with NetworkError,
// after exponential backoff plus jitter. The last answer or error is returned
// once retries are spent. Cancellation stops retrying.
class RetryingTransport : public HttpTransport {
public:
    explicit RetryingTransport(HttpTransport& inner, RetryPolicy policy = RetryPolicy());

    HttpResponse get(const HttpRequest& request, const CancelToken* cancel) override;

    std::chrono::milliseconds backoffDelay(unsigned attempt);

private:
    HttpTransport& inner_;
    RetryPolicy policy_;
    std::mutex rngMu_;
    std::mt19937 rng_;
};

// Builds "base?k=v&k=v" keeping every pair, repeated keys included.
std::string buildUrl(const std::string& base, const std::vector<std::pair<std::string, std::string>>& params);
