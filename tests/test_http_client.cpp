#include "errors.hpp"
#include "http_client.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>

using namespace testing_support;

namespace {

RetryPolicy noDelay(unsigned retries) {
    RetryPolicy p;
    p.retries = retries;
    p.base_delay = std::chrono::milliseconds(0);
    p.jitter = std::chrono::milliseconds(0);
    return p;
}

HttpRequest request() {
    HttpRequest req;
    req.url = "https://index.example.org/CC-MAIN-2024-10-index?url=x";
    return req;
}

} // namespace

TEST(RetryingTransport, RetriesRateLimitAndServerErrors) {
    std::atomic<int> calls{0};
    FakeTransport inner([&](const HttpRequest&) {
        int n = calls++;
        if (n == 0) return response(503, "busy");
        if (n == 1) return response(429, "slow down");
        return response(200, "{\"pages\": 1}");
    });
    RetryingTransport retrying(inner, noDelay(3));

    HttpResponse res = retrying.get(request(), nullptr);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "{\"pages\": 1}");
    EXPECT_EQ(inner.callCount(), 3u);
}

TEST(RetryingTransport, RetriesNetworkErrors) {
    std::atomic<int> calls{0};
    FakeTransport inner([&](const HttpRequest&) -> HttpResponse {
        if (calls++ == 0) throw NetworkError("connection reset");
        return response(200, "ok");
    });
    RetryingTransport retrying(inner, noDelay(3));
    EXPECT_EQ(retrying.get(request(), nullptr).body, "ok");
    EXPECT_EQ(inner.callCount(), 2u);
}

TEST(RetryingTransport, ReturnsLastAnswerWhenRetriesAreSpent) {
    FakeTransport busy([](const HttpRequest&) { return response(502, "bad gateway"); });
    RetryingTransport retrying(busy, noDelay(2));
    EXPECT_EQ(retrying.get(request(), nullptr).status, 502);
    EXPECT_EQ(busy.callCount(), 3u);

    FakeTransport down([](const HttpRequest&) -> HttpResponse { throw NetworkError("refused"); });
    RetryingTransport retryingDown(down, noDelay(2));
    EXPECT_THROW(retryingDown.get(request(), nullptr), NetworkError);
    EXPECT_EQ(down.callCount(), 3u);
}

TEST(RetryingTransport, ClientErrorsAreNotRetried) {
    FakeTransport inner([](const HttpRequest&) { return response(404, "No Captures found"); });
    RetryingTransport retrying(inner, noDelay(3));
    EXPECT_EQ(retrying.get(request(), nullptr).status, 404);
    EXPECT_EQ(inner.callCount(), 1u);
}

TEST(RetryingTransport, CancellationStopsRetrying) {
    FakeTransport inner([](const HttpRequest&) { return response(200, ""); });
    RetryingTransport retrying(inner, noDelay(3));
    CancelToken cancel;
    cancel.cancel();
    EXPECT_THROW(retrying.get(request(), &cancel), NetworkError);
    EXPECT_EQ(inner.callCount(), 1u);
}

TEST(RetryingTransport, BackoffDoublesUpToTheCap) {
    FakeTransport inner([](const HttpRequest&) { return response(200, ""); });
    RetryPolicy p;
    p.base_delay = std::chrono::milliseconds(100);
    p.max_delay = std::chrono::milliseconds(350);
    p.jitter = std::chrono::milliseconds(0);
    RetryingTransport retrying(inner, p);
    EXPECT_EQ(retrying.backoffDelay(0).count(), 100);
    EXPECT_EQ(retrying.backoffDelay(1).count(), 200);
    EXPECT_EQ(retrying.backoffDelay(2).count(), 350);

    p.jitter = std::chrono::milliseconds(50);
    RetryingTransport jittered(inner, p);
    auto d = jittered.backoffDelay(0).count();
    EXPECT_GE(d, 100);
    EXPECT_LE(d, 150);
}

TEST(BuildUrl, KeepsRepeatedKeys) {
    EXPECT_EQ(buildUrl("https://h/x", {{"filter", "a:1"}, {"filter", "b:2"}}),
              "https://h/x?filter=a%3A1&filter=b%3A2");
    EXPECT_EQ(buildUrl("https://h/x?y=1", {{"k", "v"}}), "https://h/x?y=1&k=v");
}
