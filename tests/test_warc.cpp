#include "warc.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using testing_support::warcRecord;

TEST(ParseHttpFromRecord, SplitsRecordHeadersFromEmbeddedResponse) {
    std::string raw = warcRecord("HTTP/1.1 200 OK", {"Content-Type: text/html", "X-Test: yes"}, "<html>hi</html>");
    auto payload = parseHttpFromRecord(raw);
    ASSERT_TRUE(payload);
    EXPECT_EQ(payload->statusLine, "HTTP/1.1 200 OK");
    EXPECT_EQ(payload->headers.get("content-type"), "text/html");
    EXPECT_EQ(payload->headers.get("X-TEST"), "yes");
    EXPECT_EQ(payload->body, "<html>hi</html>\r\n\r\n");
}

TEST(ParseHttpFromRecord, FallsBackToBareNewlines) {
    std::string raw = "WARC/1.0\nWARC-Type: response\n\nHTTP/1.0 200 OK\nContent-Type: text/plain\n\nbody text";
    auto payload = parseHttpFromRecord(raw);
    ASSERT_TRUE(payload);
    EXPECT_EQ(payload->statusLine, "HTTP/1.0 200 OK");
    EXPECT_EQ(payload->headers.get("content-type"), "text/plain");
    EXPECT_EQ(payload->body, "body text");
}

TEST(ParseHttpFromRecord, RejectsNonOkStatus) {
    EXPECT_FALSE(parseHttpFromRecord(warcRecord("HTTP/1.1 404 Not Found", {}, "missing")));
    EXPECT_FALSE(parseHttpFromRecord(warcRecord("HTTP/1.1 301 Moved", {"Location: /x"}, "")));
    EXPECT_FALSE(parseHttpFromRecord(warcRecord("HTTP/1.1 2000 Odd", {}, "x")));
}

TEST(ParseHttpFromRecord, RejectsMissingBoundaries) {
    EXPECT_FALSE(parseHttpFromRecord("WARC/1.0\r\nWARC-Type: response"));
    EXPECT_FALSE(parseHttpFromRecord("WARC/1.0\r\nWARC-Type: metadata\r\n\r\nfetchTimeMs: 12\r\n"));
    EXPECT_FALSE(parseHttpFromRecord("WARC/1.0\r\n\r\nHTTP/1.1 200 OK\r\nContent-Type: text/html"));
}

TEST(ParseHttpFromRecord, BodyMayBeEmpty) {
    auto payload = parseHttpFromRecord("WARC/1.0\r\n\r\nHTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(payload);
    EXPECT_TRUE(payload->body.empty());
}

TEST(HttpStatusLine, AcceptsOnlyTwoHundred) {
    EXPECT_TRUE(isHttpOkStatusLine("HTTP/1.1 200 OK"));
    EXPECT_TRUE(isHttpOkStatusLine("HTTP/1.0 200"));
    EXPECT_TRUE(isHttpOkStatusLine("HTTP/1.1  200 OK"));
    EXPECT_FALSE(isHttpOkStatusLine("HTTP/2 200"));
    EXPECT_FALSE(isHttpOkStatusLine("HTTP/1.1 206 Partial Content"));
    EXPECT_FALSE(isHttpOkStatusLine("HTTP/1.1 200x"));
    EXPECT_FALSE(isHttpOkStatusLine("ICY 200 OK"));
}

TEST(HeaderMap, JoinsRepeatedFieldsAndSplitsOnFirstColon) {
    HeaderMap h = parseHeaderLines("Set-Cookie: a=1\r\nset-cookie: b=2\r\nLink: <http://x/y>; rel=next\r\n:bogus\r\nnocolon");
    EXPECT_EQ(h.get("set-cookie"), "a=1, b=2");
    EXPECT_EQ(h.get("link"), "<http://x/y>; rel=next");
    EXPECT_EQ(h.size(), 2u);
    EXPECT_FALSE(h.contains("nocolon"));
}

TEST(ParseWarcHeaders, ReadsRecordMetadata) {
    std::string raw = warcRecord("HTTP/1.1 200 OK", {}, "x");
    auto rec = parseWarcHeaders(raw);
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->version, "1.0");
    EXPECT_EQ(rec->type, "response");
    EXPECT_EQ(rec->url, "https://jobs.example.com/acme");
    EXPECT_EQ(rec->id, "<urn:uuid:0d1e2f3a-0000-4000-8000-000000000001>");
    EXPECT_GT(rec->contentLength, 0u);
}

TEST(ParseWarcHeaders, RequiresVersionLine) {
    EXPECT_FALSE(parseWarcHeaders("HTTP/1.1 200 OK\r\n\r\n"));
}
