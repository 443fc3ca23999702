#include "decompress.hpp"
#include "errors.hpp"
#include "http_decode.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace testing_support;

namespace {

HeaderMap headers(std::initializer_list<std::pair<const char*, const char*>> fields) {
    HeaderMap h;
    for (const auto& f : fields) h.add(f.first, f.second);
    return h;
}

const size_t kCap = 1 << 20;

} // namespace

TEST(DecodeChunked, ConcatenatesChunksUntilZero) {
    EXPECT_EQ(decodeChunked(chunked({"Hello, ", "chunked ", "world"})), "Hello, chunked world");
}

TEST(DecodeChunked, IgnoresChunkExtensionsAndUppercaseHex) {
    std::string body = "A;name=value\r\n0123456789\r\n1F\r\n" + std::string(31, 'x') + "\r\n0\r\n\r\n";
    EXPECT_EQ(decodeChunked(body), "0123456789" + std::string(31, 'x'));
}

TEST(DecodeChunked, StopsAtMalformedSizeLine) {
    EXPECT_EQ(decodeChunked("5\r\nhello\r\nzz\r\nworld\r\n0\r\n\r\n"), "hello");
}

TEST(DecodeChunked, KeepsTruncatedFinalChunk) {
    EXPECT_EQ(decodeChunked("5\r\nhello\r\n10\r\nabc"), "helloabc");
}

TEST(DecodeBody, ChunkedThenGzip) {
    std::string text = "<html><body>compressed and chunked</body></html>";
    std::string gz = gzipBytes(text);
    std::string body = chunked({gz.substr(0, 10), gz.substr(10)});
    auto h = headers({{"Transfer-Encoding", "chunked"}, {"Content-Encoding", "gzip"}});
    EXPECT_EQ(decodeBody(body, h, kCap), text);
}

TEST(DecodeBody, Brotli) {
    std::string text = "<!doctype html><p>brotli</p>";
    EXPECT_EQ(decodeBody(brotliBytes(text), headers({{"content-encoding", "br"}}), kCap), text);
}

TEST(DecodeBody, DeflateWithAndWithoutZlibWrapper) {
    std::string text = "deflated payload";
    auto h = headers({{"Content-Encoding", "deflate"}});
    EXPECT_EQ(decodeBody(deflateWith(text, 15), h, kCap), text);
    EXPECT_EQ(decodeBody(deflateWith(text, -15), h, kCap), text);
}

TEST(DecodeBody, CorruptContentEncodingLeavesBytes) {
    std::string junk = "this is not gzip at all";
    EXPECT_EQ(decodeBody(junk, headers({{"Content-Encoding", "gzip"}}), kCap), junk);
    EXPECT_EQ(decodeBody(junk, headers({{"Content-Encoding", "br"}}), kCap), junk);
}

TEST(DecodeBody, PlainBodyUntouched) {
    EXPECT_EQ(decodeBody("as is", HeaderMap(), kCap), "as is");
}

TEST(DecodeBody, ContentEncodingOverCapThrows) {
    std::string big(100000, 'a');
    EXPECT_THROW(decodeBody(gzipBytes(big), headers({{"Content-Encoding", "gzip"}}), 1000), CapacityError);
}

TEST(Gunzip, RejectsCorruptAndTruncatedStreams) {
    std::string gz = gzipBytes(std::string(5000, 'q'));
    EXPECT_THROW(gunzip("definitely not gzip", kCap), DecodeError);
    EXPECT_THROW(gunzip(gz.substr(0, gz.size() / 2), kCap), DecodeError);
}

TEST(DecompressRecord, AbsentOnCorruptOrOversized) {
    std::string gz = gzipBytes(std::string(50000, 'z'));
    EXPECT_FALSE(decompressRecord("\x1f\x8b garbage", kCap));
    EXPECT_FALSE(decompressRecord(gz, 1000));
    auto ok = decompressRecord(gz, kCap);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->size(), 50000u);
}
