#include "charset.hpp"
#include "html_gate.hpp"

#include <gtest/gtest.h>

namespace {

HeaderMap contentType(const char* value) {
    HeaderMap h;
    h.add("Content-Type", value);
    return h;
}

} // namespace

TEST(ResolveCharset, HeaderWinsOverMeta) {
    std::string body = "<html><head><meta charset=\"utf-8\"></head><body>caf\xE9</body></html>";
    HeaderMap h = contentType("text/html; charset=ISO-8859-1");
    EXPECT_EQ(resolveCharset(body, h), "iso-8859-1");
    EXPECT_EQ(decodeText(body, h), "<html><head><meta charset=\"utf-8\"></head><body>caf\xC3\xA9</body></html>");
}

TEST(ResolveCharset, MetaCharsetThenHttpEquiv) {
    EXPECT_EQ(charsetFromMeta("<head><META Charset='Windows-1251'></head>"), "windows-1251");
    EXPECT_EQ(charsetFromMeta("<meta http-equiv=\"Content-Type\" content=\"text/html; charset=Shift_JIS\">"),
              "shift_jis");
    // A charset attribute anywhere beats an http-equiv declared earlier.
    EXPECT_EQ(charsetFromMeta("<meta http-equiv=\"content-type\" content=\"text/html; charset=euc-jp\">"
                              "<meta charset=\"koi8-r\">"),
              "koi8-r");
}

TEST(ResolveCharset, IgnoresMetaBeyondSniffWindow) {
    std::string body = "<html>" + std::string(kSniffPrefixBytes, ' ') + "<meta charset=\"koi8-r\">";
    EXPECT_EQ(charsetFromMeta(body), "");
    EXPECT_EQ(resolveCharset(body, HeaderMap()), "utf-8");
}

TEST(ResolveCharset, DefaultsToUtf8) {
    EXPECT_EQ(resolveCharset("<html>plain</html>", contentType("text/html")), "utf-8");
}

TEST(ResolveCharset, IgnoresMetaNameLookalikes) {
    EXPECT_EQ(charsetFromMeta("<metadata charset=\"koi8-r\">"), "");
}

TEST(DecodeToUtf8, ConvertsLegacyCharsets) {
    EXPECT_EQ(decodeToUtf8("\xCF\xF0\xE8\xE2\xE5\xF2", "windows-1251"),
              "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82");
    EXPECT_EQ(decodeToUtf8("\x93quoted\x94", "iso-8859-1"), "\xE2\x80\x9Cquoted\xE2\x80\x9D");
}

TEST(DecodeToUtf8, UnknownCharsetFallsBackToUtf8) {
    EXPECT_EQ(decodeToUtf8("caf\xC3\xA9", "x-no-such-charset"), "caf\xC3\xA9");
}

TEST(DecodeToUtf8, InvalidUtf8IsReplaced) {
    EXPECT_EQ(sanitizeUtf8("ok\xFFok"), "ok\xEF\xBF\xBDok");
    EXPECT_EQ(sanitizeUtf8("\xE2\x82"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(sanitizeUtf8("\xF0\x9F\x98\x80"), "\xF0\x9F\x98\x80");
}

TEST(HtmlGate, AcceptsByContentType) {
    EXPECT_TRUE(acceptHtml("no markup here", contentType("text/html; charset=utf-8")));
    EXPECT_TRUE(acceptHtml("no markup here", contentType("application/xhtml+xml")));
}

TEST(HtmlGate, AcceptsByBodySignals) {
    EXPECT_TRUE(acceptHtml("<!DOCTYPE HTML><title>x</title>", HeaderMap()));
    EXPECT_TRUE(acceptHtml("  <Body>text</Body>", contentType("text/plain")));
    EXPECT_TRUE(acceptHtml("<html lang=en>", contentType("application/octet-stream")));
}

TEST(HtmlGate, RejectsWithoutSignals) {
    EXPECT_FALSE(acceptHtml("{\"json\": true}", contentType("application/json")));
    EXPECT_FALSE(acceptHtml(std::string(kSniffPrefixBytes, 'x') + "<html>", HeaderMap()));
}

TEST(ResolveCharset, ContentTypeParameterForms) {
    EXPECT_EQ(charsetFromContentType("text/html; CHARSET = \"UTF-8\""), "utf-8");
    EXPECT_EQ(charsetFromContentType("text/html;charset='koi8-r'"), "koi8-r");
    EXPECT_EQ(charsetFromContentType("text/html; x-charset-hint; charset=gbk"), "gbk");
    EXPECT_EQ(charsetFromContentType("text/html; charset="), "");
    EXPECT_EQ(charsetFromContentType("text/html"), "");
}

TEST(ResolveCharset, OverlongCharsetLabelIsIgnored) {
    std::string ct = "text/html; charset=" + std::string(100000, 'a');
    EXPECT_EQ(charsetFromContentType(ct), "");
    std::string body = "<html><body>ok</body></html>";
    EXPECT_EQ(decodeText(body, contentType(ct.c_str())), body);
}
