#include <gtest/gtest.h>
#include <convey/downloader/http_headers.hpp>

#include <string>

using namespace convey::downloader::http;

TEST(HttpHeaderParsing, SplitsNameAndValue_CaseInsensitive) {
    auto h = parseHeaderLine("ETag: \"abc123-xyz\"\r\n");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->name, "etag");
    EXPECT_EQ(h->value, "\"abc123-xyz\"");

    auto lm = parseHeaderLine("LAST-MODIFIED:   Wed, 20 Aug 2025 00:00:00 GMT  ");
    ASSERT_TRUE(lm.has_value());
    EXPECT_EQ(lm->name, "last-modified");
    EXPECT_EQ(lm->value, "Wed, 20 Aug 2025 00:00:00 GMT");
}

TEST(HttpHeaderParsing, RejectsStatusAndBlankLines) {
    EXPECT_FALSE(parseHeaderLine("HTTP/1.1 200 OK\r\n").has_value());
    EXPECT_FALSE(parseHeaderLine("\r\n").has_value());
    EXPECT_FALSE(parseHeaderLine(": value").has_value());
}

TEST(HttpHeaderParsing, UnquotesValidators) {
    EXPECT_EQ(unquoteValidator("\"abc\""), "abc");
    EXPECT_EQ(unquoteValidator("  'abc'  "), "abc");
    EXPECT_EQ(unquoteValidator("W/\"weak\""), "W/\"weak\"");
    EXPECT_EQ(unquoteValidator("plain"), "plain");
}

TEST(HttpHeaderParsing, ContentLengthAndRange) {
    EXPECT_EQ(parseContentLength("1048576"), 1048576u);
    EXPECT_EQ(parseContentLength(" 0 "), 0u);
    EXPECT_FALSE(parseContentLength("12abc").has_value());
    EXPECT_FALSE(parseContentLength("").has_value());

    EXPECT_EQ(parseContentRangeTotal("bytes 0-0/10485760"), 10485760u);
    EXPECT_EQ(parseContentRangeTotal("bytes 4000000-10485759/10485760"), 10485760u);
    EXPECT_FALSE(parseContentRangeTotal("bytes 0-0/*").has_value());
}

TEST(ContentDisposition, PlainAndQuotedFilename) {
    EXPECT_EQ(parseContentDispositionFilename("attachment; filename=report.pdf"), "report.pdf");
    EXPECT_EQ(parseContentDispositionFilename("attachment; filename=\"my report; v2.pdf\""),
              "my report; v2.pdf");
    EXPECT_EQ(parseContentDispositionFilename("attachment; filename=\"a\\\"b.txt\""), "a\"b.txt");
    EXPECT_FALSE(parseContentDispositionFilename("inline").has_value());
}

TEST(ContentDisposition, ExtendedFilenameWins) {
    auto name = parseContentDispositionFilename(
        "attachment; filename=\"fallback.txt\"; filename*=UTF-8''na%C3%AFve%20file.txt");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "na\xC3\xAFve file.txt");
}

TEST(HttpHelpers, PercentDecodeKeepsMalformedEscapes) {
    EXPECT_EQ(percentDecode("a%20b"), "a b");
    EXPECT_EQ(percentDecode("100%"), "100%");
    EXPECT_EQ(percentDecode("%zz"), "%zz");
}

TEST(HttpHelpers, ExtensionForContentType) {
    EXPECT_EQ(extensionForContentType("image/png"), ".png");
    EXPECT_EQ(extensionForContentType("image/svg+xml; charset=utf-8"), ".svg");
    EXPECT_EQ(extensionForContentType("text/plain"), ".plain");
    EXPECT_FALSE(extensionForContentType("application/octet-stream").has_value());
    EXPECT_FALSE(extensionForContentType("garbage").has_value());
}

TEST(HttpHelpers, CaseInsensitiveCompare) {
    EXPECT_TRUE(iequals("Accept-Ranges", "accept-ranges"));
    EXPECT_FALSE(iequals("bytes", "byte"));
}
