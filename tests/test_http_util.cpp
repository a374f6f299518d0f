#include "http_util.hpp"
#include <gtest/gtest.h>

using namespace ports;

TEST(HtmlEscape, EscapesMarkupCharacters) {
    EXPECT_EQ(html_escape("<script>alert('x')</script>"),
              "&lt;script&gt;alert(&#39;x&#39;)&lt;/script&gt;");
    EXPECT_EQ(html_escape("a & \"b\""), "a &amp; &quot;b&quot;");
    EXPECT_EQ(html_escape("plain.txt"), "plain.txt");
}

TEST(PercentDecode, DecodesValidEscapes) {
    EXPECT_EQ(percent_decode("/my%20file.txt"), "/my file.txt");
    EXPECT_EQ(percent_decode("%2e%2E"), "..");
    EXPECT_EQ(percent_decode("%C3%A9"), "\xC3\xA9");
}

TEST(PercentDecode, KeepsMalformedEscapesLiterally) {
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
    EXPECT_EQ(percent_decode("%4"), "%4");
}

TEST(PercentDecode, PlusIsNotSpace) {
    EXPECT_EQ(percent_decode("a+b"), "a+b");
}

TEST(PercentEncodePath, KeepsPathCharacters) {
    EXPECT_EQ(percent_encode_path("/dir/file-1_a.~txt"), "/dir/file-1_a.~txt");
    EXPECT_EQ(percent_encode_path("/it's"), "/it's");
}

TEST(PercentEncodePath, EncodesEverythingElse) {
    EXPECT_EQ(percent_encode_path("/my file.txt"), "/my%20file.txt");
    EXPECT_EQ(percent_encode_path("/a\"b<c>"), "/a%22b%3Cc%3E");
    EXPECT_EQ(percent_encode_path("/x\r\ny"), "/x%0D%0Ay");
    EXPECT_EQ(percent_encode_path("\xC3\xA9"), "%C3%A9");
}

TEST(SanitizeHeaderValue, RemovesLineBreaksAndNul) {
    std::string value = "/ok\r\nSet-Cookie: x";
    value.push_back('\0');
    value += "y";
    EXPECT_EQ(sanitize_header_value(value), "/okSet-Cookie: xy");
}

TEST(MimeType, KnownExtensionsCaseInsensitive) {
    EXPECT_EQ(mime_type_for("index.html"), "text/html; charset=utf-8");
    EXPECT_EQ(mime_type_for("INDEX.HTM"), "text/html; charset=utf-8");
    EXPECT_EQ(mime_type_for("/a/b/style.css"), "text/css");
    EXPECT_EQ(mime_type_for("app.js"), "application/javascript");
    EXPECT_EQ(mime_type_for("photo.JPEG"), "image/jpeg");
    EXPECT_EQ(mime_type_for("notes.md"), "text/markdown; charset=utf-8");
}

TEST(MimeType, UnknownFallsBackToOctetStream) {
    EXPECT_EQ(mime_type_for("archive.tar.xz"), "application/octet-stream");
    EXPECT_EQ(mime_type_for("Makefile"), "application/octet-stream");
}

TEST(StatusReason, CoversServedStatuses) {
    EXPECT_EQ(status_reason(200), "OK");
    EXPECT_EQ(status_reason(301), "Moved Permanently");
    EXPECT_EQ(status_reason(413), "Payload Too Large");
    EXPECT_EQ(status_reason(503), "Service Unavailable");
}

TEST(Utf8, AcceptsWellFormed) {
    EXPECT_TRUE(is_valid_utf8("GET / HTTP/1.1"));
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
}

TEST(Utf8, RejectsMalformed) {
    EXPECT_FALSE(is_valid_utf8("\xFF"));
    EXPECT_FALSE(is_valid_utf8("\xC3"));            // truncated
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));        // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));    // surrogate
}
