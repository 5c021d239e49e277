#include "updown/text.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

TEST(UrlEncode, EscapesReservedCharacters) {
    EXPECT_EQ(updown::url_encode("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(updown::url_encode("dir/my file&x"), "dir%2Fmy%20file%26x");
}

TEST(HtmlEscape, EscapesMarkup) {
    EXPECT_EQ(updown::html_escape("<a href=\"x\">'&'</a>"),
        "&lt;a href=&#34;x&#34;&gt;&#39;&amp;&#39;&lt;/a&gt;");
}

TEST(SanitizeForLog, EscapesControlBytesAndTruncates) {
    EXPECT_EQ(updown::sanitize_for_log("a\r\nb\x01"), "a\\r\\nb\\x01");
    EXPECT_EQ(updown::sanitize_for_log("abcdef", 3), "abc...(truncated)");
}

TEST(AddQueryToPath, EncodesValues) {
    EXPECT_EQ(updown::add_query_to_path("/", { { "p", "../x y" } }), "/?p=..%2Fx%20y");
    EXPECT_EQ(updown::add_query_to_path("/download", {}), "/download");
}

TEST(QueryValueOrDefault, FallsBackOnMissingOrEmpty) {
    httplib::Request req;
    EXPECT_EQ(updown::query_value_or_default(req, "p", "."), ".");

    req.params.emplace("p", "");
    EXPECT_EQ(updown::query_value_or_default(req, "p", "."), ".");

    req.params.clear();
    req.params.emplace("p", "docs");
    EXPECT_EQ(updown::query_value_or_default(req, "p", "."), "docs");
}

TEST(QuoteHeaderValue, EscapesQuoteAndBackslash) {
    EXPECT_EQ(updown::quote_header_value("plain name.txt"), "plain name.txt");
    EXPECT_EQ(updown::quote_header_value("say \"hi\".txt"), "say \\\"hi\\\".txt");
    EXPECT_EQ(updown::quote_header_value("a\\b"), "a\\\\b");
}

TEST(RequestTarget, KeepsRawTargetVerbatim) {
    httplib::Request req;
    req.path = "/download";
    EXPECT_EQ(updown::request_target(req), "/download");

    req.target = "/download?z=1&p=a%26b%3Dc";
    req.params.emplace("p", "a&b=c");
    req.params.emplace("z", "1");
    EXPECT_EQ(updown::request_target(req), "/download?z=1&p=a%26b%3Dc");
}
