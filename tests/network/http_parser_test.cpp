#include "pushpop/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace pushpop;
using namespace pushpop::network;

TEST(HttpRequestParserTest, ParsesGetWithHeaders) {
    const std::string raw =
        "GET /movie.mkv HTTP/1.1\r\n"
        "Host: 10.0.0.2:4000\r\n"
        "Range: bytes=4096-\r\n"
        "X-PushPop-User: alice\r\n"
        "\r\n";

    HttpRequestParser parser;
    auto result = parser.parse(raw.data(), raw.size());
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());

    const HttpRequest request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_EQ(request.url, "/movie.mkv");
    EXPECT_EQ(request.version, HttpVersion::HTTP_1_1);
    EXPECT_EQ(request.get_header("range"), "bytes=4096-");
    EXPECT_EQ(request.get_header(kUserHeader), "alice");
}

TEST(HttpRequestParserTest, AcceptsBytesOneAtATime) {
    const std::string raw = "GET / HTTP/1.0\r\nHost: x\r\n\r\n";

    HttpRequestParser parser;
    for (std::size_t i = 0; i + 1 < raw.size(); ++i) {
        auto result = parser.parse(&raw[i], 1);
        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.value());
    }
    auto last = parser.parse(&raw.back(), 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.get_request().version, HttpVersion::HTTP_1_0);
}

TEST(HttpRequestParserTest, ReadsBodyByContentLength) {
    const std::string raw = "POST /x HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello";

    HttpRequestParser parser;
    auto result = parser.parse(raw.data(), raw.size());
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());
    const auto request = parser.get_request();
    EXPECT_EQ(std::string(request.body.begin(), request.body.end()), "hello");
}

TEST(HttpRequestParserTest, RejectsGarbage) {
    const std::string raw = "get / HTTP/1.1\r\n\r\n";
    HttpRequestParser parser;
    auto result = parser.parse(raw.data(), raw.size());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Protocol);
}

TEST(HttpRequestParserTest, RejectsUnknownVersion) {
    const std::string raw = "GET / HTTP/2.0\r\n\r\n";
    HttpRequestParser parser;
    EXPECT_TRUE(parser.parse(raw.data(), raw.size()).is_error());
}

TEST(HttpRequestParserTest, RejectsOversizedHead) {
    std::string raw = "GET / HTTP/1.1\r\nX-Big: ";
    raw += std::string(kMaxHeadBytes, 'a');
    raw += "\r\n\r\n";

    HttpRequestParser parser;
    EXPECT_TRUE(parser.parse(raw.data(), raw.size()).is_error());
}

TEST(HttpResponseHeadParserTest, StopsAtEndOfHead) {
    const std::string head =
        "HTTP/1.1 206 Partial Content\r\n"
        "Content-Length: 4\r\n"
        "Content-Range: bytes 6-9/10\r\n"
        "\r\n";
    const std::string raw = head + "6789";

    HttpResponseHeadParser parser;
    std::size_t consumed = 0;
    auto result = parser.parse(raw.data(), raw.size(), consumed);
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());
    EXPECT_EQ(consumed, head.size());

    EXPECT_EQ(parser.head().status_code, 206);
    EXPECT_EQ(parser.head().reason_phrase, "Partial Content");
    EXPECT_EQ(parser.head().content_length(), 4);
    EXPECT_EQ(parser.head().get_header("content-range"), "bytes 6-9/10");
}

TEST(HttpResponseHeadParserTest, ReasonPhraseIsOptional) {
    const std::string raw = "HTTP/1.1 503\r\nRetry-After: 1\r\n\r\n";

    HttpResponseHeadParser parser;
    std::size_t consumed = 0;
    auto result = parser.parse(raw.data(), raw.size(), consumed);
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());
    EXPECT_EQ(parser.head().status_code, 503);
    EXPECT_EQ(parser.head().reason_phrase, "");
    EXPECT_EQ(parser.head().get_header("Retry-After"), "1");
}

TEST(HttpResponseHeadParserTest, SplitAcrossReads) {
    const std::string first = "HTTP/1.0 200 O";
    const std::string second = "K\r\nContent-Length: 0\r\n\r\n";

    HttpResponseHeadParser parser;
    std::size_t consumed = 0;
    auto partial = parser.parse(first.data(), first.size(), consumed);
    ASSERT_TRUE(partial.is_ok());
    EXPECT_FALSE(partial.value());
    EXPECT_EQ(consumed, first.size());

    auto done = parser.parse(second.data(), second.size(), consumed);
    ASSERT_TRUE(done.is_ok());
    ASSERT_TRUE(done.value());
    EXPECT_EQ(consumed, second.size());
    EXPECT_EQ(parser.head().version, HttpVersion::HTTP_1_0);
    EXPECT_EQ(parser.head().reason_phrase, "OK");
}

TEST(HttpResponseHeadParserTest, RejectsBadStatus) {
    const std::string raw = "HTTP/1.1 2x0 OK\r\n\r\n";
    HttpResponseHeadParser parser;
    std::size_t consumed = 0;
    EXPECT_TRUE(parser.parse(raw.data(), raw.size(), consumed).is_error());
}
