#include "vault/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace vault::network;
using vault::ErrorCode;

namespace {

vault::Result<bool> feed(HttpParser& parser, const std::string& raw) {
    return parser.parse(raw.data(), raw.size());
}

} // namespace

TEST(HttpParserTest, ParsesRequestWithBinaryBody) {
    HttpParser parser;
    std::string raw =
        "PUT /upload/chunk HTTP/1.1\r\n"
        "X-Upload-Session-ID: abc\r\n"
        "Content-Range: bytes 0-3/10\r\n"
        "Content-Length: 4\r\n"
        "\r\n";
    raw.push_back('\0');
    raw.push_back('\x01');
    raw.push_back('\xff');
    raw.push_back('\n');

    auto result = feed(parser, raw);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    ASSERT_TRUE(result.value());

    const HttpRequest request = parser.take_request();
    EXPECT_EQ(request.method, HttpMethod::PUT);
    EXPECT_EQ(request.path(), "/upload/chunk");
    EXPECT_EQ(request.get_header("x-upload-session-id"), "abc");
    ASSERT_EQ(request.body.size(), 4u);
    EXPECT_EQ(request.body[0], 0u);
    EXPECT_EQ(request.body[2], 0xffu);
}

TEST(HttpParserTest, IncrementalFeed) {
    HttpParser parser;
    const std::string raw =
        "POST /upload/init HTTP/1.1\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "{}";

    for (size_t i = 0; i + 1 < raw.size(); ++i) {
        auto partial = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(partial.is_ok());
        EXPECT_FALSE(partial.value());
    }
    auto last = parser.parse(raw.data() + raw.size() - 1, 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.get_request().body_as_string(), "{}");
}

TEST(HttpParserTest, RequestWithoutBodyCompletesAtBlankLine) {
    HttpParser parser;
    auto result = feed(parser, "GET /health?verbose=1 HTTP/1.0\r\nHost: x\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_request().version, HttpVersion::HTTP_1_0);
    EXPECT_EQ(parser.get_request().query_params().at("verbose"), "1");
}

TEST(HttpParserTest, RejectsMalformedInput) {
    HttpParser lowercase;
    auto bad_method = feed(lowercase, "get / HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(bad_method.is_error());
    EXPECT_EQ(bad_method.error().code, ErrorCode::InvalidArgument);

    HttpParser version;
    EXPECT_TRUE(feed(version, "GET / HTTP/2.0\r\n\r\n").is_error());

    HttpParser length;
    EXPECT_TRUE(feed(length, "PUT / HTTP/1.1\r\nContent-Length: 12a\r\n\r\n").is_error());

    HttpParser chunked;
    EXPECT_TRUE(feed(chunked, "PUT / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n").is_error());
}

TEST(HttpParserTest, BodyLimitIsEnforcedBeforeReading) {
    HttpParser parser(16);
    auto result = feed(parser, "PUT /upload/chunk HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::FileTooLarge);
}

TEST(HttpParserTest, ResetAllowsReuse) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "GET /a HTTP/1.1\r\n\r\n").value());
    parser.reset();
    ASSERT_TRUE(feed(parser, "GET /b HTTP/1.1\r\n\r\n").value());
    EXPECT_EQ(parser.get_request().url, "/b");
}
