/**
 * @file test_http_message.cpp
 * @brief Unit tests for HTTP request parsing and response serialization.
 */

#include "server/http_message.hpp"

#include <gtest/gtest.h>

using namespace archetype;

// ─────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────

TEST(HttpParseTest, FindHeadEnd) {
    EXPECT_FALSE(find_head_end("GET / HTTP/1.1\r\nHost: x\r\n").has_value());
    std::string_view full = "GET / HTTP/1.1\r\nHost: x\r\n\r\nbody";
    auto end = find_head_end(full);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(full.substr(*end), "body");
}

TEST(HttpParseTest, RequestLineHeadersAndQuery) {
    auto request = parse_request_head(
        "POST /models/abc%20def/export?format=pt&verbose HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type:  application/json \r\n"
        "Content-Length: 12\r\n\r\n");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->path, "/models/abc def/export");
    EXPECT_EQ(request->query_param("format").value_or("<none>"), "pt");
    EXPECT_EQ(request->query_param("verbose").value_or("<none>"), "");
    EXPECT_FALSE(request->query_param("missing").has_value());
    EXPECT_EQ(request->header("content-type").value_or("<none>"), "application/json");
    EXPECT_EQ(request->header("HOST").value_or("<none>"), "localhost");

    auto length = content_length(*request);
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(*length, 12u);
}

TEST(HttpParseTest, RejectsMalformedHeads) {
    EXPECT_FALSE(parse_request_head("GARBAGE\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / SPDY/3\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET relative HTTP/1.1\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n").has_value());

    auto chunked = parse_request_head("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
    ASSERT_FALSE(chunked.has_value());
    EXPECT_EQ(chunked.error().code, ErrorCode::InvalidArgument);
}

TEST(HttpParseTest, ContentLengthValidation) {
    auto request = parse_request_head("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
    ASSERT_TRUE(request.has_value());
    EXPECT_FALSE(content_length(*request).has_value());

    auto none = parse_request_head("GET / HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(*content_length(*none), 0u);
}

TEST(HttpParseTest, UrlDecodeAndQuery) {
    EXPECT_EQ(url_decode("a%2Fb+c"), "a/b c");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");

    auto query = parse_query("status=running&&limit=10&name=a%26b");
    EXPECT_EQ(query.size(), 3u);
    EXPECT_EQ(query["status"], "running");
    EXPECT_EQ(query["limit"], "10");
    EXPECT_EQ(query["name"], "a&b");
}

TEST(HttpParseTest, JsonBody) {
    HttpRequest request;
    auto empty = request.json_body();
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->is_object());

    request.body = R"({"name": "m", "layers": [1, 2]})";
    auto parsed = request.json_body();
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["name"], "m");

    request.body = "{not json";
    auto bad = request.json_body();
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}

// ─────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────

TEST(HttpSerializeTest, JsonResponse) {
    auto response = HttpResponse::json(201, {{"id", "x"}});
    auto wire = serialize_response(response);
    EXPECT_EQ(wire.rfind("HTTP/1.1 201 Created\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: " + std::to_string(response.body.size())), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - response.body.size()), R"({"id":"x"})");
}

TEST(HttpSerializeTest, ErrorMapping) {
    EXPECT_EQ(status_for(ErrorCode::NotFound), 404);
    EXPECT_EQ(status_for(ErrorCode::DeviceNotFound), 404);
    EXPECT_EQ(status_for(ErrorCode::UnsupportedFormat), 400);
    EXPECT_EQ(status_for(ErrorCode::PreferenceUnsatisfiable), 400);
    EXPECT_EQ(status_for(ErrorCode::InvalidState), 409);
    EXPECT_EQ(status_for(ErrorCode::Unavailable), 503);
    EXPECT_EQ(status_for(ErrorCode::Internal), 500);

    auto response = HttpResponse::from_error(Error{ErrorCode::NotFound, "Model not found: x"});
    EXPECT_EQ(response.status, 404);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ(body["message"], "Model not found: x");
    EXPECT_TRUE(body.contains("error"));
}

TEST(HttpSerializeTest, StreamHeadAndChunks) {
    auto response = HttpResponse::stream([](ChunkedStream&) {});
    EXPECT_TRUE(response.is_stream());
    auto head = serialize_stream_head(response);
    EXPECT_NE(head.find("Content-Type: application/x-ndjson\r\n"), std::string::npos);
    EXPECT_NE(head.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
    EXPECT_EQ(head.substr(head.size() - 4), "\r\n\r\n");

    EXPECT_EQ(encode_chunk("hello"), "5\r\nhello\r\n");
    EXPECT_EQ(encode_chunk(std::string(26, 'a')).substr(0, 4), "1a\r\n");
    EXPECT_EQ(encode_chunk(""), "0\r\n\r\n");
}

TEST(HttpSerializeTest, DumpJsonReplacesInvalidUtf8) {
    nlohmann::json value = std::string{"bad \xff byte"};
    EXPECT_NO_THROW((void)dump_json(value));
}
