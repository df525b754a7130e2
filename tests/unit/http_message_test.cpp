#include <sleek/net/request.h>
#include <sleek/net/response.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace sleek::net;

namespace {

std::string serialized(const Request& request) {
    auto bytes = request.serialize();
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

// ===========================================================================
// Request Tests
// ===========================================================================

TEST(RequestTest, ParseUrlSimple) {
    Request req;
    req.url = "http://example.com/index.html";
    ASSERT_TRUE(req.parse_url());
    EXPECT_EQ(req.host, "example.com");
    EXPECT_EQ(req.port, 80);
    EXPECT_EQ(req.path, "/index.html");
    EXPECT_TRUE(req.query.empty());
    EXPECT_FALSE(req.use_tls);
}

TEST(RequestTest, ParseUrlHttpsWithCustomPortAndQuery) {
    Request req;
    req.url = "https://example.com:8443/search?q=a%20b";
    ASSERT_TRUE(req.parse_url());
    EXPECT_TRUE(req.use_tls);
    EXPECT_EQ(req.port, 8443);
    EXPECT_EQ(req.path, "/search");
    EXPECT_EQ(req.query, "q=a%20b");
}

TEST(RequestTest, ParseUrlDefaultsHttpsPort) {
    Request req;
    req.url = "https://example.com";
    ASSERT_TRUE(req.parse_url());
    EXPECT_EQ(req.port, 443);
    EXPECT_EQ(req.path, "/");
}

TEST(RequestTest, ParseUrlRejectsOtherSchemes) {
    Request req;
    req.url = "ftp://example.com/file";
    EXPECT_FALSE(req.parse_url());
    req.url = "not a url";
    EXPECT_FALSE(req.parse_url());
}

TEST(RequestTest, SerializeGetRequest) {
    Request req;
    req.url = "http://example.com/a?b=1";
    ASSERT_TRUE(req.parse_url());
    req.headers.set("User-Agent", "SleekProxy/1.0");

    std::string text = serialized(req);
    EXPECT_EQ(text.rfind("GET /a?b=1 HTTP/1.1\r\nHost: example.com\r\n", 0), 0u);
    EXPECT_NE(text.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(text.find("Accept-Encoding: gzip, deflate\r\n"), std::string::npos);
    EXPECT_NE(text.find("user-agent: SleekProxy/1.0\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 4), "\r\n\r\n");
}

TEST(RequestTest, SerializeNonStandardPort) {
    Request req;
    req.url = "https://example.com:8443/";
    ASSERT_TRUE(req.parse_url());
    EXPECT_NE(serialized(req).find("Host: example.com:8443\r\n"), std::string::npos);
}

TEST(RequestTest, CallerHeadersOverrideDefaults) {
    Request req;
    req.url = "http://example.com/";
    ASSERT_TRUE(req.parse_url());
    req.headers.set("Accept", "image/png");
    req.headers.set("Connection", "keep-alive");

    std::string text = serialized(req);
    EXPECT_EQ(text.find("Accept: text/html"), std::string::npos);
    EXPECT_NE(text.find("accept: image/png\r\n"), std::string::npos);
    EXPECT_EQ(text.find("keep-alive"), std::string::npos);
}

TEST(RequestTest, NoCookiesAreSent) {
    Request req;
    req.url = "http://example.com/";
    ASSERT_TRUE(req.parse_url());
    EXPECT_EQ(serialized(req).find("Cookie"), std::string::npos);
}

// ===========================================================================
// Response Tests
// ===========================================================================

TEST(ResponseTest, ParseSimpleHead) {
    auto resp = Response::parse_head(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/html; charset=utf-8\r\n"
        "Content-Length: 12\r\n"
        "\r\n");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 200);
    EXPECT_EQ(resp->status_text, "OK");
    EXPECT_EQ(resp->content_type(), "text/html; charset=utf-8");
    EXPECT_EQ(resp->headers.get("content-length").value(), "12");
}

TEST(ResponseTest, ParseMultiWordReasonAndNoReason) {
    auto not_found = Response::parse_head("HTTP/1.1 404 Not Found\r\n\r\n");
    ASSERT_TRUE(not_found.has_value());
    EXPECT_EQ(not_found->status, 404);
    EXPECT_EQ(not_found->status_text, "Not Found");

    auto bare = Response::parse_head("HTTP/1.1 204\r\n\r\n");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->status, 204);
    EXPECT_TRUE(bare->status_text.empty());
}

TEST(ResponseTest, RepeatedHeadersKept) {
    auto resp = Response::parse_head(
        "HTTP/1.1 200 OK\r\n"
        "Set-Cookie: a=1\r\n"
        "Set-Cookie: b=2\r\n"
        "\r\n");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->headers.get_all("set-cookie").size(), 2u);
}

TEST(ResponseTest, BareLineFeedsAccepted) {
    auto resp = Response::parse_head("HTTP/1.0 301 Moved\nLocation: /next\n\n");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 301);
    EXPECT_EQ(resp->headers.get("location").value(), "/next");
}

TEST(ResponseTest, FoldedHeaderUnfolded) {
    auto resp = Response::parse_head(
        "HTTP/1.1 200 OK\r\n"
        "X-Long: first\r\n"
        "\tsecond\r\n"
        "\r\n");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->headers.get("x-long").value(), "first second");
}

TEST(ResponseTest, MalformedHeadsRejected) {
    EXPECT_FALSE(Response::parse_head("").has_value());
    EXPECT_FALSE(Response::parse_head("ICY 200 OK\r\n\r\n").has_value());
    EXPECT_FALSE(Response::parse_head("HTTP/1.1 2x0 OK\r\n\r\n").has_value());
    EXPECT_FALSE(Response::parse_head("HTTP/1.1 200 OK\r\nNo colon here\r\n\r\n").has_value());
    EXPECT_FALSE(Response::parse_head("HTTP/1.1 200 OK\r\nBad Name: x\r\n\r\n").has_value());
}

TEST(ResponseTest, HasBody) {
    Response resp;
    resp.status = 200;
    EXPECT_TRUE(resp.has_body(Method::GET));
    EXPECT_FALSE(resp.has_body(Method::HEAD));
    resp.status = 204;
    EXPECT_FALSE(resp.has_body(Method::GET));
    resp.status = 304;
    EXPECT_FALSE(resp.has_body(Method::GET));
    resp.status = 404;
    EXPECT_TRUE(resp.has_body(Method::GET));
}
