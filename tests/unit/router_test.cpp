#include <sleek/server/router.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace sleek;
using namespace sleek::server;

namespace {

class TableResolver : public proxy::HostResolver {
public:
    std::optional<std::vector<std::string>> resolve(const std::string& host) const override {
        if (host == "example.com") return std::vector<std::string>{"93.184.216.34"};
        return std::nullopt;
    }
};

class PlainFetcher : public net::Fetcher {
public:
    mutable int calls = 0;
    mutable net::Request last_request;

    net::FetchOutcome fetch(const net::Request& request) const override {
        ++calls;
        last_request = request;
        net::Response head;
        head.status = 200;
        head.headers.set("Content-Type", "text/plain");
        return net::FetchOutcome::success(std::move(head),
                                          std::make_unique<net::MemoryBodyStream>(std::string("ok")));
    }
};

HttpRequest request_from(const std::string& raw) {
    HttpRequest request;
    size_t consumed = 0;
    EXPECT_EQ(parse_request_head(raw, request, consumed), ParseStatus::Complete) << raw;
    request.client_address = "203.0.113.7";
    return request;
}

HttpRequest get(const std::string& target, const std::string& extra_headers = "") {
    return request_from("GET " + target + " HTTP/1.1\r\nHost: localhost\r\n" + extra_headers +
                        "\r\n");
}

} // namespace

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.public_dir = "public";
        fetcher = std::make_shared<PlainFetcher>();
    }

    Router make_router() {
        auto handler = std::make_shared<const proxy::ProxyHandler>(
            config, fetcher, std::make_shared<TableResolver>());
        return Router(config, handler);
    }

    core::ProxyConfig config;
    std::shared_ptr<PlainFetcher> fetcher;
    core::DiagnosticEmitter diag;
};

// ============================================================================
// Proxy mount
// ============================================================================

TEST_F(RouterTest, ProxyMountDispatchesToHandler) {
    auto router = make_router();
    auto response = router.route(get("/proxy?url=https%3A%2F%2Fexample.com%2Fpage",
                                     "User-Agent: TestAgent/1\r\n"),
                                 diag);
    EXPECT_EQ(response.status, 200);
    ASSERT_EQ(fetcher->calls, 1);
    EXPECT_EQ(fetcher->last_request.url, "https://example.com/page");
    EXPECT_EQ(fetcher->last_request.headers.get("user-agent").value_or(""), "TestAgent/1");
}

TEST_F(RouterTest, ProxyMountWithoutUrl) {
    auto router = make_router();
    auto response = router.route(get("/proxy"), diag);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(fetcher->calls, 0);
}

TEST_F(RouterTest, ProxyMountOnlyAcceptsGet) {
    auto router = make_router();
    auto response = router.route(
        request_from("POST /proxy?url=https%3A%2F%2Fexample.com HTTP/1.1\r\n\r\n"), diag);
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(response.headers.get("allow").value_or(""), "GET");
    EXPECT_EQ(fetcher->calls, 0);
}

TEST_F(RouterTest, CancellationReachesFetcher) {
    auto router = make_router();
    router.route(get("/proxy?url=https%3A%2F%2Fexample.com%2F"), diag, [] { return true; });
    ASSERT_EQ(fetcher->calls, 1);
    ASSERT_TRUE(static_cast<bool>(fetcher->last_request.is_cancelled));
    EXPECT_TRUE(fetcher->last_request.is_cancelled());
}

TEST_F(RouterTest, ServerlessMount) {
    config.mount_path = "/.netlify/functions/proxy";
    auto router = make_router();

    auto proxied = router.route(
        get("/.netlify/functions/proxy?url=https%3A%2F%2Fexample.com%2F"), diag);
    EXPECT_EQ(proxied.status, 200);
    EXPECT_EQ(fetcher->calls, 1);

    auto other = router.route(get("/proxy?url=https%3A%2F%2Fexample.com%2F"), diag);
    EXPECT_EQ(other.status, 404);
    EXPECT_EQ(fetcher->calls, 1);
}

// ============================================================================
// Static files
// ============================================================================

TEST_F(RouterTest, LandingPage) {
    auto router = make_router();
    auto response = router.route(get("/"), diag);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers.get("content-type").value_or(""), "text/html; charset=utf-8");
    EXPECT_EQ(response.headers.get("cache-control").value_or(""), "no-cache");
    EXPECT_NE(response.body.find("SleekProxy"), std::string::npos);
}

TEST_F(RouterTest, HeadAllowedForStatic) {
    auto router = make_router();
    auto response = router.route(request_from("HEAD /index.html HTTP/1.1\r\n\r\n"), diag);
    EXPECT_EQ(response.status, 200);
}

TEST_F(RouterTest, UnknownPathNotFound) {
    auto router = make_router();
    auto response = router.route(get("/nope.html"), diag);
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.body, "Not found");
}

TEST_F(RouterTest, TraversalNotFound) {
    auto router = make_router();
    EXPECT_EQ(router.route(get("/%2e%2e/CMakeLists.txt"), diag).status, 404);
}

TEST_F(RouterTest, OtherMethodsRejectedForStatic) {
    auto router = make_router();
    auto response = router.route(request_from("DELETE /index.html HTTP/1.1\r\n\r\n"), diag);
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(response.headers.get("allow").value_or(""), "GET, HEAD");
}

// ============================================================================
// Access control
// ============================================================================

TEST_F(RouterTest, BasicAuthGuardsEveryRoute) {
    config.basic_auth = core::BasicCredentials{"user", "pass"};
    auto router = make_router();

    auto denied = router.route(get("/proxy?url=https%3A%2F%2Fexample.com%2F"), diag);
    EXPECT_EQ(denied.status, 401);
    EXPECT_TRUE(denied.headers.has("www-authenticate"));
    EXPECT_EQ(fetcher->calls, 0);
    EXPECT_EQ(router.route(get("/"), diag).status, 401);

    auto allowed = router.route(get("/", "Authorization: Basic dXNlcjpwYXNz\r\n"), diag);
    EXPECT_EQ(allowed.status, 200);
}

TEST_F(RouterTest, RateLimitApplies) {
    config.rate_limit_per_minute = 2;
    auto router = make_router();
    EXPECT_EQ(router.route(get("/"), diag).status, 200);
    EXPECT_EQ(router.route(get("/"), diag).status, 200);
    auto limited = router.route(get("/"), diag);
    EXPECT_EQ(limited.status, 429);
    EXPECT_TRUE(std::any_of(diag.events().begin(), diag.events().end(),
                            [](const core::DiagnosticEvent& e) {
                                return e.severity == core::Severity::Warning;
                            }));
}

// ============================================================================
// text_response
// ============================================================================

TEST(TextResponseTest, Shape) {
    auto response = text_response(503, "busy");
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.body, "busy");
    EXPECT_EQ(response.headers.get("content-type").value_or(""), "text/plain; charset=utf-8");
    EXPECT_TRUE(response.stream == nullptr);
    EXPECT_EQ(response.transaction.current(), proxy::TransactionStage::Received);
}
