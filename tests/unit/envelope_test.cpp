#include <sleek/proxy/envelope.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace sleek;
using namespace sleek::proxy;

namespace {

class FailingStream : public net::BodyStream {
public:
    std::optional<std::vector<uint8_t>> read() override {
        if (!sent_) {
            sent_ = true;
            return std::vector<uint8_t>{'a', 'b'};
        }
        return std::nullopt;
    }
    std::string error() const override { return "connection reset"; }

private:
    bool sent_ = false;
};

ProxyResponse streamed(std::unique_ptr<net::BodyStream> stream) {
    ProxyResponse response;
    response.status = 200;
    response.headers.set("Content-Type", "image/png");
    response.stream = std::move(stream);
    return response;
}

} // namespace

// ============================================================================
// FunctionEnvelope::to_json
// ============================================================================

TEST(FunctionEnvelopeTest, JsonShape) {
    FunctionEnvelope envelope;
    envelope.status_code = 404;
    envelope.headers.set("Content-Type", "text/html; charset=utf-8");
    envelope.body = "<p>gone</p>";
    EXPECT_EQ(envelope.to_json(),
              "{\"statusCode\":404,\"headers\":{\"content-type\":\"text/html; charset=utf-8\"},"
              "\"body\":\"<p>gone</p>\",\"isBase64Encoded\":false}");
}

TEST(FunctionEnvelopeTest, JsonEscaping) {
    FunctionEnvelope envelope;
    envelope.body = std::string("a\"b\\c\nd\te") + '\x01';
    EXPECT_EQ(envelope.to_json(),
              "{\"statusCode\":200,\"headers\":{},"
              "\"body\":\"a\\\"b\\\\c\\nd\\te\\u0001\",\"isBase64Encoded\":false}");
}

// ============================================================================
// to_envelope
// ============================================================================

TEST(ToEnvelopeTest, TextBodyCopiedVerbatim) {
    core::DiagnosticEmitter diag;
    ProxyResponse response;
    response.status = 403;
    response.headers.set("Content-Type", "text/plain; charset=utf-8");
    response.body = "Host not allowed: example.org";

    auto envelope = to_envelope(std::move(response), diag);
    EXPECT_EQ(envelope.status_code, 403);
    EXPECT_FALSE(envelope.is_base64_encoded);
    EXPECT_EQ(envelope.body, "Host not allowed: example.org");
    EXPECT_FALSE(envelope.headers.has("cache-control"));
}

TEST(ToEnvelopeTest, StreamIsBase64WithDefaultCaching) {
    core::DiagnosticEmitter diag;
    auto response = streamed(std::make_unique<net::MemoryBodyStream>(std::string("hello"), 2));

    auto envelope = to_envelope(std::move(response), diag);
    EXPECT_EQ(envelope.status_code, 200);
    EXPECT_TRUE(envelope.is_base64_encoded);
    EXPECT_EQ(envelope.body, "aGVsbG8=");
    EXPECT_EQ(envelope.headers.get("cache-control").value_or(""), "max-age=3600");
    EXPECT_EQ(envelope.headers.get("content-type").value_or(""), "image/png");
}

TEST(ToEnvelopeTest, UpstreamCacheControlKept) {
    core::DiagnosticEmitter diag;
    auto response = streamed(std::make_unique<net::MemoryBodyStream>(std::string("x")));
    response.headers.set("Cache-Control", "no-store");

    auto envelope = to_envelope(std::move(response), diag);
    EXPECT_EQ(envelope.headers.get_all("cache-control"), std::vector<std::string>{"no-store"});
}

TEST(ToEnvelopeTest, BrokenStreamIsBadGateway) {
    core::DiagnosticEmitter diag;
    auto response = streamed(std::make_unique<FailingStream>());

    auto envelope = to_envelope(std::move(response), diag);
    EXPECT_EQ(envelope.status_code, 502);
    EXPECT_FALSE(envelope.is_base64_encoded);
    EXPECT_EQ(envelope.body, "Upstream body error: connection reset");
    EXPECT_EQ(envelope.headers.get("content-type").value_or(""), "text/plain; charset=utf-8");
    EXPECT_EQ(std::count_if(diag.events().begin(), diag.events().end(),
                            [](const core::DiagnosticEvent& e) { return e.module == "envelope"; }),
              1);
}

TEST(ToEnvelopeTest, OversizedStreamIsBadGateway) {
    core::DiagnosticEmitter diag;
    auto response = streamed(std::make_unique<net::MemoryBodyStream>(std::string(64, 'z')));

    auto envelope = to_envelope(std::move(response), diag, 10);
    EXPECT_EQ(envelope.status_code, 502);
    EXPECT_EQ(envelope.body, "Upstream body error: body exceeds 10 bytes");
}

TEST(ToEnvelopeTest, FinishesTransaction) {
    core::DiagnosticEmitter diag;
    ProxyResponse response = streamed(std::make_unique<net::MemoryBodyStream>(std::string("ok")));
    response.transaction.advance(TransactionStage::Validated);
    response.transaction.advance(TransactionStage::Authorized);
    response.transaction.advance(TransactionStage::Fetched);
    response.transaction.advance(TransactionStage::Classified);
    response.transaction.advance(TransactionStage::PassedThrough);

    to_envelope(std::move(response), diag);
    EXPECT_EQ(response.transaction.current(), TransactionStage::Responded);
    EXPECT_EQ(response.transaction.records().back().detail, "2 bytes");
}
