#include <sleek/net/content_encoding.h>

#include <gtest/gtest.h>
#include <zlib.h>

#include <string>
#include <vector>

using namespace sleek::net;

namespace {

// window_bits: 15 + 16 for gzip, 15 for zlib, -15 for raw deflate
std::vector<uint8_t> compress(const std::string& input, int window_bits) {
    z_stream strm{};
    EXPECT_EQ(deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
                           Z_DEFAULT_STRATEGY), Z_OK);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());

    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(input.size())));
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&strm, Z_FINISH), Z_STREAM_END);
    out.resize(out.size() - strm.avail_out);
    deflateEnd(&strm);
    return out;
}

std::string text_of(const std::vector<uint8_t>& data) {
    return std::string(data.begin(), data.end());
}

const std::string kPage = "<html><body><p>compressed page body</p></body></html>";
constexpr size_t kLimit = 10 * 1024 * 1024;

} // namespace

// ===========================================================================
// parse_content_coding
// ===========================================================================

TEST(ContentCoding, ParsesKnownCodings) {
    EXPECT_EQ(parse_content_coding(""), ContentCoding::Identity);
    EXPECT_EQ(parse_content_coding("identity"), ContentCoding::Identity);
    EXPECT_EQ(parse_content_coding("gzip"), ContentCoding::Gzip);
    EXPECT_EQ(parse_content_coding(" GZIP "), ContentCoding::Gzip);
    EXPECT_EQ(parse_content_coding("x-gzip"), ContentCoding::Gzip);
    EXPECT_EQ(parse_content_coding("Deflate"), ContentCoding::Deflate);
}

TEST(ContentCoding, UnknownAndStackedAreUnsupported) {
    EXPECT_EQ(parse_content_coding("br"), ContentCoding::Unsupported);
    EXPECT_EQ(parse_content_coding("zstd"), ContentCoding::Unsupported);
    EXPECT_EQ(parse_content_coding("gzip, deflate"), ContentCoding::Unsupported);
}

// ===========================================================================
// decode_body
// ===========================================================================

TEST(DecodeBody, Gzip) {
    auto decoded = decode_body(compress(kPage, 15 + 16), ContentCoding::Gzip, kLimit);
    ASSERT_TRUE(decoded.ok);
    EXPECT_EQ(text_of(decoded.data), kPage);
}

TEST(DecodeBody, ZlibWrappedDeflate) {
    auto decoded = decode_body(compress(kPage, 15), ContentCoding::Deflate, kLimit);
    ASSERT_TRUE(decoded.ok);
    EXPECT_EQ(text_of(decoded.data), kPage);
}

TEST(DecodeBody, RawDeflate) {
    auto decoded = decode_body(compress(kPage, -15), ContentCoding::Deflate, kLimit);
    ASSERT_TRUE(decoded.ok);
    EXPECT_EQ(text_of(decoded.data), kPage);
}

TEST(DecodeBody, LargeBodyInflatesPastOneBuffer) {
    std::string big(200000, 'a');
    for (size_t i = 0; i < big.size(); i += 97) big[i] = 'b';
    auto decoded = decode_body(compress(big, 15 + 16), ContentCoding::Gzip, kLimit);
    ASSERT_TRUE(decoded.ok);
    EXPECT_EQ(decoded.data.size(), big.size());
    EXPECT_EQ(text_of(decoded.data), big);
}

TEST(DecodeBody, OutputExactlyAtLimitIsAccepted) {
    auto decoded = decode_body(compress(kPage, 15 + 16), ContentCoding::Gzip, kPage.size());
    ASSERT_TRUE(decoded.ok);
    EXPECT_EQ(text_of(decoded.data), kPage);
}

TEST(DecodeBody, HighlyCompressibleBodyStopsAtLimit) {
    // 8 MiB of one byte compresses to a few KiB
    const std::string bomb(8 * 1024 * 1024, 'x');
    auto compressed = compress(bomb, 15 + 16);
    ASSERT_LT(compressed.size(), 64u * 1024u);

    auto decoded = decode_body(compressed, ContentCoding::Gzip, 100000);
    EXPECT_FALSE(decoded.ok);
    EXPECT_TRUE(decoded.too_large);
    EXPECT_TRUE(decoded.data.empty());
    EXPECT_LE(decoded.data.capacity(), 100000u);
    EXPECT_EQ(decoded.error, "document exceeds 100000 bytes after decoding");
}

TEST(DecodeBody, RawDeflatePastLimitIsTooLarge) {
    const std::string bomb(1024 * 1024, 'y');
    auto decoded = decode_body(compress(bomb, -15), ContentCoding::Deflate, 4096);
    EXPECT_FALSE(decoded.ok);
    EXPECT_TRUE(decoded.too_large);
}

TEST(DecodeBody, IdentityIsCopied) {
    std::vector<uint8_t> body = {0x89, 'P', 'N', 'G'};
    auto decoded = decode_body(body, ContentCoding::Identity, kLimit);
    ASSERT_TRUE(decoded.ok);
    EXPECT_EQ(decoded.data, body);
}

TEST(DecodeBody, IdentityPastLimitIsTooLarge) {
    std::vector<uint8_t> body(10, 'z');
    auto decoded = decode_body(body, ContentCoding::Identity, 9);
    EXPECT_FALSE(decoded.ok);
    EXPECT_TRUE(decoded.too_large);
}

TEST(DecodeBody, EmptyCompressedBody) {
    auto decoded = decode_body({}, ContentCoding::Gzip, kLimit);
    ASSERT_TRUE(decoded.ok);
    EXPECT_TRUE(decoded.data.empty());
}

TEST(DecodeBody, CorruptInputFails) {
    std::vector<uint8_t> junk = {'n', 'o', 't', ' ', 'g', 'z', 'i', 'p'};
    auto decoded = decode_body(junk, ContentCoding::Gzip, kLimit);
    EXPECT_FALSE(decoded.ok);
    EXPECT_FALSE(decoded.too_large);
}

TEST(DecodeBody, TruncatedGzipFails) {
    auto compressed = compress(kPage, 15 + 16);
    compressed.resize(compressed.size() / 2);
    EXPECT_FALSE(decode_body(compressed, ContentCoding::Gzip, kLimit).ok);
}

TEST(DecodeBody, UnsupportedFails) {
    std::vector<uint8_t> body = {'x'};
    auto decoded = decode_body(body, ContentCoding::Unsupported, kLimit);
    EXPECT_FALSE(decoded.ok);
    EXPECT_FALSE(decoded.too_large);
}
