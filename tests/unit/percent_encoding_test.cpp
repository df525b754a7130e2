#include <gtest/gtest.h>
#include <sleek/url/percent_encoding.h>
#include <sleek/url/idna.h>
#include <string>

using namespace sleek::url;

// =============================================================================
// encode_uri_component tests
// =============================================================================
TEST(EncodeUriComponent, EncodesUrlDelimiters) {
    EXPECT_EQ(encode_uri_component("http://x.com/a/b"), "http%3A%2F%2Fx.com%2Fa%2Fb");
}

TEST(EncodeUriComponent, EncodesQuerySeparators) {
    EXPECT_EQ(encode_uri_component("a=1&b=2?#"), "a%3D1%26b%3D2%3F%23");
}

TEST(EncodeUriComponent, KeepsComponentMarks) {
    EXPECT_EQ(encode_uri_component("-_.!~*'()"), "-_.!~*'()");
}

TEST(EncodeUriComponent, EncodesSpaceAndPlus) {
    EXPECT_EQ(encode_uri_component("a b+c"), "a%20b%2Bc");
}

TEST(EncodeUriComponent, EmptyInput) {
    EXPECT_EQ(encode_uri_component(""), "");
}

// =============================================================================
// percent_decode tests
// =============================================================================
TEST(PercentDecoding, SimpleDecode) {
    EXPECT_EQ(percent_decode("hello%20world"), "hello world");
}

TEST(PercentDecoding, LowercaseHex) {
    EXPECT_EQ(percent_decode("%2f%3a"), "/:");
}

TEST(PercentDecoding, InvalidSequenceKept) {
    EXPECT_EQ(percent_decode("100%zz"), "100%zz");
}

TEST(PercentDecoding, TruncatedSequenceKept) {
    EXPECT_EQ(percent_decode("abc%2"), "abc%2");
    EXPECT_EQ(percent_decode("abc%"), "abc%");
}

TEST(PercentDecoding, PlusIsNotSpace) {
    EXPECT_EQ(percent_decode("a+b"), "a+b");
}

TEST(PercentDecoding, ComponentRoundTrip) {
    std::string value = "https://example.com/search?q=a b&lang=en#top";
    EXPECT_EQ(percent_decode(encode_uri_component(value)), value);
}

// =============================================================================
// Query parameter tests
// =============================================================================
TEST(QueryParameter, DecodeQueryComponentTreatsPlusAsSpace) {
    EXPECT_EQ(decode_query_component("a+b%2Bc"), "a b+c");
}

TEST(QueryParameter, FindsEncodedUrlValue) {
    auto value = find_query_parameter("url=http%3A%2F%2Fx.com%2Fa%3Fq%3D1", "url");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "http://x.com/a?q=1");
}

TEST(QueryParameter, FindsValueAfterOtherPairs) {
    auto value = find_query_parameter("a=1&b=two+words&url=x", "b");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "two words");
}

TEST(QueryParameter, FirstOccurrenceWins) {
    auto value = find_query_parameter("url=first&url=second", "url");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "first");
}

TEST(QueryParameter, BareNameYieldsEmpty) {
    auto value = find_query_parameter("debug&url=x", "debug");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->empty());
}

TEST(QueryParameter, MissingName) {
    EXPECT_FALSE(find_query_parameter("a=1&b=2", "url").has_value());
    EXPECT_FALSE(find_query_parameter("", "url").has_value());
}

TEST(QueryParameter, NamePrefixDoesNotMatch) {
    EXPECT_FALSE(find_query_parameter("urls=1", "url").has_value());
}

// =============================================================================
// domain_to_ascii tests
// =============================================================================
TEST(DomainToAscii, Lowercases) {
    auto host = domain_to_ascii("WWW.Example.COM");
    ASSERT_TRUE(host.has_value());
    EXPECT_EQ(*host, "www.example.com");
}

TEST(DomainToAscii, StripsTrailingDot) {
    auto host = domain_to_ascii("example.com.");
    ASSERT_TRUE(host.has_value());
    EXPECT_EQ(*host, "example.com");
}

TEST(DomainToAscii, RejectsForbiddenCodePoints) {
    EXPECT_FALSE(domain_to_ascii("exa mple.com").has_value());
    EXPECT_FALSE(domain_to_ascii("a%b.com").has_value());
    EXPECT_FALSE(domain_to_ascii("a<b.com").has_value());
}

TEST(DomainToAscii, RejectsEmptyLabels) {
    EXPECT_FALSE(domain_to_ascii("a..com").has_value());
    EXPECT_FALSE(domain_to_ascii(".example.com").has_value());
}

TEST(DomainToAscii, RejectsNonAscii) {
    EXPECT_FALSE(domain_to_ascii("b\xC3\xBC" "cher.de").has_value());
}
