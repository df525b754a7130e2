#include <sleek/core/base64.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace sleek::core;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(Base64Test, Encode) {
    EXPECT_EQ(base64_encode({}), "");
    EXPECT_EQ(base64_encode(bytes("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes("hello")), "aGVsbG8=");
    EXPECT_EQ(base64_encode({0x89, 0x50, 0x4e, 0x47, 0xff}), "iVBOR/8=");
}

TEST(Base64Test, Decode) {
    EXPECT_EQ(base64_decode(""), std::vector<uint8_t>{});
    EXPECT_EQ(base64_decode("Zg=="), bytes("f"));
    EXPECT_EQ(base64_decode("Zm8="), bytes("fo"));
    EXPECT_EQ(base64_decode("Zm9v"), bytes("foo"));
    EXPECT_EQ(base64_decode("aGVsbG8="), bytes("hello"));
    EXPECT_EQ(base64_decode("iVBOR/8="), (std::vector<uint8_t>{0x89, 0x50, 0x4e, 0x47, 0xff}));
}

TEST(Base64Test, DecodeRejectsMalformed) {
    EXPECT_FALSE(base64_decode("abc").has_value());
    EXPECT_FALSE(base64_decode("ab!d").has_value());
}

TEST(Base64Test, DecodeRejectsMisplacedPadding) {
    EXPECT_FALSE(base64_decode("====").has_value());
    EXPECT_FALSE(base64_decode("===A").has_value());
    EXPECT_FALSE(base64_decode("Z===").has_value());
    EXPECT_FALSE(base64_decode("Zg==Zg==").has_value());
    EXPECT_FALSE(base64_decode("=Zm9").has_value());
}
