#include <gtest/gtest.h>

#include "util/base64.hpp"

#include <string>

namespace onova {
namespace {

TEST(Base64Test, EncodesRfc4648Vectors) {
    EXPECT_EQ(Base64Encode(""), "");
    EXPECT_EQ(Base64Encode("f"), "Zg==");
    EXPECT_EQ(Base64Encode("fo"), "Zm8=");
    EXPECT_EQ(Base64Encode("foo"), "Zm9v");
    EXPECT_EQ(Base64Encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodesPaddedInput) {
    EXPECT_EQ(Base64Decode("Zg==").value(), "f");
    EXPECT_EQ(Base64Decode("Zm8=").value(), "fo");
    EXPECT_EQ(Base64Decode("Zm9vYmFy").value(), "foobar");
    EXPECT_EQ(Base64Decode("").value(), "");
}

TEST(Base64Test, KeepsArbitraryBytes) {
    const std::string raw = std::string("--name \"a b\" 'c'\0\xff", 18) + "\xc3\xa9t\xc3\xa9 \xe6\x97\xa5\xe6\x9c\xac";
    auto decoded = Base64Decode(Base64Encode(raw));
    ASSERT_TRUE(decoded.has_value()) << decoded.error();
    EXPECT_EQ(*decoded, raw);
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(Base64Decode("Zm9").has_value());
    EXPECT_FALSE(Base64Decode("Zm9v!!==").has_value());
}

TEST(Base64Test, RejectsMisplacedPadding) {
    EXPECT_FALSE(Base64Decode("====").has_value());
    EXPECT_FALSE(Base64Decode("QQ=A").has_value());
    EXPECT_FALSE(Base64Decode("Q===").has_value());
    EXPECT_FALSE(Base64Decode("Zg==Zm9v").has_value());
    EXPECT_FALSE(Base64Decode("Zm9v====").has_value());
    EXPECT_EQ(Base64Decode("QQ==").value(), "A");
}

} // namespace
} // namespace onova
