#include "cmlink/util/Base64.hpp"

#include <gtest/gtest.h>

using namespace cmlink::util;

TEST(Base64Test, EncodesRfc4648Vectors) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodesValidInput) {
    auto decoded = base64Decode("Zm9vYg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "foob");
}

TEST(Base64Test, RejectsInvalidInput) {
    EXPECT_FALSE(base64Decode("Zm9").has_value());
    EXPECT_FALSE(base64Decode("Zm9*").has_value());
}
