#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "src/content/content_decoder.hpp"
#include "support/fake_backend.hpp"

using namespace wttp;
using test_support::mime;

TEST(ContentDecoderTest, TextTypes) {
    for (const char* code : {"tp", "th", "tc", "tm", "aj", "ao", "ax", "is"}) {
        EXPECT_TRUE(content::is_text_content_type(mime(code))) << code;
    }
}

TEST(ContentDecoderTest, BinaryTypes) {
    EXPECT_FALSE(content::is_text_content_type(mime("ip")));
    EXPECT_FALSE(content::is_text_content_type(MimeCode{0, 0}));
    EXPECT_FALSE(content::is_text_content_type(mime("zz")));
}

TEST(ContentDecoderTest, DecodesTextToString) {
    const Bytes body = {'<', 'p', '>', 0xC3, 0xA9};
    const auto decoded = content::decode(body, mime("th"));

    ASSERT_TRUE(std::holds_alternative<std::string>(decoded));
    EXPECT_EQ(std::get<std::string>(decoded), "<p>\xC3\xA9");
}

TEST(ContentDecoderTest, PassesBinaryThrough) {
    const Bytes body = {0x89, 'P', 'N', 'G'};
    const auto decoded = content::decode(body, mime("ip"));

    ASSERT_TRUE(std::holds_alternative<Bytes>(decoded));
    EXPECT_EQ(std::get<Bytes>(decoded), body);
}

TEST(ContentDecoderTest, MimeNames) {
    EXPECT_EQ(content::mime_type_name(mime("th")), "text/html");
    EXPECT_EQ(content::mime_type_name(mime("ao")), "application/json");
    EXPECT_EQ(content::mime_type_name(mime("is")), "image/svg+xml");
    EXPECT_EQ(content::mime_type_name(MimeCode{0, 0}), "application/octet-stream");
    EXPECT_EQ(content::mime_code_hex(mime("th")), "0x7468");
}
