#include <gtest/gtest.h>
#include "text/Charset.hpp"
#include "test_utils.hpp"

TEST(Charset, utf8) {
    Charset charset("UTF-8");
    EXPECT_EQ("UTF-8", charset.name());
    EXPECT_EQ(1, charset.step());
    EXPECT_EQ(1, charset.min_char_size());
    EXPECT_GE(charset.max_char_size(), 3);
    EXPECT_EQ("\r\n", charset.crlf().to_string());
    EXPECT_EQ("\n", charset.lf().to_string());
    EXPECT_EQ("\r", charset.cr().to_string());
}

TEST(Charset, aliases) {
    EXPECT_TRUE(Charset::is_supported("utf8"));
    EXPECT_TRUE(Charset::is_supported("latin1"));
    EXPECT_TRUE(Charset::is_supported("windows-1252"));
    EXPECT_TRUE(Charset::is_supported("Shift_JIS"));
    EXPECT_TRUE(Charset::is_supported("GBK"));
    EXPECT_TRUE(Charset::is_supported("US-ASCII"));
}

TEST(Charset, utf16) {
    Charset le("UTF-16LE");
    EXPECT_EQ(2, le.step());
    EXPECT_EQ(std::string("\r\0\n\0", 4), le.crlf().to_string());

    Charset be("UTF-16BE");
    EXPECT_EQ(2, be.step());
    EXPECT_EQ(std::string("\0\n", 2), be.lf().to_string());
}

TEST(Charset, utf32) {
    Charset be("UTF-32BE");
    EXPECT_EQ(4, be.step());
    EXPECT_EQ(4, be.max_char_size());
    EXPECT_EQ(std::string("\0\0\0\r", 4), be.cr().to_string());
}

TEST(Charset, unknown) {
    EXPECT_THROW(Charset("no-such-charset"), Charset::UnsupportedError);
    EXPECT_THROW(Charset(""), Charset::UnsupportedError);
}

TEST(Charset, byte_order_mark_dependent) {
    EXPECT_THROW(Charset("UTF-16"), Charset::UnsupportedError);
    EXPECT_THROW(Charset("UTF-32"), Charset::UnsupportedError);
}

TEST(Charset, stateful) {
    EXPECT_FALSE(Charset::is_supported("ISO-2022-JP"));
    EXPECT_FALSE(Charset::is_supported("UTF-7"));
    EXPECT_FALSE(Charset::is_supported("HZ"));
}

TEST(Charset, decode) {
    Charset charset("ISO-8859-1");
    const uint8_t data[] = { 'A', 0xC4, 0xE4 };
    EXPECT_EQ("AÄä", charset.decode(data, sizeof(data)));
}

TEST(Charset, decode_empty) {
    Charset charset("UTF-16LE");
    EXPECT_EQ("", charset.decode(buf_t()));
}

TEST(Charset, decode_malformed_utf8) {
    Charset charset("UTF-8");
    const uint8_t data[] = { 'a', 0xC3 };
    EXPECT_THROW(charset.decode(data, sizeof(data)), Charset::DecodeError);

    const uint8_t bad[] = { 0xFF, 'a' };
    EXPECT_THROW(charset.decode(bad, sizeof(bad)), Charset::DecodeError);
}

TEST(Charset, decode_error_message) {
    Charset charset("UTF-8");
    const uint8_t data[] = { 0xFF };
    try {
        charset.decode(data, sizeof(data), 0x1234);
        FAIL() << "no exception";
    } catch (const Charset::DecodeError& e) {
        EXPECT_THAT(e.what(), HasSubstr("UTF-8"));
        EXPECT_THAT(e.what(), HasSubstr("0x1234"));
    }
}

TEST(Charset, decode_truncated_utf16) {
    Charset charset("UTF-16LE");
    const uint8_t data[] = { 'a', 0, 'b' };
    EXPECT_THROW(charset.decode(data, sizeof(data)), Charset::DecodeError);
}

TEST(Charset, encode) {
    Charset sjis("Shift_JIS");
    buf_t encoded = sjis.encode("ぁ");
    EXPECT_EQ(2, encoded.size());
    EXPECT_EQ("ぁ", sjis.decode(encoded));
}

TEST(Charset, encode_unmappable) {
    Charset latin1("ISO-8859-1");
    EXPECT_THROW(latin1.encode("明"), Charset::DecodeError);
}
