#include <gtest/gtest.h>
#include "core/buf_t.hpp"

TEST(buf_t, splice_front) {
    buf_t buf(std::string("tail-garbage"));
    buf.splice_front(buf_t(std::string("head-")), 4);
    EXPECT_EQ("head-tail", buf.to_string());
}

TEST(buf_t, splice_front_keep_nothing) {
    buf_t buf(std::string("xyz"));
    buf.splice_front(buf_t(std::string("abc")), 0);
    EXPECT_EQ("abc", buf.to_string());
}

TEST(buf_t, splice_front_empty_front) {
    buf_t buf(std::string("xyz"));
    buf.splice_front(buf_t(), 2);
    EXPECT_EQ("xy", buf.to_string());
}

TEST(buf_t, splice_front_keep_too_much) {
    buf_t buf(std::string("xyz"));
    EXPECT_THROW(buf.splice_front(buf_t(), 4), std::out_of_range);
}

TEST(buf_t, matches_at) {
    buf_t buf(std::string("ab\r\n"));
    const buf_t crlf(std::string("\r\n"));

    EXPECT_TRUE(buf.matches_at(2, crlf));
    EXPECT_FALSE(buf.matches_at(1, crlf));
    EXPECT_FALSE(buf.matches_at(3, crlf));
    EXPECT_FALSE(buf.matches_at(100, crlf));
    EXPECT_FALSE(buf.matches_at(0, buf_t()));
}
