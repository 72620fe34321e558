#include <gtest/gtest.h>
#include "utils/hex.hpp"

TEST(to_hex, empty) {
    EXPECT_EQ("", to_hex(nullptr, 0));
}

TEST(to_hex, uppercase) {
    const uint8_t data[] = { 0x00, 0x1f, 0xab, 0xff };
    EXPECT_EQ("001FABFF", to_hex(data, sizeof(data)));
}

TEST(to_hex, buf) {
    EXPECT_EQ("4142", to_hex(buf_t(std::string("AB"))));
}

TEST(hex2nib, digits) {
    EXPECT_EQ(0, hex2nib('0'));
    EXPECT_EQ(9, hex2nib('9'));
    EXPECT_EQ(10, hex2nib('a'));
    EXPECT_EQ(15, hex2nib('F'));
    EXPECT_EQ(-1, hex2nib('g'));
    EXPECT_EQ(-1, hex2nib(' '));
}

TEST(from_hex, mixed_case) {
    buf_t out;
    ASSERT_TRUE(from_hex("00fFaB", out));
    EXPECT_EQ(buf_t(std::string("\x00\xff\xab", 3)), out);
}

TEST(from_hex, empty) {
    buf_t out(3);
    ASSERT_TRUE(from_hex("", out));
    EXPECT_TRUE(out.empty());
}

TEST(from_hex, odd_length) {
    buf_t out;
    size_t bad_pos = 0;
    EXPECT_FALSE(from_hex("abc", out, &bad_pos));
    EXPECT_EQ(3, bad_pos);
}

TEST(from_hex, bad_digit_position) {
    buf_t out(std::string("keep"));
    size_t bad_pos = 0;
    EXPECT_FALSE(from_hex("00112x", out, &bad_pos));
    EXPECT_EQ(5, bad_pos);
    EXPECT_EQ("keep", out.to_string()); // untouched on failure
}
