#include <gtest/gtest.h>

#include "cardlink/util/unicode.hpp"

using namespace cardlink::util;

class UnicodeTest : public ::testing::Test {};

TEST_F(UnicodeTest, TrimAscii) {
  EXPECT_EQ(trim("  hello \t\n"), "hello");
  EXPECT_EQ(trim("hello"), "hello");
  EXPECT_EQ(trim(""), "");
  EXPECT_EQ(trim(" \t "), "");
}

TEST_F(UnicodeTest, TrimUnicodeWhitespace) {
  // U+00A0 no-break space, U+3000 ideographic space, U+FEFF byte order mark
  EXPECT_EQ(trim("\u00A0Target\u3000"), "Target");
  EXPECT_EQ(trim("\uFEFFTitle"), "Title");
}

TEST_F(UnicodeTest, TrimKeepsInnerWhitespace) {
  EXPECT_EQ(trim("  two words  "), "two words");
}

TEST_F(UnicodeTest, InvalidBytesAreKept) {
  std::string text = " \xFF ";
  EXPECT_EQ(trim(text), "\xFF");
}

TEST_F(UnicodeTest, IsBlank) {
  EXPECT_TRUE(isBlank(""));
  EXPECT_TRUE(isBlank(" \u3000\t"));
  EXPECT_FALSE(isBlank(" x "));
}

TEST_F(UnicodeTest, NextCodePoint) {
  std::string text = "aé标";
  size_t pos = 0;

  EXPECT_EQ(nextCodePoint(text, pos), 'a');
  EXPECT_EQ(pos, 1u);
  EXPECT_EQ(nextCodePoint(text, pos), 0x00E9);
  EXPECT_EQ(pos, 3u);
  EXPECT_EQ(nextCodePoint(text, pos), 0x6807);
  EXPECT_EQ(pos, 6u);
  EXPECT_LT(nextCodePoint(text, pos), 0);
}

TEST_F(UnicodeTest, NextCodePointAdvancesOverInvalidByte) {
  std::string text = "\xFFx";
  size_t pos = 0;

  EXPECT_LT(nextCodePoint(text, pos), 0);
  EXPECT_EQ(pos, 1u);
  EXPECT_EQ(nextCodePoint(text, pos), 'x');
}
