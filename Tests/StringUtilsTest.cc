// Copyright 2013 Viewfinder. All rights reserved.

#ifdef TESTING

#include "StringUtils.h"
#include "Testing.h"

namespace {

TEST(StringUtilsTest, UnicodeCharIterator) {
  const string s = "a€b😀";
  vector<int> chars;
  vector<int> positions;
  for (UnicodeCharIterator iter(s); !iter.Done(); iter.Advance()) {
    chars.push_back(iter.Get());
    positions.push_back(iter.Position());
  }
  ASSERT_EQ(4, chars.size());
  EXPECT_EQ('a', chars[0]);
  EXPECT_EQ(0x20AC, chars[1]);
  EXPECT_EQ('b', chars[2]);
  EXPECT_EQ(0x1F600, chars[3]);
  EXPECT_EQ(0, positions[0]);
  EXPECT_EQ(1, positions[1]);
  EXPECT_EQ(4, positions[2]);
  EXPECT_EQ(5, positions[3]);

  UnicodeCharIterator empty("");
  EXPECT(empty.Done());
}

TEST(StringUtilsTest, Utf8CharIndexToByteOffset) {
  const string s = "Tél: 1";
  EXPECT_EQ(0, Utf8CharIndexToByteOffset(s, 0));
  EXPECT_EQ(1, Utf8CharIndexToByteOffset(s, 1));
  EXPECT_EQ(3, Utf8CharIndexToByteOffset(s, 2));
  EXPECT_EQ(6, Utf8CharIndexToByteOffset(s, 5));
  EXPECT_EQ(7, Utf8CharIndexToByteOffset(s, 6));
  EXPECT_EQ(7, Utf8CharIndexToByteOffset(s, 100));
  EXPECT_EQ(0, Utf8CharIndexToByteOffset("", 3));
}

TEST(StringUtilsTest, IsAlphaNumUnicode) {
  EXPECT(IsAlphaNumUnicode('a'));
  EXPECT(IsAlphaNumUnicode('7'));
  EXPECT(IsAlphaNumUnicode(0x00E9));  // é
  EXPECT(IsAlphaNumUnicode(0x65E5));  // 日
  EXPECT(IsAlphaNumUnicode(0x0663));  // Arabic-Indic three
  EXPECT(IsAlphaNumUnicode(0x093E));  // Devanagari vowel sign aa
  EXPECT(!IsAlphaNumUnicode(' '));
  EXPECT(!IsAlphaNumUnicode('+'));
  EXPECT(!IsAlphaNumUnicode(0x260E));  // ☎
}

TEST(StringUtilsTest, Join) {
  vector<string> parts;
  EXPECT_EQ("", Join(parts, ","));
  parts.push_back("a");
  EXPECT_EQ("a", Join(parts, ","));
  parts.push_back("b");
  parts.push_back("c");
  EXPECT_EQ("a, b, c", Join(parts, ", "));
  EXPECT_EQ("b-c", Join(parts.begin() + 1, parts.end(), "-"));
}

TEST(StringUtilsTest, ToString) {
  EXPECT_EQ("42", ToString(42));
  EXPECT_EQ("abc", ToString(Slice("abc")));
}

}  // namespace

#endif  // TESTING
