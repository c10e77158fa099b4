// Copyright 2012 Viewfinder. All rights reserved.

#ifdef TESTING

#include "Format.h"
#include "Testing.h"

namespace {

TEST(FormatTest, Basic) {
  EXPECT_EQ("%", Format("%%"));
  EXPECT_EQ("% hello % world", Format("%% hello %% world"));
  EXPECT_EQ("hello", Format("hello"));
}

TEST(FormatTest, Integers) {
  EXPECT_EQ("42",    Format("%d", 42));
  EXPECT_EQ("   42", Format("%5d", 42));
  EXPECT_EQ("42   ", Format("%-5d", 42));
  EXPECT_EQ("00042", Format("%05d", 42));
  EXPECT_EQ("  +42", Format("%+5d", 42));
  EXPECT_EQ("  -42", Format("%5d", -42));
  EXPECT_EQ("2a",    Format("%x", 42));
  EXPECT_EQ("2A",    Format("%X", 42));
  EXPECT_EQ("52",    Format("%o", 42));
  EXPECT_EQ("+961",  Format("+%d", 961));
}

TEST(FormatTest, Strings) {
  EXPECT_EQ("hello world", Format("%s %s", "hello", string("world")));
  EXPECT_EQ("  abc", Format("%5s", "abc"));
  EXPECT_EQ("abc  ", Format("%-5s", "abc"));
  EXPECT_EQ("ab", Format("%.2s", "abc"));
  EXPECT_EQ("slice", Format("%s", Slice("slice")));
  EXPECT_EQ("x", Format("%c", 'x'));
}

TEST(FormatTest, Floats) {
  EXPECT_EQ("3.14", Format("%.2f", 3.14159));
  EXPECT_EQ("  3.1", Format("%5.1f", 3.14159));
}

TEST(FormatTest, ArgumentMismatch) {
  EXPECT_NE(string::npos, Format("%d %d", 1).find("<Error"));
  EXPECT_NE(string::npos, Format("%d", 1, 2).find("<Error"));
}

}  // namespace

#endif  // TESTING
