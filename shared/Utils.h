// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_UTILS_H
#define PHONELIB_UTILS_H

#include <stddef.h>
#include <stdint.h>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <re2/stringpiece.h>

using std::ostream;
using std::pair;
using std::string;
using std::vector;

// Import re2::StringPiece using the more compact name Slice.
typedef re2::StringPiece Slice;

#define ARRAYSIZE(a)                                 \
  ((sizeof(a) / sizeof(*(a))) /                      \
   static_cast<size_t>(!(sizeof(a) % sizeof(*(a)))))

// Returns true if 'c' is an ASCII decimal digit. Phone number digits are
// always ASCII; other unicode digits are treated as ordinary characters.
inline bool IsAsciiDigit(int c) {
  return c >= '0' && c <= '9';
}

#endif // PHONELIB_UTILS_H
