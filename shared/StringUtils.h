// Copyright 2011 Viewfinder. All rights reserved.

#ifndef PHONELIB_STRING_UTILS_H
#define PHONELIB_STRING_UTILS_H

#include <sstream>
#include <unicode/uchar.h>
#include <unicode/utext.h>
#include "Utils.h"

template <typename T>
inline string ToString(const T& t) {
  std::ostringstream s;
  s << t;
  return s.str();
}

inline string ToString(const Slice& s) {
  return s.as_string();
}

template <typename Iter>
string Join(Iter begin, Iter end, const string& delim) {
  string res;
  for (int i = 0; begin != end; ++i, ++begin) {
    if (i != 0) {
      res.append(delim);
    }
    res.append(*begin);
  }
  return res;
}

inline string Join(const vector<string>& parts, const string& delim) {
  return Join(parts.begin(), parts.end(), delim);
}

// Returns true if 'c' has the unicode Alphabetic property or is in the number
// (N) general category. Alphabetic includes combining vowel signs such as
// Devanagari U+093E, which end words in Indic scripts.
bool IsAlphaNumUnicode(UChar32 c);

// Returns the byte offset of the character (unicode scalar value) with index
// 'char_index' within the UTF-8 string 's'. Indexes past the end of the
// string map to the end of the string.
int Utf8CharIndexToByteOffset(const Slice& s, int char_index);

// Iterates over the unicode characters in a UTF-8 string. Ill-formed byte
// sequences are returned as U+FFFD.
//
//   for (UnicodeCharIterator iter(s); !iter.Done(); iter.Advance()) {
//     ... iter.Get() ... iter.Position() ...
//   }
class UnicodeCharIterator {
 public:
  explicit UnicodeCharIterator(const Slice& s);

  ~UnicodeCharIterator();

  bool error() const { return error_; }

  UChar32 Get() const { return next_; }

  bool Done() const { return next_ < 0; }

  void Advance() {
    next_ = utext_next32(utext_);
  }

  // Returns the position of the first byte of the current character.
  int64_t Position() const {
    return utext_getPreviousNativeIndex(utext_);
  }

 private:
  bool error_;
  UText* utext_;
  UChar32 next_;
};

#endif  // PHONELIB_STRING_UTILS_H
