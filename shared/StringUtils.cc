// Copyright 2011 Viewfinder. All rights reserved.

#include "StringUtils.h"

bool IsAlphaNumUnicode(UChar32 c) {
  // "GC" here means "general category"
  return u_hasBinaryProperty(c, UCHAR_ALPHABETIC) ||
      (U_GET_GC_MASK(c) & U_GC_N_MASK) != 0;
}

int Utf8CharIndexToByteOffset(const Slice& s, int char_index) {
  int index = 0;
  for (UnicodeCharIterator iter(s); !iter.Done(); iter.Advance(), ++index) {
    if (index == char_index) {
      return iter.Position();
    }
  }
  return s.size();
}

UnicodeCharIterator::UnicodeCharIterator(const Slice& s)
    : error_(false) {
  UErrorCode icu_status = U_ZERO_ERROR;
  utext_ = utext_openUTF8(NULL, s.data(), s.size(), &icu_status);
  if (!U_SUCCESS(icu_status)) {
    error_ = true;
    next_ = U_SENTINEL;
    return;
  }
  next_ = utext_next32From(utext_, 0);
}

UnicodeCharIterator::~UnicodeCharIterator() {
  utext_close(utext_);
}
