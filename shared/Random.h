// Copyright 2012 Viewfinder. All rights reserved.

#ifndef PHONELIB_RANDOM_H
#define PHONELIB_RANDOM_H

#include <stdint.h>
#include "Utils.h"

// A small, seedable pseudo-random generator. Not suitable for anything
// security sensitive. A fixed seed yields a reproducible sequence.
class Random {
 public:
  explicit Random(unsigned seed)
      : seed_(seed) {
  }

  int32_t Next32();

  // Returns a value in the range [0, n).
  int32_t operator()(int n) {
    return Next32() % n;
  }

  // Returns a string of 'n' random ASCII decimal digits.
  string Digits(int n);

 private:
  unsigned seed_;
};

#endif  // PHONELIB_RANDOM_H
