// Copyright 2012 Viewfinder. All rights reserved.

#include <stdlib.h>
#include "Random.h"

int32_t Random::Next32() {
  return rand_r(&seed_);
}

string Random::Digits(int n) {
  string s;
  s.reserve(n);
  for (int i = 0; i < n; ++i) {
    s.push_back('0' + (*this)(10));
  }
  return s;
}
