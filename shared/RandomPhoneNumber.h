// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_RANDOM_PHONE_NUMBER_H
#define PHONELIB_RANDOM_PHONE_NUMBER_H

#include "Random.h"
#include "Utils.h"

// Generates "+<prefix><digits>" using the first accepted national length of
// the country 'code'. Intended for test data; the numbers are not guaranteed
// to be assigned. Returns false if 'code' is unknown.
bool GenerateRandomPhoneNumber(const Slice& code, Random* rand, string* number);

// Returns 'count' numbers from GenerateRandomPhoneNumber(), or an empty
// vector if 'code' is unknown.
vector<string> GenerateRandomPhoneNumbers(
    const Slice& code, int count, Random* rand);

#endif  // PHONELIB_RANDOM_PHONE_NUMBER_H
