// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_PHONE_NUMBER_TYPE_H
#define PHONELIB_PHONE_NUMBER_TYPE_H

#include "CountryTable.h"
#include "Utils.h"

enum PhoneNumberType {
  MOBILE = 0,
  FIXED_LINE,
  TOLL_FREE,
  PREMIUM_RATE,
  SHARED_COST,
  VOIP,
  PERSONAL_NUMBER,
  PAGER,
  UAN,
  EMERGENCY,
  VOICEMAIL,
  UNKNOWN,
};

const char* PhoneNumberTypeName(PhoneNumberType type);

// Classifies a national number (no country prefix, no trunk zero) by its
// leading digits. US/CA, GB, DE, FR, AU and IN have dedicated tables. Every
// other country gets a coarse first-digit guess (6-9 mobile, 1-5 fixed line,
// 0 toll free) which is frequently wrong.
PhoneNumberType ClassifyNationalNumber(
    const Slice& national, const CountryRule& rule);

// Normalizes 'raw' and classifies it. Returns false if 'raw' is not a valid
// phone number.
bool DetectPhoneNumberType(const Slice& raw, PhoneNumberType* type);

bool IsMobileNumber(const Slice& raw);
bool IsLandlineNumber(const Slice& raw);
bool IsTollFreeNumber(const Slice& raw);

// Batch version of DetectPhoneNumberType(). The first member of each pair is
// false for invalid numbers.
vector<pair<bool, PhoneNumberType> > DetectPhoneNumberTypes(
    const vector<string>& numbers);

#endif  // PHONELIB_PHONE_NUMBER_TYPE_H
