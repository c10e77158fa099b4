// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_PHONE_FORMAT_H
#define PHONELIB_PHONE_FORMAT_H

#include "CountryTable.h"
#include "Utils.h"

enum PhoneFormatStyle {
  PHONE_FORMAT_E164 = 0,
  // "+44 7911 123 456"
  PHONE_FORMAT_INTERNATIONAL,
  // "(202) 555-0173"
  PHONE_FORMAT_NATIONAL,
  // "tel:+1-202-555-017-3"
  PHONE_FORMAT_RFC3966,
};

const char* PhoneFormatStyleName(PhoneFormatStyle style);

// Parses "e164", "international", "national" or "rfc3966".
bool ParsePhoneFormatStyle(const Slice& name, PhoneFormatStyle* style);

// Groups the digits of a national number using the conventions of 'rule'.
// Only US/CA, GB and DE have dedicated groupings; other numbers of at least
// 7 digits are split in half. Shorter numbers are returned ungrouped.
string FormatNationalNumber(const Slice& national, const CountryRule& rule);

// Formats a national number that has already been resolved to 'rule'.
string FormatPhoneNumber(
    const CountryRule& rule, const Slice& national, PhoneFormatStyle style);

// Normalizes 'raw' and formats it in the specified style. Returns false if
// 'raw' is not a valid phone number.
bool FormatPhoneNumber(
    const Slice& raw, PhoneFormatStyle style, string* formatted);

#endif  // PHONELIB_PHONE_FORMAT_H
