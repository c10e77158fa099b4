// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_PHONE_UTILS_H
#define PHONELIB_PHONE_UTILS_H

#include "CountryTable.h"
#include "Utils.h"

// The reason a phone number could not be parsed. Only used for diagnostics;
// the public entry points report failure with a bool or an empty string.
enum PhoneNumberError {
  PHONE_OK = 0,
  PHONE_EMPTY,
  PHONE_INVALID_CHARACTER,
  PHONE_UNKNOWN_COUNTRY,
  PHONE_UNKNOWN_HINT,
};

const char* PhoneNumberErrorName(PhoneNumberError error);

// Returns true if 's' contains anything other than ASCII digits, spaces,
// '-', balanced parentheses and a single leading '+'.
bool ContainsInvalidPhoneCharacter(const Slice& s);

// Returns 's' with every character that is not an ASCII digit removed.
string StripNonDigits(const Slice& s);
void StripNonDigits(string* s);

// Returns 's' without its leading '0' characters. An all-zero string
// becomes empty.
string StripLeadingZeros(const Slice& s);
void StripLeadingZeros(string* s);

// Returns the first country rule whose prefix starts 'digits' and which
// accepts the number of digits that follow it. 'digits' must contain only
// ASCII digits. Returns NULL if no rule matches.
const CountryRule* ResolveCountry(const Slice& digits);

// Strips 'raw' down to its significant digits and resolves its country.
const CountryRule* ExtractCountry(const Slice& raw);

// Like ExtractCountry(), but falls back on common number lengths (10 digits
// for the US, 11 digits starting with 44 for GB, etc) when no rule matches.
const CountryRule* GuessCountry(const Slice& raw);

// Parses 'raw' into its country rule and national number (without the
// country prefix and trunk zeros). Either out parameter may be NULL.
PhoneNumberError ParsePhoneDigits(
    const Slice& raw, const CountryRule** rule, string* national);

// Parses 'raw' as a national number of the country with the specified ISO
// code: "+<prefix>" is prepended to the significant digits of 'raw'.
PhoneNumberError ParsePhoneDigitsForCountry(
    const Slice& raw, const Slice& code,
    const CountryRule** rule, string* national);

// Normalizes 'raw' to E.164 ("+<prefix><national number>"). Returns false
// and leaves '*normalized' untouched if 'raw' is not a valid phone number.
bool NormalizePhoneNumber(const Slice& raw, string* normalized);

// Like NormalizePhoneNumber(), but uses '*raw' as scratch space. The
// contents of '*raw' are unspecified on return.
bool NormalizePhoneNumberInPlace(string* raw, string* normalized);

// Normalizes 'raw' as a national number of the country 'code'.
bool NormalizePhoneNumberForCountry(
    const Slice& raw, const Slice& code, string* normalized);

// Returns a normalized (E164) version of the given phone number, or the
// empty string if the number is invalid.
string NormalizedPhoneNumber(const Slice& raw);

bool IsValidPhoneNumber(const Slice& raw);

// Returns true if both numbers are valid and normalize to the same string.
bool PhoneNumbersEqual(const Slice& a, const Slice& b);

// Returns true if 'raw' has between 7 and 15 digits, not all of them zero.
// No country resolution is performed.
bool IsPotentiallyValidPhoneNumber(const Slice& raw);

// Returns up to 5 valid, sorted, normalized numbers that 'raw' might have
// been intended as. 'hint' is an ISO country code; when empty a set of
// common countries is tried. A valid 'raw' is returned unchanged.
vector<string> SuggestPhoneNumberCorrections(
    const Slice& raw, const Slice& hint);

// Batch versions of the above. The results parallel 'numbers'.
vector<bool> ValidatePhoneNumbers(const vector<string>& numbers);
vector<string> NormalizePhoneNumbers(const vector<string>& numbers);
vector<const CountryRule*> ExtractCountries(const vector<string>& numbers);

#endif  // PHONELIB_PHONE_UTILS_H
