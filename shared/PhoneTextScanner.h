// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_PHONE_TEXT_SCANNER_H
#define PHONELIB_PHONE_TEXT_SCANNER_H

#include "Utils.h"

// A phone number candidate found in free-form text. 'start' and 'end' are
// byte offsets into the scanned text: text.substr(start, end - start) ==
// raw. 'normalized' is empty if the candidate is not a valid number.
struct ExtractedPhoneNumber {
  ExtractedPhoneNumber()
      : start(0),
        end(0),
        is_valid(false) {
  }

  string raw;
  string normalized;
  int start;
  int end;
  bool is_valid;
};

ostream& operator<<(ostream& os, const ExtractedPhoneNumber& n);

typedef std::function<string (const ExtractedPhoneNumber&)> PhoneReplacer;

// Finds every run of at least 7 digits (with '+', parentheses and single
// '-', '.' or ' ' separators) in the UTF-8 'text'. Candidates are appended
// to '*numbers' in text order and never overlap. Invalid candidates are
// included with is_valid == false.
void ExtractPhoneNumbers(
    const Slice& text, vector<ExtractedPhoneNumber>* numbers);

// Like ExtractPhoneNumbers() but only returns the valid candidates.
void ExtractValidPhoneNumbers(
    const Slice& text, vector<ExtractedPhoneNumber>* numbers);

// Like ExtractPhoneNumbers() but candidates are also tried as national
// numbers of the country 'code'. Candidates without a leading '+' try the
// national interpretation first. An unknown 'code' is ignored.
void ExtractPhoneNumbersWithCountryHint(
    const Slice& text, const Slice& code,
    vector<ExtractedPhoneNumber>* numbers);

// Returns the number of candidates (valid or not) in 'text'.
int CountPhoneNumbers(const Slice& text);

// Returns 'text' with every candidate replaced by the result of 'replacer'.
string ReplacePhoneNumbers(const Slice& text, const PhoneReplacer& replacer);

// Masks every candidate in 'text', keeping its last 'visible_digits' digits:
// "Call +12025550173" becomes "Call *******0173". A candidate is replaced by
// "[PHONE]" if 'visible_digits' is 0 or not less than its digit count.
string RedactPhoneNumbers(const Slice& text, int visible_digits);

#endif  // PHONELIB_PHONE_TEXT_SCANNER_H
