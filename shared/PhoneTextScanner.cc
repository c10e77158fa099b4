// Copyright 2013 Viewfinder. All rights reserved.

#include "CountryTable.h"
#include "Logging.h"
#include "PhoneTextScanner.h"
#include "PhoneUtils.h"
#include "StringUtils.h"

namespace {

const int kMinCandidateDigits = 7;
const int kMaxCandidateDigits = 15;
const char kRedactedPlaceholder[] = "[PHONE]";

void DecodeText(const Slice& text, vector<UChar32>* chars) {
  for (UnicodeCharIterator iter(text); !iter.Done(); iter.Advance()) {
    chars->push_back(iter.Get());
  }
}

bool IsCandidateStart(const vector<UChar32>& chars, int pos) {
  const UChar32 c = chars[pos];
  if (c == '+' || c == '(') {
    return pos + 1 < chars.size() && IsAsciiDigit(chars[pos + 1]);
  }
  if (IsAsciiDigit(c)) {
    // Digits inside a word or a longer number do not start a candidate.
    return pos == 0 || !IsAlphaNumUnicode(chars[pos - 1]);
  }
  return false;
}

// Greedily consumes phone number characters starting at 'start'. Returns the
// number of digits consumed and sets '*last_digit' to the index of the last
// one.
int ScanCandidate(const vector<UChar32>& chars, int start, int* last_digit) {
  const int n = chars.size();
  int digits = 0;
  int paren_depth = 0;
  *last_digit = start;

  for (int pos = start; pos < n && digits <= kMaxCandidateDigits; ++pos) {
    const UChar32 c = chars[pos];
    if (IsAsciiDigit(c)) {
      ++digits;
      *last_digit = pos;
    } else if (c == '+' && pos == start) {
      // Leading '+'.
    } else if (c == '(') {
      ++paren_depth;
    } else if (c == ')' && paren_depth > 0) {
      --paren_depth;
    } else if (c == '-' || c == '.' || c == ' ') {
      // Separators must sit between digits.
      if (digits == 0 || pos + 1 >= n ||
          !(IsAsciiDigit(chars[pos + 1]) || chars[pos + 1] == '(')) {
        break;
      }
    } else {
      break;
    }
  }
  return digits;
}

bool NormalizeCandidate(
    const string& raw, const CountryRule* hint, string* normalized) {
  if (!hint) {
    return NormalizePhoneNumber(raw, normalized);
  }
  if (raw[0] != '+') {
    return NormalizePhoneNumberForCountry(raw, hint->code, normalized) ||
        NormalizePhoneNumber(raw, normalized);
  }
  return NormalizePhoneNumber(raw, normalized) ||
      NormalizePhoneNumberForCountry(raw, hint->code, normalized);
}

void ScanText(const Slice& text, const CountryRule* hint,
              vector<ExtractedPhoneNumber>* numbers) {
  vector<UChar32> chars;
  DecodeText(text, &chars);

  const int n = chars.size();
  int found = 0;
  for (int i = 0; i < n; ) {
    int last_digit = i;
    if (!IsCandidateStart(chars, i) ||
        ScanCandidate(chars, i, &last_digit) < kMinCandidateDigits) {
      ++i;
      continue;
    }

    numbers->push_back(ExtractedPhoneNumber());
    ExtractedPhoneNumber* e = &numbers->back();
    // Candidates are found by character index; spans are reported in bytes.
    e->start = Utf8CharIndexToByteOffset(text, i);
    e->end = Utf8CharIndexToByteOffset(text, last_digit + 1);
    e->raw = text.substr(e->start, e->end - e->start).as_string();
    e->is_valid = NormalizeCandidate(e->raw, hint, &e->normalized);
    ++found;

    i = last_digit + 1;
  }

  VLOG("scan: %d candidates in %d bytes", found, text.size());
}

}  // namespace

ostream& operator<<(ostream& os, const ExtractedPhoneNumber& n) {
  os << "[" << n.start << "," << n.end << ") \"" << n.raw << "\"";
  if (n.is_valid) {
    os << " " << n.normalized;
  } else {
    os << " invalid";
  }
  return os;
}

void ExtractPhoneNumbers(
    const Slice& text, vector<ExtractedPhoneNumber>* numbers) {
  ScanText(text, NULL, numbers);
}

void ExtractValidPhoneNumbers(
    const Slice& text, vector<ExtractedPhoneNumber>* numbers) {
  vector<ExtractedPhoneNumber> all;
  ScanText(text, NULL, &all);
  for (int i = 0; i < all.size(); ++i) {
    if (all[i].is_valid) {
      numbers->push_back(all[i]);
    }
  }
}

void ExtractPhoneNumbersWithCountryHint(
    const Slice& text, const Slice& code,
    vector<ExtractedPhoneNumber>* numbers) {
  const CountryRule* hint = FindCountryByCode(code);
  if (!hint) {
    VLOG("scan: %s: %s", PhoneNumberErrorName(PHONE_UNKNOWN_HINT), code);
  }
  ScanText(text, hint, numbers);
}

int CountPhoneNumbers(const Slice& text) {
  vector<ExtractedPhoneNumber> numbers;
  ScanText(text, NULL, &numbers);
  return numbers.size();
}

string ReplacePhoneNumbers(const Slice& text, const PhoneReplacer& replacer) {
  vector<ExtractedPhoneNumber> numbers;
  ScanText(text, NULL, &numbers);
  if (numbers.empty()) {
    return text.as_string();
  }

  string result;
  result.reserve(text.size());
  int last_end = 0;
  for (int i = 0; i < numbers.size(); ++i) {
    const ExtractedPhoneNumber& n = numbers[i];
    DCHECK_LE(last_end, n.start);
    text.substr(last_end, n.start - last_end).AppendToString(&result);
    result.append(replacer(n));
    last_end = n.end;
  }
  text.substr(last_end).AppendToString(&result);
  return result;
}

string RedactPhoneNumbers(const Slice& text, int visible_digits) {
  return ReplacePhoneNumbers(
      text, [visible_digits](const ExtractedPhoneNumber& n) -> string {
        const string digits = StripNonDigits(n.raw);
        if (visible_digits <= 0 || visible_digits >= digits.size()) {
          return string(kRedactedPlaceholder);
        }
        const int hidden = digits.size() - visible_digits;
        return string(hidden, '*') + digits.substr(hidden);
      });
}
