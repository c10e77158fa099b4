// Copyright 2013 Viewfinder. All rights reserved.

#include <algorithm>
#include "Logging.h"
#include "PhoneUtils.h"

namespace {

const int kMinPotentialDigits = 7;
const int kMaxPotentialDigits = 15;
const int kMaxSuggestions = 5;
const int kMinSuggestionDigits = 10;

// Countries tried by SuggestPhoneNumberCorrections() when no hint is given.
const char* const kCommonCountries[] = {
  "US", "GB", "DE", "FR", "IN", "AU", "CA",
};

// Resolves 'digits', which must already be stripped of formatting characters
// and leading zeros.
PhoneNumberError ParseSignificantDigits(
    const Slice& digits, const CountryRule** rule, string* national) {
  if (digits.empty()) {
    return PHONE_EMPTY;
  }
  const CountryRule* r = ResolveCountry(digits);
  if (!r) {
    return PHONE_UNKNOWN_COUNTRY;
  }
  if (rule) {
    *rule = r;
  }
  if (national) {
    *national = StripLeadingZeros(digits.substr(CountDigits(r->prefix)));
  }
  return PHONE_OK;
}

string E164(const CountryRule& rule, const string& national) {
  return Format("+%d%s", rule.prefix, national);
}

void AddSuggestion(const string& candidate, vector<string>* suggestions) {
  string normalized;
  if (NormalizePhoneNumber(candidate, &normalized)) {
    suggestions->push_back(normalized);
  }
}

}  // namespace

const char* PhoneNumberErrorName(PhoneNumberError error) {
  switch (error) {
    case PHONE_OK:
      return "ok";
    case PHONE_EMPTY:
      return "empty";
    case PHONE_INVALID_CHARACTER:
      return "invalid character";
    case PHONE_UNKNOWN_COUNTRY:
      return "unknown country";
    case PHONE_UNKNOWN_HINT:
      return "unknown country hint";
  }
  return "unknown error";
}

bool ContainsInvalidPhoneCharacter(const Slice& s) {
  int depth = 0;
  for (int i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (IsAsciiDigit(c) || c == ' ' || c == '-') {
      continue;
    }
    if (c == '+') {
      if (i != 0) {
        return true;
      }
    } else if (c == '(') {
      ++depth;
    } else if (c == ')') {
      if (depth == 0) {
        return true;
      }
      --depth;
    } else {
      return true;
    }
  }
  return depth != 0;
}

string StripNonDigits(const Slice& s) {
  string result;
  result.reserve(s.size());
  for (int i = 0; i < s.size(); ++i) {
    if (IsAsciiDigit(s[i])) {
      result.push_back(s[i]);
    }
  }
  return result;
}

void StripNonDigits(string* s) {
  s->erase(std::remove_if(s->begin(), s->end(),
                          [](char c) { return !IsAsciiDigit(c); }),
           s->end());
}

string StripLeadingZeros(const Slice& s) {
  int i = 0;
  while (i < s.size() && s[i] == '0') {
    ++i;
  }
  return s.substr(i).as_string();
}

void StripLeadingZeros(string* s) {
  s->erase(0, std::min(s->find_first_not_of('0'), s->size()));
}

const CountryRule* ResolveCountry(const Slice& digits) {
  const CountryRule* table = CountryTable();
  const int n = CountryTableSize();
  for (int i = 0; i < n; ++i) {
    const CountryRule& rule = table[i];
    const int prefix_digits = CountDigits(rule.prefix);
    if (digits.size() < prefix_digits) {
      continue;
    }
    int prefix = 0;
    for (int j = 0; j < prefix_digits; ++j) {
      prefix = prefix * 10 + (digits[j] - '0');
    }
    if (prefix == rule.prefix &&
        rule.AcceptsLength(digits.size() - prefix_digits)) {
      return &rule;
    }
  }
  return NULL;
}

const CountryRule* ExtractCountry(const Slice& raw) {
  string digits = StripNonDigits(raw);
  StripLeadingZeros(&digits);
  return ResolveCountry(digits);
}

const CountryRule* GuessCountry(const Slice& raw) {
  const string digits = StripNonDigits(raw);
  if (digits.empty()) {
    return NULL;
  }
  const CountryRule* rule = ExtractCountry(digits);
  if (rule) {
    return rule;
  }
  const Slice d(digits);
  if (d.size() == 10 || (d.size() == 11 && d.starts_with("1"))) {
    return FindCountryByCode("US");
  }
  if (d.size() == 11 && d.starts_with("44")) {
    return FindCountryByCode("GB");
  }
  if (d.size() == 12 && d.starts_with("49")) {
    return FindCountryByCode("DE");
  }
  return NULL;
}

PhoneNumberError ParsePhoneDigits(
    const Slice& raw, const CountryRule** rule, string* national) {
  if (raw.empty()) {
    return PHONE_EMPTY;
  }
  if (ContainsInvalidPhoneCharacter(raw)) {
    return PHONE_INVALID_CHARACTER;
  }
  string digits = StripNonDigits(raw);
  StripLeadingZeros(&digits);
  return ParseSignificantDigits(digits, rule, national);
}

PhoneNumberError ParsePhoneDigitsForCountry(
    const Slice& raw, const Slice& code,
    const CountryRule** rule, string* national) {
  const CountryRule* hint = FindCountryByCode(code);
  if (!hint) {
    return PHONE_UNKNOWN_HINT;
  }
  string digits = StripNonDigits(raw);
  StripLeadingZeros(&digits);
  if (digits.empty()) {
    return PHONE_EMPTY;
  }
  return ParseSignificantDigits(
      Format("%d%s", hint->prefix, digits), rule, national);
}

bool NormalizePhoneNumber(const Slice& raw, string* normalized) {
  const CountryRule* rule = NULL;
  string national;
  const PhoneNumberError error = ParsePhoneDigits(raw, &rule, &national);
  if (error != PHONE_OK) {
    VLOG("phone: unable to normalize \"%s\": %s",
         raw, PhoneNumberErrorName(error));
    return false;
  }
  *normalized = E164(*rule, national);
  return true;
}

bool NormalizePhoneNumberInPlace(string* raw, string* normalized) {
  if (raw->empty() || ContainsInvalidPhoneCharacter(*raw)) {
    return false;
  }
  StripNonDigits(raw);
  StripLeadingZeros(raw);
  const CountryRule* rule = ResolveCountry(*raw);
  if (!rule) {
    return false;
  }
  raw->erase(0, CountDigits(rule->prefix));
  StripLeadingZeros(raw);
  *normalized = E164(*rule, *raw);
  return true;
}

bool NormalizePhoneNumberForCountry(
    const Slice& raw, const Slice& code, string* normalized) {
  const CountryRule* rule = NULL;
  string national;
  const PhoneNumberError error =
      ParsePhoneDigitsForCountry(raw, code, &rule, &national);
  if (error != PHONE_OK) {
    VLOG("phone: unable to normalize \"%s\" for %s: %s",
         raw, code, PhoneNumberErrorName(error));
    return false;
  }
  *normalized = E164(*rule, national);
  return true;
}

string NormalizedPhoneNumber(const Slice& raw) {
  string normalized;
  if (!NormalizePhoneNumber(raw, &normalized)) {
    return "";
  }
  return normalized;
}

bool IsValidPhoneNumber(const Slice& raw) {
  return ParsePhoneDigits(raw, NULL, NULL) == PHONE_OK;
}

bool PhoneNumbersEqual(const Slice& a, const Slice& b) {
  string na;
  string nb;
  if (!NormalizePhoneNumber(a, &na) || !NormalizePhoneNumber(b, &nb)) {
    return false;
  }
  return na == nb;
}

bool IsPotentiallyValidPhoneNumber(const Slice& raw) {
  const string digits = StripNonDigits(raw);
  if (digits.size() < kMinPotentialDigits ||
      digits.size() > kMaxPotentialDigits) {
    return false;
  }
  return digits.find_first_not_of('0') != string::npos;
}

vector<string> SuggestPhoneNumberCorrections(
    const Slice& raw, const Slice& hint) {
  if (IsValidPhoneNumber(raw)) {
    return vector<string>(1, raw.as_string());
  }

  const string digits = StripLeadingZeros(StripNonDigits(raw));
  vector<string> suggestions;
  if (digits.empty()) {
    return suggestions;
  }

  const CountryRule* country = NULL;
  if (hint.empty()) {
    for (int i = 0; i < ARRAYSIZE(kCommonCountries); ++i) {
      const CountryRule* rule = FindCountryByCode(kCommonCountries[i]);
      DCHECK(rule != NULL) << ": " << kCommonCountries[i];
      if (rule) {
        AddSuggestion(Format("+%d%s", rule->prefix, digits), &suggestions);
      }
    }
  } else {
    country = FindCountryByCode(hint);
    if (!country) {
      VLOG("phone: suggestions for \"%s\": %s: %s",
           raw, PhoneNumberErrorName(PHONE_UNKNOWN_HINT), hint);
    } else {
      AddSuggestion(Format("+%d%s", country->prefix, digits), &suggestions);
    }
  }

  if (country && digits.size() > kMaxPotentialDigits) {
    // Too long: drop leading digits until the remainder is valid.
    for (int i = 1; i + kMinPotentialDigits <= digits.size(); ++i) {
      const string candidate = Format("+%d%s", country->prefix, digits.substr(i));
      const size_t before = suggestions.size();
      AddSuggestion(candidate, &suggestions);
      if (suggestions.size() != before) {
        break;
      }
    }
  }

  if (country && digits.size() < kMinSuggestionDigits) {
    // Too short: try each possible missing leading digit.
    for (char c = '0'; c <= '9'; ++c) {
      AddSuggestion(Format("+%d%c%s", country->prefix, c, digits),
                    &suggestions);
    }
  }

  std::sort(suggestions.begin(), suggestions.end());
  suggestions.erase(std::unique(suggestions.begin(), suggestions.end()),
                    suggestions.end());
  if (suggestions.size() > kMaxSuggestions) {
    suggestions.resize(kMaxSuggestions);
  }
  return suggestions;
}

vector<bool> ValidatePhoneNumbers(const vector<string>& numbers) {
  vector<bool> results;
  results.reserve(numbers.size());
  for (int i = 0; i < numbers.size(); ++i) {
    results.push_back(IsValidPhoneNumber(numbers[i]));
  }
  return results;
}

vector<string> NormalizePhoneNumbers(const vector<string>& numbers) {
  vector<string> results;
  results.reserve(numbers.size());
  for (int i = 0; i < numbers.size(); ++i) {
    results.push_back(NormalizedPhoneNumber(numbers[i]));
  }
  return results;
}

vector<const CountryRule*> ExtractCountries(const vector<string>& numbers) {
  vector<const CountryRule*> results;
  results.reserve(numbers.size());
  for (int i = 0; i < numbers.size(); ++i) {
    results.push_back(ExtractCountry(numbers[i]));
  }
  return results;
}
