// Copyright 2013 Viewfinder. All rights reserved.

#include <string.h>
#include "Logging.h"
#include "PhoneNumberType.h"
#include "PhoneUtils.h"

namespace {

bool IsOneOf(const Slice& s, const char* const* values, int count) {
  for (int i = 0; i < count; ++i) {
    if (s == values[i]) {
      return true;
    }
  }
  return false;
}

// North American Numbering Plan. Mobile and fixed line numbers share the
// same ranges, so anything that is not a special service is fixed line.
PhoneNumberType ClassifyNANP(const Slice& national) {
  static const char* const kTollFree[] = {
    "800", "833", "844", "855", "866", "877", "888",
  };
  static const char* const kPremiumRate[] = { "900", "976" };
  const Slice first3 = national.substr(0, 3);
  if (IsOneOf(first3, kTollFree, ARRAYSIZE(kTollFree))) {
    return TOLL_FREE;
  }
  if (IsOneOf(first3, kPremiumRate, ARRAYSIZE(kPremiumRate))) {
    return PREMIUM_RATE;
  }
  return national.size() == 10 ? FIXED_LINE : UNKNOWN;
}

// The UK ranges are written in their domestic form, with the trunk zero.
PhoneNumberType ClassifyGB(const Slice& national) {
  const string domestic =
      national.starts_with("0") ? national.as_string() : "0" + national.as_string();
  const Slice d(domestic);
  if (d.starts_with("07")) {
    return MOBILE;
  }
  if (d.starts_with("08")) {
    if (d.starts_with("080") || d.starts_with("084") || d.starts_with("087")) {
      return TOLL_FREE;
    }
    if (d.starts_with("081") || d.starts_with("082") || d.starts_with("089")) {
      return PREMIUM_RATE;
    }
    return SHARED_COST;
  }
  if (d.starts_with("01") || d.starts_with("02")) {
    return FIXED_LINE;
  }
  if (d.starts_with("03")) {
    return UAN;
  }
  if (d.starts_with("05")) {
    return VOIP;
  }
  return UNKNOWN;
}

PhoneNumberType ClassifyDE(const Slice& national) {
  switch (national[0]) {
    case '1':
      if (national.size() < 2) {
        return UNKNOWN;
      }
      switch (national[1]) {
        case '5':
        case '6':
        case '7':
          return MOBILE;
        case '8':
          return SHARED_COST;
        case '9':
          return PREMIUM_RATE;
        default:
          return UNKNOWN;
      }
    case '0':
      return TOLL_FREE;
    default:
      return FIXED_LINE;
  }
}

PhoneNumberType ClassifyFR(const Slice& national) {
  switch (national[0]) {
    case '6':
    case '7':
      return MOBILE;
    case '8':
      return TOLL_FREE;
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '9':
      return FIXED_LINE;
    default:
      return UNKNOWN;
  }
}

PhoneNumberType ClassifyAU(const Slice& national) {
  switch (national[0]) {
    case '4':
      return MOBILE;
    case '1':
      if (national.starts_with("180") || national.starts_with("188")) {
        return TOLL_FREE;
      }
      if (national.starts_with("190")) {
        return PREMIUM_RATE;
      }
      return UNKNOWN;
    case '2':
    case '3':
    case '7':
    case '8':
      return FIXED_LINE;
    default:
      return UNKNOWN;
  }
}

PhoneNumberType ClassifyIN(const Slice& national) {
  const char c = national[0];
  if (c >= '6' && c <= '9') {
    return MOBILE;
  }
  if (c >= '1' && c <= '5') {
    return FIXED_LINE;
  }
  return UNKNOWN;
}

// Best effort guess for countries without a dedicated table.
PhoneNumberType ClassifyGeneric(const Slice& national) {
  const char c = national[0];
  if (c >= '6' && c <= '9') {
    return MOBILE;
  }
  if (c >= '1' && c <= '5') {
    return FIXED_LINE;
  }
  if (c == '0') {
    return TOLL_FREE;
  }
  return UNKNOWN;
}

bool DetectedTypeIs(const Slice& raw, PhoneNumberType expected) {
  PhoneNumberType type;
  return DetectPhoneNumberType(raw, &type) && type == expected;
}

}  // namespace

const char* PhoneNumberTypeName(PhoneNumberType type) {
  switch (type) {
    case MOBILE:
      return "mobile";
    case FIXED_LINE:
      return "fixed line";
    case TOLL_FREE:
      return "toll free";
    case PREMIUM_RATE:
      return "premium rate";
    case SHARED_COST:
      return "shared cost";
    case VOIP:
      return "voip";
    case PERSONAL_NUMBER:
      return "personal number";
    case PAGER:
      return "pager";
    case UAN:
      return "uan";
    case EMERGENCY:
      return "emergency";
    case VOICEMAIL:
      return "voicemail";
    case UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

PhoneNumberType ClassifyNationalNumber(
    const Slice& national, const CountryRule& rule) {
  if (national.empty()) {
    return UNKNOWN;
  }
  if (!strcmp(rule.code, "US") || !strcmp(rule.code, "CA")) {
    return ClassifyNANP(national);
  }
  if (!strcmp(rule.code, "GB")) {
    return ClassifyGB(national);
  }
  if (!strcmp(rule.code, "DE")) {
    return ClassifyDE(national);
  }
  if (!strcmp(rule.code, "FR")) {
    return ClassifyFR(national);
  }
  if (!strcmp(rule.code, "AU")) {
    return ClassifyAU(national);
  }
  if (!strcmp(rule.code, "IN")) {
    return ClassifyIN(national);
  }
  return ClassifyGeneric(national);
}

bool DetectPhoneNumberType(const Slice& raw, PhoneNumberType* type) {
  const CountryRule* rule = NULL;
  string national;
  const PhoneNumberError error = ParsePhoneDigits(raw, &rule, &national);
  if (error != PHONE_OK) {
    VLOG("phone: unable to classify \"%s\": %s",
         raw, PhoneNumberErrorName(error));
    return false;
  }
  *type = ClassifyNationalNumber(national, *rule);
  return true;
}

bool IsMobileNumber(const Slice& raw) {
  return DetectedTypeIs(raw, MOBILE);
}

bool IsLandlineNumber(const Slice& raw) {
  return DetectedTypeIs(raw, FIXED_LINE);
}

bool IsTollFreeNumber(const Slice& raw) {
  return DetectedTypeIs(raw, TOLL_FREE);
}

vector<pair<bool, PhoneNumberType> > DetectPhoneNumberTypes(
    const vector<string>& numbers) {
  vector<pair<bool, PhoneNumberType> > results;
  results.reserve(numbers.size());
  for (int i = 0; i < numbers.size(); ++i) {
    PhoneNumberType type = UNKNOWN;
    const bool ok = DetectPhoneNumberType(numbers[i], &type);
    results.push_back(std::make_pair(ok, type));
  }
  return results;
}
