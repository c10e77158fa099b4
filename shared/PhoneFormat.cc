// Copyright 2013 Viewfinder. All rights reserved.

#include <string.h>
#include "Logging.h"
#include "PhoneFormat.h"
#include "PhoneUtils.h"
#include "StringUtils.h"

namespace {

const int kMinSplitDigits = 7;
const int kRFC3966GroupSize = 3;

struct StyleName {
  PhoneFormatStyle style;
  const char* name;
};

const StyleName kStyleNames[] = {
  { PHONE_FORMAT_E164, "e164" },
  { PHONE_FORMAT_INTERNATIONAL, "international" },
  { PHONE_FORMAT_NATIONAL, "national" },
  { PHONE_FORMAT_RFC3966, "rfc3966" },
};

string RFC3966Groups(const Slice& national) {
  vector<string> groups;
  for (int i = 0; i < national.size(); i += kRFC3966GroupSize) {
    groups.push_back(national.substr(i, kRFC3966GroupSize).as_string());
  }
  return Join(groups, "-");
}

}  // namespace

const char* PhoneFormatStyleName(PhoneFormatStyle style) {
  for (int i = 0; i < ARRAYSIZE(kStyleNames); ++i) {
    if (kStyleNames[i].style == style) {
      return kStyleNames[i].name;
    }
  }
  return "unknown";
}

bool ParsePhoneFormatStyle(const Slice& name, PhoneFormatStyle* style) {
  for (int i = 0; i < ARRAYSIZE(kStyleNames); ++i) {
    if (name == kStyleNames[i].name) {
      *style = kStyleNames[i].style;
      return true;
    }
  }
  return false;
}

string FormatNationalNumber(const Slice& national, const CountryRule& rule) {
  const int n = national.size();
  if (!strcmp(rule.code, "US") || !strcmp(rule.code, "CA")) {
    if (n == 10) {
      return Format("(%s) %s-%s", national.substr(0, 3),
                    national.substr(3, 3), national.substr(6));
    }
  } else if (!strcmp(rule.code, "GB")) {
    if (n >= 10) {
      return Format("%s %s %s", national.substr(0, 4),
                    national.substr(4, 3), national.substr(7));
    }
  } else if (!strcmp(rule.code, "DE")) {
    if (n >= 10) {
      return Format("%s %s", national.substr(0, 3), national.substr(3));
    }
  } else if (n >= kMinSplitDigits) {
    const int mid = n / 2;
    return Format("%s %s", national.substr(0, mid), national.substr(mid));
  }
  return national.as_string();
}

string FormatPhoneNumber(
    const CountryRule& rule, const Slice& national, PhoneFormatStyle style) {
  switch (style) {
    case PHONE_FORMAT_E164:
      return Format("+%d%s", rule.prefix, national);
    case PHONE_FORMAT_INTERNATIONAL:
      return Format("+%d %s", rule.prefix,
                    FormatNationalNumber(national, rule));
    case PHONE_FORMAT_NATIONAL:
      return FormatNationalNumber(national, rule);
    case PHONE_FORMAT_RFC3966:
      return Format("tel:+%d-%s", rule.prefix, RFC3966Groups(national));
  }
  DIE("unknown phone format style: %d", style);
  return string();
}

bool FormatPhoneNumber(
    const Slice& raw, PhoneFormatStyle style, string* formatted) {
  const CountryRule* rule = NULL;
  string national;
  const PhoneNumberError error = ParsePhoneDigits(raw, &rule, &national);
  if (error != PHONE_OK) {
    VLOG("phone: unable to format \"%s\": %s",
         raw, PhoneNumberErrorName(error));
    return false;
  }
  *formatted = FormatPhoneNumber(*rule, national, style);
  return true;
}
