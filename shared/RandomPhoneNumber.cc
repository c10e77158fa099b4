// Copyright 2013 Viewfinder. All rights reserved.

#include "CountryTable.h"
#include "Logging.h"
#include "RandomPhoneNumber.h"

bool GenerateRandomPhoneNumber(
    const Slice& code, Random* rand, string* number) {
  const CountryRule* rule = FindCountryByCode(code);
  if (!rule) {
    VLOG("random: unknown country code: %s", code);
    return false;
  }
  DCHECK_GT(rule->num_lengths, 0);
  string national = rand->Digits(rule->lengths[0]);
  // Keep the national number from looking like it has a trunk prefix. The UK
  // is left alone.
  if (national[0] == '0' && code != "GB") {
    national[0] = '1';
  }
  *number = Format("+%d%s", rule->prefix, national);
  return true;
}

vector<string> GenerateRandomPhoneNumbers(
    const Slice& code, int count, Random* rand) {
  vector<string> numbers;
  string number;
  for (int i = 0; i < count; ++i) {
    if (!GenerateRandomPhoneNumber(code, rand, &number)) {
      break;
    }
    numbers.push_back(number);
  }
  return numbers;
}
