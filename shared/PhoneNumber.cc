// Copyright 2013 Viewfinder. All rights reserved.

#include <unordered_map>
#include "Logging.h"
#include "PhoneNumber.h"
#include "PhoneUtils.h"

PhoneNumber::PhoneNumber()
    : country_(NULL),
      type_(UNKNOWN) {
}

bool PhoneNumber::Parse(const Slice& raw, PhoneNumber* number) {
  const CountryRule* rule = NULL;
  string national;
  if (ParsePhoneDigits(raw, &rule, &national) != PHONE_OK) {
    return false;
  }
  number->Init(raw, rule, national);
  return true;
}

bool PhoneNumber::ParseWithCountry(
    const Slice& raw, const Slice& code, PhoneNumber* number) {
  if (Parse(raw, number)) {
    return true;
  }
  const CountryRule* rule = NULL;
  string national;
  const PhoneNumberError error =
      ParsePhoneDigitsForCountry(raw, code, &rule, &national);
  if (error != PHONE_OK) {
    VLOG("phone: unable to parse \"%s\" for %s: %s",
         raw, code, PhoneNumberErrorName(error));
    return false;
  }
  number->Init(raw, rule, national);
  return true;
}

void PhoneNumber::Init(
    const Slice& raw, const CountryRule* rule, const string& national) {
  original_ = raw.as_string();
  national_ = national;
  country_ = rule;
  e164_ = FormatPhoneNumber(*rule, national, PHONE_FORMAT_E164);
  type_ = ClassifyNationalNumber(national, *rule);
}

string PhoneNumber::Format(PhoneFormatStyle style) const {
  if (!country_) {
    return e164_;
  }
  return FormatPhoneNumber(*country_, national_, style);
}

PhoneNumberSet::PhoneNumberSet(const vector<string>& numbers) {
  for (int i = 0; i < numbers.size(); ++i) {
    Add(numbers[i]);
  }
}

bool PhoneNumberSet::Add(const Slice& raw) {
  PhoneNumber number;
  if (!PhoneNumber::Parse(raw, &number)) {
    return false;
  }
  return numbers_.insert(std::make_pair(number.e164(), number)).second;
}

bool PhoneNumberSet::Contains(const Slice& raw) const {
  return Find(raw) != NULL;
}

bool PhoneNumberSet::Remove(const Slice& raw) {
  string normalized;
  if (!NormalizePhoneNumber(raw, &normalized)) {
    return false;
  }
  return numbers_.erase(normalized) > 0;
}

const PhoneNumber* PhoneNumberSet::Find(const Slice& raw) const {
  string normalized;
  if (!NormalizePhoneNumber(raw, &normalized)) {
    return NULL;
  }
  const_iterator iter = numbers_.find(normalized);
  if (iter == numbers_.end()) {
    return NULL;
  }
  return &iter->second;
}

vector<string> PhoneNumberSet::NormalizedNumbers() const {
  vector<string> result;
  result.reserve(numbers_.size());
  for (const_iterator iter(numbers_.begin()); iter != numbers_.end(); ++iter) {
    result.push_back(iter->first);
  }
  return result;
}

vector<vector<string> > GroupEquivalentPhoneNumbers(
    const vector<string>& numbers) {
  const vector<string> normalized = NormalizePhoneNumbers(numbers);
  std::unordered_map<string, int> group_index;
  vector<vector<string> > groups;
  for (int i = 0; i < numbers.size(); ++i) {
    if (!normalized[i].empty()) {
      std::unordered_map<string, int>::iterator iter =
          group_index.find(normalized[i]);
      if (iter != group_index.end()) {
        groups[iter->second].push_back(numbers[i]);
        continue;
      }
      group_index[normalized[i]] = groups.size();
    }
    groups.push_back(vector<string>(1, numbers[i]));
  }
  return groups;
}

vector<PhoneNumberAnalysis> AnalyzePhoneNumbers(const vector<string>& numbers) {
  vector<PhoneNumberAnalysis> results(numbers.size());
  for (int i = 0; i < numbers.size(); ++i) {
    PhoneNumberAnalysis* a = &results[i];
    a->original = numbers[i];
    a->is_valid = NormalizePhoneNumber(numbers[i], &a->normalized);
    a->country = ExtractCountry(numbers[i]);
    a->has_type = DetectPhoneNumberType(numbers[i], &a->type);
  }
  return results;
}
