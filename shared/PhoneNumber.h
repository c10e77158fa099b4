// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_PHONE_NUMBER_H
#define PHONELIB_PHONE_NUMBER_H

#include <map>
#include "CountryTable.h"
#include "PhoneFormat.h"
#include "PhoneNumberType.h"
#include "Utils.h"

// A validated phone number. Two PhoneNumbers are equal if they have the same
// E.164 form, regardless of how they were originally written.
class PhoneNumber {
 public:
  PhoneNumber();

  // Parses 'raw' into '*number'. Returns false if 'raw' is not a valid phone
  // number, in which case '*number' is untouched.
  static bool Parse(const Slice& raw, PhoneNumber* number);
  // Like Parse(), but if 'raw' is not valid on its own it is retried as a
  // national number of the country 'code'.
  static bool ParseWithCountry(
      const Slice& raw, const Slice& code, PhoneNumber* number);

  string Format(PhoneFormatStyle style) const;

  bool is_mobile() const { return type_ == MOBILE; }
  bool is_landline() const { return type_ == FIXED_LINE; }
  bool is_toll_free() const { return type_ == TOLL_FREE; }

  // The string this number was parsed from.
  const string& original() const { return original_; }
  const string& e164() const { return e164_; }
  const CountryRule* country() const { return country_; }
  PhoneNumberType type() const { return type_; }
  // The national number, without the country prefix or trunk zeros.
  const string& national_number() const { return national_; }
  // The dialing prefix of the country, or 0 if the number is unset.
  int country_code() const { return country_ ? country_->prefix : 0; }

 private:
  void Init(const Slice& raw, const CountryRule* rule, const string& national);

 private:
  string original_;
  string e164_;
  string national_;
  const CountryRule* country_;
  PhoneNumberType type_;
};

inline bool operator==(const PhoneNumber& a, const PhoneNumber& b) {
  return a.e164() == b.e164();
}

inline bool operator!=(const PhoneNumber& a, const PhoneNumber& b) {
  return !(a == b);
}

inline bool operator<(const PhoneNumber& a, const PhoneNumber& b) {
  return a.e164() < b.e164();
}

inline ostream& operator<<(ostream& os, const PhoneNumber& n) {
  return os << n.e164();
}

namespace std {

template <>
struct hash<PhoneNumber> {
  size_t operator()(const PhoneNumber& n) const {
    return hash<string>()(n.e164());
  }
};

}  // namespace std

// A set of phone numbers, deduplicated by their E.164 form and iterated in
// E.164 order. Not thread-safe.
class PhoneNumberSet {
  typedef std::map<string, PhoneNumber> NumberMap;

 public:
  typedef NumberMap::const_iterator const_iterator;

 public:
  PhoneNumberSet() { }
  // Adds every valid number in 'numbers'.
  explicit PhoneNumberSet(const vector<string>& numbers);

  // Returns false if 'raw' is invalid or already present.
  bool Add(const Slice& raw);
  bool Contains(const Slice& raw) const;
  // Returns false if 'raw' is invalid or not present.
  bool Remove(const Slice& raw);
  // Returns the stored number equal to 'raw', or NULL.
  const PhoneNumber* Find(const Slice& raw) const;

  vector<string> NormalizedNumbers() const;

  int size() const { return numbers_.size(); }
  bool empty() const { return numbers_.empty(); }
  const_iterator begin() const { return numbers_.begin(); }
  const_iterator end() const { return numbers_.end(); }

 private:
  NumberMap numbers_;
};

// Groups 'numbers' by equality. Groups appear in the order their first member
// appears in 'numbers'; each group lists its members in input order. Invalid
// numbers are equal to nothing and each form a group of their own.
vector<vector<string> > GroupEquivalentPhoneNumbers(
    const vector<string>& numbers);

// Everything known about a single input string.
struct PhoneNumberAnalysis {
  PhoneNumberAnalysis()
      : is_valid(false),
        country(NULL),
        has_type(false),
        type(UNKNOWN) {
  }

  string original;
  bool is_valid;
  // Empty if the number is invalid.
  string normalized;
  const CountryRule* country;
  bool has_type;
  PhoneNumberType type;
};

vector<PhoneNumberAnalysis> AnalyzePhoneNumbers(const vector<string>& numbers);

#endif  // PHONELIB_PHONE_NUMBER_H
