// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_COUNTRY_TABLE_H
#define PHONELIB_COUNTRY_TABLE_H

#include "Utils.h"

// A single country dialing rule. Several rules may share a prefix (the
// NANP countries share 1, Russia and Kazakhstan share 7); the order of the
// rules in the table decides which one wins.
struct CountryRule {
  const char* name;
  // ISO 3166-1 alpha-2 code, or a sub-national code such as "GB-CYM".
  const char* code;
  // Dialing prefix, 1 to 3 decimal digits.
  int prefix;
  // The accepted national number lengths, in digits.
  const int* lengths;
  int num_lengths;

  bool AcceptsLength(int n) const;
};

ostream& operator<<(ostream& os, const CountryRule& rule);

// Returns the number of decimal digits in 'n'. CountDigits(0) == 1.
int CountDigits(int n);

// The process-wide, read-only country table in match order.
const CountryRule* CountryTable();
int CountryTableSize();

// Returns the first rule with the specified code, or NULL if the code is
// unknown. Codes are matched exactly ("us" is not "US").
const CountryRule* FindCountryByCode(const Slice& code);

// Returns every rule with the specified dialing prefix, in table order.
vector<const CountryRule*> FindCountriesByPrefix(int prefix);

#endif  // PHONELIB_COUNTRY_TABLE_H
