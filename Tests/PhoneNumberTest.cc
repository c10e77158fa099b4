// Copyright 2013 Viewfinder. All rights reserved.

#ifdef TESTING

#include <unordered_set>
#include "PhoneNumber.h"
#include "StringUtils.h"
#include "Testing.h"

namespace {

string JoinGroups(const vector<vector<string> >& groups) {
  vector<string> parts;
  for (int i = 0; i < groups.size(); ++i) {
    parts.push_back("[" + Join(groups[i], "|") + "]");
  }
  return Join(parts, " ");
}

TEST(PhoneNumberTest, Parse) {
  PhoneNumber n;
  ASSERT(PhoneNumber::Parse("+44 7911 123456", &n));
  EXPECT_EQ("+44 7911 123456", n.original());
  EXPECT_EQ("+447911123456", n.e164());
  ASSERT(n.country() != NULL);
  EXPECT_EQ(string("GB"), n.country()->code);
  EXPECT_EQ(44, n.country_code());
  EXPECT_EQ("7911123456", n.national_number());
  EXPECT_EQ(MOBILE, n.type());
  EXPECT(n.is_mobile());
  EXPECT(!n.is_landline());
  EXPECT(!n.is_toll_free());
  EXPECT_EQ("+44 7911 123 456", n.Format(PHONE_FORMAT_INTERNATIONAL));
  EXPECT_EQ("tel:+44-791-112-345-6", n.Format(PHONE_FORMAT_RFC3966));
  EXPECT_EQ("+447911123456", ToString(n));
}

TEST(PhoneNumberTest, ParseInvalid) {
  PhoneNumber n;
  EXPECT(!PhoneNumber::Parse("invalid", &n));
  EXPECT(!PhoneNumber::Parse("", &n));
  EXPECT_EQ("", n.e164());
  EXPECT(n.country() == NULL);
  EXPECT_EQ(0, n.country_code());
  EXPECT_EQ(UNKNOWN, n.type());
}

TEST(PhoneNumberTest, ParseWithCountry) {
  PhoneNumber n;
  ASSERT(PhoneNumber::ParseWithCountry("0645342545", "FR", &n));
  EXPECT_EQ("0645342545", n.original());
  EXPECT_EQ("+33645342545", n.e164());
  EXPECT_EQ(33, n.country_code());
  EXPECT(n.is_mobile());

  // Numbers that are valid on their own ignore the country.
  ASSERT(PhoneNumber::ParseWithCountry("+12025550173", "FR", &n));
  EXPECT_EQ("+12025550173", n.e164());
  EXPECT(n.is_landline());

  EXPECT(!PhoneNumber::ParseWithCountry("0645342545", "XX", &n));
  EXPECT(!PhoneNumber::ParseWithCountry("12", "FR", &n));
}

TEST(PhoneNumberTest, Equality) {
  PhoneNumber a;
  PhoneNumber b;
  PhoneNumber c;
  ASSERT(PhoneNumber::Parse("+12025550173", &a));
  ASSERT(PhoneNumber::Parse("1 (202) 555-0173", &b));
  ASSERT(PhoneNumber::Parse("+18005550173", &c));
  EXPECT(a == b);
  EXPECT(b == a);
  EXPECT(a != c);
  EXPECT(a < c);
  EXPECT(!(c < a));
  EXPECT_EQ(std::hash<PhoneNumber>()(a), std::hash<PhoneNumber>()(b));

  std::unordered_set<PhoneNumber> set;
  set.insert(a);
  set.insert(b);
  set.insert(c);
  EXPECT_EQ(2, set.size());
}

TEST(PhoneNumberTest, Set) {
  PhoneNumberSet set;
  EXPECT(set.empty());
  EXPECT(set.Add("+12025550173"));
  EXPECT(!set.Add("1 (202) 555-0173"));
  EXPECT(!set.Add("invalid"));
  EXPECT(set.Add("+447911123456"));
  EXPECT_EQ(2, set.size());
  EXPECT(!set.empty());

  EXPECT(set.Contains("12025550173"));
  EXPECT(set.Contains("+44 7911 123456"));
  EXPECT(!set.Contains("+18005550173"));
  EXPECT(!set.Contains("invalid"));

  const PhoneNumber* n = set.Find("12025550173");
  ASSERT(n != NULL);
  // The first spelling added is kept.
  EXPECT_EQ("+12025550173", n->original());
  EXPECT(set.Find("+18005550173") == NULL);

  EXPECT_EQ("+12025550173,+447911123456", Join(set.NormalizedNumbers(), ","));

  vector<string> iterated;
  for (PhoneNumberSet::const_iterator iter(set.begin());
       iter != set.end();
       ++iter) {
    iterated.push_back(iter->second.e164());
  }
  EXPECT_EQ("+12025550173,+447911123456", Join(iterated, ","));

  EXPECT(set.Remove("+1-202-555-0173"));
  EXPECT(!set.Remove("+1-202-555-0173"));
  EXPECT(!set.Remove("invalid"));
  EXPECT_EQ(1, set.size());
}

TEST(PhoneNumberTest, SetFromVector) {
  vector<string> numbers;
  numbers.push_back("+447911123456");
  numbers.push_back("+12025550173");
  numbers.push_back("invalid");
  numbers.push_back("12025550173");
  PhoneNumberSet set(numbers);
  EXPECT_EQ(2, set.size());
  EXPECT_EQ("+12025550173,+447911123456", Join(set.NormalizedNumbers(), ","));
}

TEST(PhoneNumberTest, GroupEquivalent) {
  vector<string> numbers;
  numbers.push_back("+12025550173");
  numbers.push_back("invalid");
  numbers.push_back("+447911123456");
  numbers.push_back("1 (202) 555-0173");
  numbers.push_back("invalid");
  numbers.push_back("+44 7911 123456");
  EXPECT_EQ("[+12025550173|1 (202) 555-0173] [invalid] "
            "[+447911123456|+44 7911 123456] [invalid]",
            JoinGroups(GroupEquivalentPhoneNumbers(numbers)));
  EXPECT_EQ("", JoinGroups(GroupEquivalentPhoneNumbers(vector<string>())));
}

TEST(PhoneNumberTest, Analyze) {
  vector<string> numbers;
  numbers.push_back("+1 (800) 555-0173");
  numbers.push_back("invalid");
  numbers.push_back("+1.202.555.0173");
  const vector<PhoneNumberAnalysis> results = AnalyzePhoneNumbers(numbers);
  ASSERT_EQ(3, results.size());

  EXPECT_EQ("+1 (800) 555-0173", results[0].original);
  EXPECT(results[0].is_valid);
  EXPECT_EQ("+18005550173", results[0].normalized);
  ASSERT(results[0].country != NULL);
  EXPECT_EQ(string("US"), results[0].country->code);
  EXPECT(results[0].has_type);
  EXPECT_EQ(TOLL_FREE, results[0].type);

  EXPECT_EQ("invalid", results[1].original);
  EXPECT(!results[1].is_valid);
  EXPECT_EQ("", results[1].normalized);
  EXPECT(results[1].country == NULL);
  EXPECT(!results[1].has_type);

  // The country is found from the digits even though the formatting makes
  // the number invalid.
  EXPECT(!results[2].is_valid);
  ASSERT(results[2].country != NULL);
  EXPECT_EQ(string("US"), results[2].country->code);
  EXPECT(!results[2].has_type);
}

}  // namespace

#endif  // TESTING
