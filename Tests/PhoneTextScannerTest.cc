// Copyright 2013 Viewfinder. All rights reserved.

#ifdef TESTING

#include "PhoneTextScanner.h"
#include "PhoneUtils.h"
#include "StringUtils.h"
#include "Testing.h"

namespace {

// Returns a compact description of the candidates found in 'text':
// "raw=normalized" for each, with "!" in place of the normalized form for
// invalid candidates.
string Extract(const string& text) {
  vector<ExtractedPhoneNumber> numbers;
  ExtractPhoneNumbers(text, &numbers);
  vector<string> parts;
  for (int i = 0; i < numbers.size(); ++i) {
    const ExtractedPhoneNumber& n = numbers[i];
    parts.push_back(n.raw + "=" + (n.is_valid ? n.normalized : "!"));
  }
  return Join(parts, " ");
}

string ExtractWithHint(const string& text, const string& code) {
  vector<ExtractedPhoneNumber> numbers;
  ExtractPhoneNumbersWithCountryHint(text, code, &numbers);
  vector<string> parts;
  for (int i = 0; i < numbers.size(); ++i) {
    const ExtractedPhoneNumber& n = numbers[i];
    parts.push_back(n.raw + "=" + (n.is_valid ? n.normalized : "!"));
  }
  return Join(parts, " ");
}

TEST(PhoneTextScannerTest, Extract) {
  const string text = "Call me at +12025550173 or +442079460958";
  vector<ExtractedPhoneNumber> numbers;
  ExtractPhoneNumbers(text, &numbers);
  ASSERT_EQ(2, numbers.size());
  EXPECT_EQ("+12025550173", numbers[0].raw);
  EXPECT_EQ("+12025550173", numbers[0].normalized);
  EXPECT_EQ(11, numbers[0].start);
  EXPECT_EQ(23, numbers[0].end);
  EXPECT(numbers[0].is_valid);
  EXPECT_EQ("+442079460958", numbers[1].raw);
  EXPECT_EQ(27, numbers[1].start);
  EXPECT_EQ(40, numbers[1].end);
  EXPECT(numbers[1].is_valid);
}

TEST(PhoneTextScannerTest, Formatting) {
  EXPECT_EQ("+1 (202) 555-0173=+12025550173",
            Extract("+1 (202) 555-0173."));
  // A trailing separator is not part of the candidate.
  EXPECT_EQ("+1-202-555-0173=+12025550173", Extract("x +1-202-555-0173- y"));
  EXPECT_EQ("(202) 555-0173=!", Extract("Call (202) 555-0173"));
  // Dots are accepted by the scanner but not by the normalizer.
  EXPECT_EQ("202.555.0173=!", Extract("Phone: 202.555.0173!"));
  // Only single separators between digits are consumed.
  EXPECT_EQ("", Extract("+1 202  555  0173"));
}

TEST(PhoneTextScannerTest, Boundaries) {
  EXPECT_EQ("", Extract(""));
  EXPECT_EQ("", Extract("no numbers here 12345"));
  // Digits inside a word do not start a candidate.
  EXPECT_EQ("", Extract("abc12025550173 x"));
  EXPECT_EQ("", Extract("é12025550173"));
  // "मेरा" ends in the vowel sign U+093E, which is still part of the word.
  EXPECT_EQ("", Extract("मेरा12025550173"));
  EXPECT_EQ("12025550173=+12025550173", Extract("मेरा 12025550173"));
  EXPECT_EQ("12025550173=+12025550173", Extract("12025550173"));
  EXPECT_EQ("12025550173=+12025550173", Extract("\n12025550173\n"));
  // A '+' not followed by a digit does not start a candidate but the digits
  // after it do.
  EXPECT_EQ("12025550173=+12025550173", Extract("+ 12025550173"));
}

TEST(PhoneTextScannerTest, MaxDigits) {
  // The scan stops after the 16th digit.
  vector<ExtractedPhoneNumber> numbers;
  ExtractPhoneNumbers("call 1234567890123456789 now", &numbers);
  ASSERT_EQ(1, numbers.size());
  EXPECT_EQ("1234567890123456", numbers[0].raw);
  EXPECT_EQ(5, numbers[0].start);
  EXPECT_EQ(21, numbers[0].end);
  EXPECT(!numbers[0].is_valid);
  EXPECT_EQ("", numbers[0].normalized);
}

TEST(PhoneTextScannerTest, MultiByte) {
  const string text = "Tél: +33 6 45 34 25 45";
  vector<ExtractedPhoneNumber> numbers;
  ExtractPhoneNumbers(text, &numbers);
  ASSERT_EQ(1, numbers.size());
  // "é" is two bytes: the candidate starts at character 5 but byte 6.
  EXPECT_EQ(6, numbers[0].start);
  EXPECT_EQ(text.size(), numbers[0].end);
  EXPECT_EQ(Utf8CharIndexToByteOffset(text, 5), numbers[0].start);
  EXPECT_EQ("+33 6 45 34 25 45", numbers[0].raw);
  EXPECT_EQ("+33645342545", numbers[0].normalized);
  EXPECT_EQ(numbers[0].raw,
            text.substr(numbers[0].start, numbers[0].end - numbers[0].start));

  EXPECT_EQ("+12025550173=+12025550173 +442079460958=+442079460958",
            Extract("☎ +12025550173 ☎ +442079460958 ☎"));
}

TEST(PhoneTextScannerTest, Spans) {
  const string text =
      "a 12025550173, b (202) 555-0173, c +44 20 7946 0958, d 1234567, "
      "日本 +81 3 1234 56789";
  vector<ExtractedPhoneNumber> numbers;
  ExtractPhoneNumbers(text, &numbers);
  ASSERT_EQ(5, numbers.size());
  int last_end = 0;
  for (int i = 0; i < numbers.size(); ++i) {
    const ExtractedPhoneNumber& n = numbers[i];
    EXPECT_LE(last_end, n.start);
    EXPECT_LT(n.start, n.end);
    EXPECT_LE(n.end, text.size());
    EXPECT_EQ(n.raw, text.substr(n.start, n.end - n.start));
    EXPECT_GE(StripNonDigits(n.raw).size(), 7);
    last_end = n.end;
  }
  EXPECT(numbers[0].is_valid);
  EXPECT(!numbers[1].is_valid);
  EXPECT(numbers[2].is_valid);
  EXPECT(!numbers[3].is_valid);
  EXPECT(numbers[4].is_valid);
  EXPECT_EQ("+813123456789", numbers[4].normalized);
  EXPECT_EQ(71, numbers[4].start);
}

TEST(PhoneTextScannerTest, ExtractValid) {
  vector<ExtractedPhoneNumber> numbers;
  ExtractValidPhoneNumbers("Call +12025550173 or 1234567 (invalid)", &numbers);
  ASSERT_EQ(1, numbers.size());
  EXPECT_EQ("+12025550173", numbers[0].normalized);
}

TEST(PhoneTextScannerTest, CountryHint) {
  EXPECT_EQ("0645342545=+33645342545", ExtractWithHint("0645342545", "FR"));
  EXPECT_EQ("(202) 555-0173=+12025550173",
            ExtractWithHint("Call (202) 555-0173", "US"));
  EXPECT_EQ("202.555.0173=+12025550173",
            ExtractWithHint("Phone: 202.555.0173!", "US"));
  EXPECT_EQ("07911 123456=+447911123456",
            ExtractWithHint("mobile: 07911 123456", "GB"));
  // A number with a country prefix is not reinterpreted.
  EXPECT_EQ("+12025550173=+12025550173",
            ExtractWithHint("Call +12025550173", "FR"));
  // Without a '+' the national interpretation wins, but a complete
  // international number still resolves when it does not fit the hint.
  EXPECT_EQ("12025550173=+12025550173",
            ExtractWithHint("Call 12025550173", "US"));
  // An unknown hint is ignored.
  EXPECT_EQ("0645342545=!", ExtractWithHint("0645342545", "XX"));
  EXPECT_EQ("(202) 555-0173=!", ExtractWithHint("Call (202) 555-0173", ""));
}

TEST(PhoneTextScannerTest, Count) {
  EXPECT_EQ(0, CountPhoneNumbers(""));
  EXPECT_EQ(2, CountPhoneNumbers("Call me at +12025550173 or +442079460958"));
  // Invalid candidates are counted too.
  EXPECT_EQ(1, CountPhoneNumbers("Call (202) 555-0173"));
}

TEST(PhoneTextScannerTest, Replace) {
  EXPECT_EQ("Call me at [REDACTED]",
            ReplacePhoneNumbers("Call me at +12025550173",
                                [](const ExtractedPhoneNumber&) {
                                  return string("[REDACTED]");
                                }));
  EXPECT_EQ("a <+12025550173> b <!> c",
            ReplacePhoneNumbers("a +1 (202) 555-0173 b 1234567 c",
                                [](const ExtractedPhoneNumber& n) -> string {
                                  const string s = n.is_valid ? n.normalized : "!";
                                  return "<" + s + ">";
                                }));
  EXPECT_EQ("nothing ☎ here",
            ReplacePhoneNumbers("nothing ☎ here",
                                [](const ExtractedPhoneNumber&) {
                                  return string("X");
                                }));
}

TEST(PhoneTextScannerTest, Redact) {
  EXPECT_EQ("Call *******0173", RedactPhoneNumbers("Call +12025550173", 4));
  EXPECT_EQ("Call [PHONE]", RedactPhoneNumbers("Call +12025550173", 0));
  EXPECT_EQ("Call [PHONE]", RedactPhoneNumbers("Call +12025550173", 11));
  EXPECT_EQ("Call [PHONE]", RedactPhoneNumbers("Call +12025550173", 20));
  EXPECT_EQ("A *********73 B *********58",
            RedactPhoneNumbers("A +1 (202) 555-0173 B 02079460958", 2));
  EXPECT_EQ("Tél: *********45", RedactPhoneNumbers("Tél: +33 6 45 34 25 45", 2));
  EXPECT_EQ("no numbers", RedactPhoneNumbers("no numbers", 4));
}

}  // namespace

#endif  // TESTING
